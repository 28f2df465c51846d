// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/logging/logging_level.hpp>
#include <compview/review/cell_pattern.hpp>

namespace compview {
namespace review {

namespace {

const compview::tstring PATTERN_SPECIAL_CHARACTERS( _T("\\.+*?()|[]{}^$") );

// '^' and '$' only match at the ends of the filename and '.' never matches a newline, even when the name contains one
const boost::match_flag_type FILENAME_MATCH_FLAGS = boost::match_single_line | boost::match_not_dot_newline;

} // anonymous namespace

compview::tstring escape_pattern_literal( const compview::tstring& text ) {
    compview::tstring result;
    result.reserve( text.size() * 2 );
    for( compview::tstring::size_type i = 0; i < text.size(); ++i ) {
        if( PATTERN_SPECIAL_CHARACTERS.find( text[i] ) != compview::tstring::npos )
            result += _T('\\');
        result += text[i];
    }
    return result;
}

compview::tstring make_tail_pattern( const compview::tstring& tail ) {
    return _T("^(.*)") + escape_pattern_literal( tail ) + _T("$");
}

compiled_cell_pattern::compiled_cell_pattern( const compview::tstring& pattern )
    : m_pattern( pattern )
    , m_valid( false ) {
    if( pattern.empty() ) {
        m_error = "empty pattern";
        return;
    }

    try {
        m_regex.assign( pattern, boost::regex::perl );
        m_valid = true;
    } catch( const boost::regex_error& e ) {
        m_error = e.what();
    }
}

boost::optional<compview::tstring> compiled_cell_pattern::capture_radix( const compview::tstring& filename ) const {
    if( !m_valid )
        return boost::none;

    boost::match_results<compview::tstring::const_iterator> what;
    if( !boost::regex_search( filename, what, m_regex, FILENAME_MATCH_FLAGS ) )
        return boost::none;

    if( what.size() < 2 || !what[1].matched )
        return boost::none;

    return compview::tstring( what[1].first, what[1].second );
}

void compile_cell_patterns( const std::vector<cell_pattern>& cellPatterns,
                            std::vector<compiled_cell_pattern>& outCompiled ) {
    outCompiled.clear();
    outCompiled.reserve( cellPatterns.size() );

    for( std::size_t i = 0; i < cellPatterns.size(); ++i ) {
        outCompiled.push_back( compiled_cell_pattern( cellPatterns[i].pattern ) );

        const compiled_cell_pattern& compiled = outCompiled.back();
        if( !compiled.is_valid() ) {
            COMPVIEW_LOG( warning ) << _T("Invalid pattern for cell ") << i << _T(" '") << compiled.get_pattern()
                                    << _T("': ") << compiled.get_error().c_str() << std::endl;
        }
    }
}

} // namespace review
} // namespace compview
