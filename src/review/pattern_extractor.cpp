// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/logging/logging_level.hpp>
#include <compview/review/pattern_extractor.hpp>

#include <set>

#include <boost/foreach.hpp>

namespace compview {
namespace review {

compview::tstring longest_common_prefix( const std::vector<compview::tstring>& strings ) {
    if( strings.empty() )
        return compview::tstring();

    const compview::tstring& first = strings[0];
    compview::tstring::size_type length = first.size();
    for( std::size_t i = 1; i < strings.size() && length > 0; ++i ) {
        const compview::tstring& s = strings[i];
        if( s.size() < length )
            length = s.size();
        for( compview::tstring::size_type j = 0; j < length; ++j ) {
            if( first[j] != s[j] ) {
                length = j;
                break;
            }
        }
    }

    return first.substr( 0, length );
}

boost::optional<compview::tstring> find_radix( const std::vector<compview::tstring>& filenames,
                                               const compview::tstring& commonPrefix,
                                               const review_settings& settings ) {
    if( commonPrefix.empty() )
        return boost::none;

    compview::tstring radix;

    if( settings.is_separator( commonPrefix[commonPrefix.size() - 1] ) ) {
        const compview::tstring::size_type lastKept = commonPrefix.find_last_not_of( settings.separators );
        if( lastKept != compview::tstring::npos )
            radix = commonPrefix.substr( 0, lastKept + 1 );
    } else {
        bool allContinueWord = true;
        BOOST_FOREACH( const compview::tstring& filename, filenames ) {
            if( filename.size() <= commonPrefix.size() || settings.is_separator( filename[commonPrefix.size()] ) ) {
                allContinueWord = false;
                break;
            }
        }

        if( allContinueWord ) {
            const compview::tstring::size_type lastSeparator = commonPrefix.find_last_of( settings.separators );
            if( lastSeparator != compview::tstring::npos )
                radix = commonPrefix.substr( 0, lastSeparator );
        } else {
            radix = commonPrefix;
        }
    }

    if( radix.empty() )
        return boost::none;
    return radix;
}

compview::tstring derive_cell_label( const compview::tstring& tail, const review_settings& settings ) {
    const compview::tstring::size_type start = tail.find_first_not_of( settings.separators );
    if( start == compview::tstring::npos )
        return compview::tstring();

    const compview::tstring stripped = tail.substr( start );
    const compview::tstring::size_type dot = stripped.rfind( _T('.') );
    if( dot == compview::tstring::npos )
        return stripped;

    if( dot == 0 )
        return stripped.substr( 1 );
    return stripped.substr( 0, dot );
}

boost::optional<extraction_result> extract_patterns( const std::vector<compview::tstring>& filenames ) {
    return extract_patterns( filenames, review_settings() );
}

boost::optional<extraction_result> extract_patterns( const std::vector<compview::tstring>& filenames,
                                                     const review_settings& settings ) {
    if( filenames.size() < 2 ) {
        COMPVIEW_LOG( debug ) << _T("extract_patterns: need at least 2 filenames, got ") << filenames.size()
                              << std::endl;
        return boost::none;
    }

    const compview::tstring commonPrefix = longest_common_prefix( filenames );
    if( commonPrefix.empty() ) {
        COMPVIEW_LOG( debug ) << _T("extract_patterns: the filenames share no common prefix") << std::endl;
        return boost::none;
    }

    const boost::optional<compview::tstring> radix = find_radix( filenames, commonPrefix, settings );
    if( !radix ) {
        COMPVIEW_LOG( debug ) << _T("extract_patterns: no radix can be cut from the common prefix \"") << commonPrefix
                              << _T("\"") << std::endl;
        return boost::none;
    }

    extraction_result result;
    result.radix = *radix;
    result.cellPatterns.reserve( filenames.size() );

    std::set<compview::tstring> seenTails;
    for( std::size_t i = 0; i < filenames.size(); ++i ) {
        const compview::tstring tail = filenames[i].substr( radix->size() );
        if( !seenTails.insert( tail ).second ) {
            COMPVIEW_LOG( debug ) << _T("extract_patterns: \"") << filenames[i] << _T("\" repeats the tail \"")
                                  << tail << _T("\"") << std::endl;
            return boost::none;
        }

        result.cellPatterns.push_back( cell_pattern( derive_cell_label( tail, settings ), tail,
                                                     make_tail_pattern( tail ) ) );
    }

    COMPVIEW_LOG( debug ) << _T("extract_patterns: radix \"") << result.radix << _T("\" with ")
                          << result.cellPatterns.size() << _T(" cells") << std::endl;
    return result;
}

} // namespace review
} // namespace compview
