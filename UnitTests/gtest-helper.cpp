// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest-helper.h"

using compview::review::cell_pattern;
using compview::review::compiled_cell_pattern;

namespace compview {
namespace review {

void PrintTo( const cell_pattern& cell, std::ostream* os ) {
    *os << "{ label: \"" << compview::strings::to_string( cell.label ) << "\", tail: \""
        << compview::strings::to_string( cell.tail ) << "\", pattern: \""
        << compview::strings::to_string( cell.pattern ) << "\" }";
}

void PrintTo( const resolved_slot& slot, std::ostream* os ) {
    *os << "(" << slot.index << ", \"" << compview::strings::to_string( slot.path ) << "\")";
}

} // namespace review
} // namespace compview

namespace testing {
namespace internal {

AssertionResult cmpCellLabelsEQ( const char* expected_expression, const char* actual_expression,
                                 const std::vector<compview::tstring>& expected,
                                 const std::vector<cell_pattern>& actual ) {
    if( expected.size() != actual.size() ) {
        return AssertionFailure() << actual_expression << " has " << actual.size() << " cells, but "
                                  << expected_expression << " has " << expected.size() << " labels";
    }

    for( std::size_t i = 0; i < expected.size(); ++i ) {
        if( expected[i] != actual[i].label ) {
            return AssertionFailure() << "cell " << i << " of " << actual_expression << " is labelled \""
                                      << compview::strings::to_string( actual[i].label ) << "\", expected \""
                                      << compview::strings::to_string( expected[i] ) << "\"";
        }
    }

    return AssertionSuccess();
}

AssertionResult capturesRadix( const char* pattern_expression, const char* filename_expression,
                               const char* /*radix_expression*/, const compview::tstring& pattern,
                               const compview::tstring& filename, const compview::tstring& radix ) {
    const compiled_cell_pattern compiled( pattern );
    if( !compiled.is_valid() ) {
        return AssertionFailure() << pattern_expression << " (\"" << compview::strings::to_string( pattern )
                                  << "\") does not compile: " << compiled.get_error();
    }

    const boost::optional<compview::tstring> captured = compiled.capture_radix( filename );
    if( !captured ) {
        return AssertionFailure() << pattern_expression << " (\"" << compview::strings::to_string( pattern )
                                  << "\") does not match " << filename_expression << " (\""
                                  << compview::strings::to_string( filename ) << "\")";
    }

    if( *captured != radix ) {
        return AssertionFailure() << pattern_expression << " captured \"" << compview::strings::to_string( *captured )
                                  << "\" from \"" << compview::strings::to_string( filename ) << "\", expected \""
                                  << compview::strings::to_string( radix ) << "\"";
    }

    return AssertionSuccess();
}

AssertionResult capturesNothing( const char* pattern_expression, const char* filename_expression,
                                 const compview::tstring& pattern, const compview::tstring& filename ) {
    const boost::optional<compview::tstring> captured = compiled_cell_pattern( pattern ).capture_radix( filename );
    if( captured ) {
        return AssertionFailure() << pattern_expression << " (\"" << compview::strings::to_string( pattern )
                                  << "\") unexpectedly captured \"" << compview::strings::to_string( *captured )
                                  << "\" from " << filename_expression;
    }
    return AssertionSuccess();
}

} // namespace internal
} // namespace testing
