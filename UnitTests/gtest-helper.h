// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "gtest/gtest.h"

#include <ostream>
#include <vector>

#include <boost/optional.hpp>

#include <compview/review/cell_pattern.hpp>
#include <compview/review/review_state.hpp>
#include <compview/strings/tstring.hpp>

// Checks that the labels of a list of cell patterns are exactly the expected labels, in order.
#define EXPECT_CELL_LABELS_EQ( expected, actual )                                                                      \
    EXPECT_PRED_FORMAT2( ::testing::internal::cmpCellLabelsEQ, expected, actual )

// Checks that the pattern text captures the given radix from filename.
#define EXPECT_CAPTURES_RADIX( pattern, filename, radix )                                                              \
    EXPECT_PRED_FORMAT3( ::testing::internal::capturesRadix, pattern, filename, radix )

// Checks that the pattern text does not match filename.
#define EXPECT_NO_CAPTURE( pattern, filename )                                                                         \
    EXPECT_PRED_FORMAT2( ::testing::internal::capturesNothing, pattern, filename )

namespace compview {
namespace review {
// gtest finds these through argument dependent lookup when printing failed values.
void PrintTo( const cell_pattern& cell, std::ostream* os );
void PrintTo( const resolved_slot& slot, std::ostream* os );
} // namespace review
} // namespace compview

namespace testing {
namespace internal {

AssertionResult cmpCellLabelsEQ( const char* expected_expression, const char* actual_expression,
                                 const std::vector<compview::tstring>& expected,
                                 const std::vector<compview::review::cell_pattern>& actual );

AssertionResult capturesRadix( const char* pattern_expression, const char* filename_expression,
                               const char* radix_expression, const compview::tstring& pattern,
                               const compview::tstring& filename, const compview::tstring& radix );

AssertionResult capturesNothing( const char* pattern_expression, const char* filename_expression,
                                 const compview::tstring& pattern, const compview::tstring& filename );

} // namespace internal
} // namespace testing
