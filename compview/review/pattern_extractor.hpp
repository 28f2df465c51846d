// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vector>

#include <boost/optional.hpp>

#include <compview/review/cell_pattern.hpp>
#include <compview/review/review_settings.hpp>
#include <compview/strings/tstring.hpp>

namespace compview {
namespace review {

/**
 * The naming convention shared by a set of files viewed together: the radix they all start with, and one cell
 * pattern per file describing what follows the radix.
 */
struct extraction_result {
    compview::tstring radix;
    std::vector<cell_pattern> cellPatterns; ///< one per input filename, in input order
};

/**
 * Byte-wise longest common prefix of all the strings. Empty if strings is empty.
 */
compview::tstring longest_common_prefix( const std::vector<compview::tstring>& strings );

/**
 * Decides where the radix ends given the filenames and their longest common prefix.
 *
 * - If the prefix ends in separators, they belong to every tail, and are trimmed off.
 * - If every filename continues the prefix with a non-separator character, the prefix stops in the middle of a
 *   word ("frame001_v" for "frame001_v1" and "frame001_v2"), so the radix is cut back to before the last
 *   separator in the prefix. Without such a separator there is no radix.
 * - Otherwise some filename has a separator (or ends) right after the prefix, and the prefix is the radix.
 *
 * @return The radix, or none when it would be empty.
 */
boost::optional<compview::tstring> find_radix( const std::vector<compview::tstring>& filenames,
                                               const compview::tstring& commonPrefix,
                                               const review_settings& settings = review_settings() );

/**
 * Turns a tail into a display label: leading separators are dropped, then the extension is removed. A tail that is
 * only an extension (".jpg") is labelled by the extension ("jpg").
 */
compview::tstring derive_cell_label( const compview::tstring& tail,
                                     const review_settings& settings = review_settings() );

/**
 * Infers the naming convention shared by filenames, which are bare filenames in display order.
 *
 * @return none if there are fewer than two filenames, no common prefix, no usable radix, or if two filenames
 *         would produce the same tail.
 */
boost::optional<extraction_result> extract_patterns( const std::vector<compview::tstring>& filenames );

boost::optional<extraction_result> extract_patterns( const std::vector<compview::tstring>& filenames,
                                                     const review_settings& settings );

} // namespace review
} // namespace compview
