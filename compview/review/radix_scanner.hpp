// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <vector>

#include <compview/files/directory_lister.hpp>
#include <compview/review/cell_pattern.hpp>
#include <compview/review/review_settings.hpp>
#include <compview/strings/tstring.hpp>

namespace compview {
namespace review {

/**
 * The number of different cells that must match files with the same radix before scan_radixes() reports it.
 * A single loose pattern such as "^(.*)\.jpg$" matches nearly every file in a directory, so a radix needs a second
 * cell to back it up, unless there is only one cell.
 */
std::size_t required_corroborating_cells( std::size_t numCells, const review_settings& settings = review_settings() );

/**
 * Lists directory once and applies every cell pattern to every entry, collecting the radixes that the patterns
 * capture. A radix is kept when files with that radix matched at least required_corroborating_cells() different
 * cells.
 *
 * Invalid patterns are skipped with a warning. A directory that cannot be listed gives an empty result.
 *
 * @param directory The directory holding the comparable sets.
 * @param cellPatterns The cells of the current review.
 * @param lister Where the directory listing comes from.
 * @param settings Supplies the corroboration cap.
 * @return The radixes found, sorted and without duplicates.
 */
std::vector<compview::tstring> scan_radixes( const compview::tstring& directory,
                                             const std::vector<cell_pattern>& cellPatterns,
                                             const files::directory_lister& lister,
                                             const review_settings& settings = review_settings() );

// Scans the directory on disk.
std::vector<compview::tstring> scan_radixes( const compview::tstring& directory,
                                             const std::vector<cell_pattern>& cellPatterns );

} // namespace review
} // namespace compview
