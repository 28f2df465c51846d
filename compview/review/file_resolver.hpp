// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vector>

#include <boost/optional.hpp>

#include <compview/files/directory_lister.hpp>
#include <compview/review/cell_pattern.hpp>
#include <compview/strings/tstring.hpp>

namespace compview {
namespace review {

/**
 * Finds the file of each cell for one radix, in a single pass over the directory.
 *
 * An entry fills a cell when the cell's pattern captures exactly radix from it. The first such entry in listing
 * order wins and the cell is not looked at again. Cells without a file are left empty, which is not an error: the
 * viewer skips them when loading.
 *
 * @return One path per cell pattern, in the same order. The paths are the directory joined with the entry name.
 *         All empty if the directory cannot be listed.
 */
std::vector<boost::optional<compview::tstring>> resolve_files_for_radix( const compview::tstring& directory,
                                                                          const compview::tstring& radix,
                                                                          const std::vector<cell_pattern>& cellPatterns,
                                                                          const files::directory_lister& lister );

std::vector<boost::optional<compview::tstring>>
resolve_files_for_radix( const compview::tstring& directory, const compview::tstring& radix,
                         const std::vector<cell_pattern>& cellPatterns );

} // namespace review
} // namespace compview
