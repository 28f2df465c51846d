// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <compview/files/directory_lister.hpp>
#include <compview/review/cell_pattern.hpp>
#include <compview/review/review_settings.hpp>
#include <compview/strings/tstring.hpp>

namespace compview {
namespace review {

extern const char* const NOT_ENOUGH_IMAGES_MESSAGE;
extern const char* const NO_COMMON_PATTERN_MESSAGE;

/**
 * A file to load into a display slot: the index of the cell it belongs to and its path.
 */
struct resolved_slot {
    std::size_t index;
    compview::tstring path;

    resolved_slot()
        : index( 0 ) {}

    resolved_slot( std::size_t index, const compview::tstring& path )
        : index( index )
        , path( path ) {}
};

inline bool operator==( const resolved_slot& lhs, const resolved_slot& rhs ) {
    return lhs.index == rhs.index && lhs.path == rhs.path;
}

/**
 * Everything the viewer remembers about Review Mode between user actions. The viewer owns one of these and passes
 * it to the functions below, which are the only things that change it.
 */
struct review_state {
    bool active;
    compview::tstring directory;             ///< absolute directory holding the comparable sets
    compview::tstring radix;                 ///< radix found by the last successful activation
    std::vector<cell_pattern> cellPatterns;  ///< current cells, possibly edited by hand
    std::vector<compview::tstring> radixes;  ///< radixes found by the last scan, sorted
    std::size_t currentIndex;                ///< index into radixes of the set on display
    boost::optional<std::string> errorMessage;
    review_settings settings;

    review_state()
        : active( false )
        , currentIndex( 0 ) {}
};

/**
 * The radix of the set on display, if the last scan found any.
 */
boost::optional<compview::tstring> current_radix( const review_state& state );

/**
 * Infers the naming convention from the filenames on display, scans their directory for other sets following it,
 * and selects the set the filenames belong to.
 *
 * With fewer than two filenames, or filenames without a common pattern, only state.errorMessage changes.
 *
 * @param state The review state to update.
 * @param directory The directory containing the displayed files.
 * @param displayedFilenames The bare filenames on display, in slot order.
 * @param lister Where directory listings come from.
 * @return The files of the selected set.
 */
std::vector<resolved_slot> activate_review( review_state& state, const compview::tstring& directory,
                                            const std::vector<compview::tstring>& displayedFilenames,
                                            const files::directory_lister& lister );

std::vector<resolved_slot> activate_review( review_state& state, const compview::tstring& directory,
                                            const std::vector<compview::tstring>& displayedFilenames );

/**
 * Builds the cells for hand-edited pattern text. The label and tail of each cell are carried over from the
 * previous cell at the same index, or left empty when there is none.
 */
std::vector<cell_pattern> rebuild_cell_patterns( const std::vector<cell_pattern>& previous,
                                                 const std::vector<compview::tstring>& editedPatterns );

/**
 * Replaces the patterns with hand-edited text and rescans. The set on display stays selected if the new patterns
 * still find it, otherwise the first set is selected. Patterns that do not parse are skipped by the scan.
 */
std::vector<resolved_slot> apply_pattern_edits( review_state& state,
                                                const std::vector<compview::tstring>& editedPatterns,
                                                const files::directory_lister& lister );

std::vector<resolved_slot> apply_pattern_edits( review_state& state,
                                                const std::vector<compview::tstring>& editedPatterns );

/**
 * Moves step sets forward (or backward when negative) through the radix list, wrapping around at both ends.
 * Does not rescan the directory.
 */
std::vector<resolved_slot> navigate_review( review_state& state, int step, const files::directory_lister& lister );

std::vector<resolved_slot> navigate_review( review_state& state, int step );

/**
 * Rescans the directory with the current patterns, keeping the set on display selected when it is still there.
 */
std::vector<resolved_slot> refresh_review( review_state& state, const files::directory_lister& lister );

std::vector<resolved_slot> refresh_review( review_state& state );

// Leaves Review Mode. The settings are kept.
void deactivate_review( review_state& state );

} // namespace review
} // namespace compview
