// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/files/files.hpp>
#include <compview/logging/logging_level.hpp>
#include <compview/review/file_resolver.hpp>
#include <compview/review/pattern_extractor.hpp>
#include <compview/review/radix_scanner.hpp>
#include <compview/review/review_state.hpp>

#include <algorithm>

namespace compview {
namespace review {

const char* const NOT_ENOUGH_IMAGES_MESSAGE = "Need at least 2 images to infer a pattern";
const char* const NO_COMMON_PATTERN_MESSAGE = "No common filename pattern found";

namespace {

std::size_t index_of_radix( const std::vector<compview::tstring>& radixes, const compview::tstring& radix ) {
    std::vector<compview::tstring>::const_iterator it = std::lower_bound( radixes.begin(), radixes.end(), radix );
    if( it != radixes.end() && *it == radix )
        return static_cast<std::size_t>( it - radixes.begin() );
    return 0;
}

std::vector<resolved_slot> load_current_set( const review_state& state, const files::directory_lister& lister ) {
    std::vector<resolved_slot> slots;

    const boost::optional<compview::tstring> radix = current_radix( state );
    if( !radix )
        return slots;

    const std::vector<boost::optional<compview::tstring>> paths =
        resolve_files_for_radix( state.directory, *radix, state.cellPatterns, lister );
    for( std::size_t i = 0; i < paths.size(); ++i ) {
        if( paths[i] )
            slots.push_back( resolved_slot( i, *paths[i] ) );
    }

    return slots;
}

// Rescans and selects selectedRadix in the new list, or the first set if it is gone.
void rescan( review_state& state, const compview::tstring& selectedRadix, const files::directory_lister& lister ) {
    state.radixes = scan_radixes( state.directory, state.cellPatterns, lister, state.settings );
    state.currentIndex = index_of_radix( state.radixes, selectedRadix );
}

} // anonymous namespace

boost::optional<compview::tstring> current_radix( const review_state& state ) {
    if( state.currentIndex < state.radixes.size() )
        return state.radixes[state.currentIndex];
    return boost::none;
}

std::vector<resolved_slot> activate_review( review_state& state, const compview::tstring& directory,
                                            const std::vector<compview::tstring>& displayedFilenames,
                                            const files::directory_lister& lister ) {
    if( displayedFilenames.size() < 2 ) {
        state.errorMessage = std::string( NOT_ENOUGH_IMAGES_MESSAGE );
        return std::vector<resolved_slot>();
    }

    const boost::optional<extraction_result> extraction = extract_patterns( displayedFilenames, state.settings );
    if( !extraction ) {
        state.errorMessage = std::string( NO_COMMON_PATTERN_MESSAGE );
        return std::vector<resolved_slot>();
    }

    state.active = true;
    state.errorMessage = boost::none;
    state.directory = files::make_absolute_path( directory );
    state.radix = extraction->radix;
    state.cellPatterns = extraction->cellPatterns;
    rescan( state, extraction->radix, lister );

    COMPVIEW_LOG( debug ) << _T("activate_review: radix \"") << state.radix << _T("\", ")
                          << state.cellPatterns.size() << _T(" cells, ") << state.radixes.size()
                          << _T(" sets in \"") << state.directory << _T("\"") << std::endl;

    return load_current_set( state, lister );
}

std::vector<resolved_slot> activate_review( review_state& state, const compview::tstring& directory,
                                            const std::vector<compview::tstring>& displayedFilenames ) {
    return activate_review( state, directory, displayedFilenames, files::default_directory_lister() );
}

std::vector<cell_pattern> rebuild_cell_patterns( const std::vector<cell_pattern>& previous,
                                                 const std::vector<compview::tstring>& editedPatterns ) {
    std::vector<cell_pattern> result;
    result.reserve( editedPatterns.size() );

    for( std::size_t i = 0; i < editedPatterns.size(); ++i ) {
        if( i < previous.size() )
            result.push_back( cell_pattern( previous[i].label, previous[i].tail, editedPatterns[i] ) );
        else
            result.push_back( cell_pattern( compview::tstring(), compview::tstring(), editedPatterns[i] ) );
    }

    return result;
}

std::vector<resolved_slot> apply_pattern_edits( review_state& state,
                                                const std::vector<compview::tstring>& editedPatterns,
                                                const files::directory_lister& lister ) {
    if( !state.active ) {
        COMPVIEW_LOG( debug ) << _T("apply_pattern_edits: review mode is not active") << std::endl;
        return std::vector<resolved_slot>();
    }

    const compview::tstring selected = current_radix( state ).get_value_or( state.radix );

    state.cellPatterns = rebuild_cell_patterns( state.cellPatterns, editedPatterns );
    rescan( state, selected, lister );

    return load_current_set( state, lister );
}

std::vector<resolved_slot> apply_pattern_edits( review_state& state,
                                                const std::vector<compview::tstring>& editedPatterns ) {
    return apply_pattern_edits( state, editedPatterns, files::default_directory_lister() );
}

std::vector<resolved_slot> navigate_review( review_state& state, int step, const files::directory_lister& lister ) {
    if( !state.active || state.radixes.empty() )
        return std::vector<resolved_slot>();

    const long long count = static_cast<long long>( state.radixes.size() );
    long long index = ( static_cast<long long>( state.currentIndex ) + step ) % count;
    if( index < 0 )
        index += count;
    state.currentIndex = static_cast<std::size_t>( index );

    COMPVIEW_LOG( debug ) << _T("navigate_review: set ") << state.currentIndex + 1 << _T(" of ") << count << _T(" \"")
                          << state.radixes[state.currentIndex] << _T("\"") << std::endl;

    return load_current_set( state, lister );
}

std::vector<resolved_slot> navigate_review( review_state& state, int step ) {
    return navigate_review( state, step, files::default_directory_lister() );
}

std::vector<resolved_slot> refresh_review( review_state& state, const files::directory_lister& lister ) {
    if( !state.active )
        return std::vector<resolved_slot>();

    const compview::tstring selected = current_radix( state ).get_value_or( state.radix );
    rescan( state, selected, lister );

    return load_current_set( state, lister );
}

std::vector<resolved_slot> refresh_review( review_state& state ) {
    return refresh_review( state, files::default_directory_lister() );
}

void deactivate_review( review_state& state ) {
    const review_settings settings = state.settings;
    state = review_state();
    state.settings = settings;
}

} // namespace review
} // namespace compview
