// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>

#include <compview/strings/tstring.hpp>

namespace compview {
namespace review {

// Environment variables read by load_review_settings_from_environment() and configure_logging_from_environment().
extern const char* const REVIEW_SEPARATORS_VARIABLE;
extern const char* const REVIEW_MAX_REQUIRED_CELLS_VARIABLE;
extern const char* const LOG_LEVEL_VARIABLE;

/**
 * Tunables for pattern extraction and radix scanning. The defaults are what the viewer ships with.
 */
struct review_settings {
    // Characters that separate the radix from the variant part of a filename.
    compview::tstring separators;

    // A scanned radix is kept when at least min( number of cells, maxRequiredCells ) different cell patterns matched
    // a file with that radix.
    std::size_t maxRequiredCells;

    review_settings();

    bool is_separator( compview::tchar c ) const;
};

review_settings default_review_settings();

/**
 * Builds review_settings from the defaults overridden by COMPVIEW_REVIEW_SEPARATORS and
 * COMPVIEW_REVIEW_MAX_REQUIRED_CELLS. Values that do not parse are reported on the warning log and ignored.
 */
review_settings load_review_settings_from_environment();

/**
 * Sets the process logging level from COMPVIEW_LOG_LEVEL if it is set.
 *
 * @return true if the variable was set and named a valid level
 */
bool configure_logging_from_environment();

} // namespace review
} // namespace compview
