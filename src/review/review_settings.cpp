// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/logging/logging_level.hpp>
#include <compview/os/environment.hpp>
#include <compview/review/review_settings.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace compview {
namespace review {

const char* const REVIEW_SEPARATORS_VARIABLE = "COMPVIEW_REVIEW_SEPARATORS";
const char* const REVIEW_MAX_REQUIRED_CELLS_VARIABLE = "COMPVIEW_REVIEW_MAX_REQUIRED_CELLS";
const char* const LOG_LEVEL_VARIABLE = "COMPVIEW_LOG_LEVEL";

review_settings::review_settings()
    : separators( _T("_-.") )
    , maxRequiredCells( 2 ) {}

bool review_settings::is_separator( compview::tchar c ) const {
    return separators.find( c ) != compview::tstring::npos;
}

review_settings default_review_settings() { return review_settings(); }

review_settings load_review_settings_from_environment() {
    review_settings settings;

    const compview::tstring separators =
        os::get_environment_variable( compview::strings::to_tstring( REVIEW_SEPARATORS_VARIABLE ) );
    if( !separators.empty() )
        settings.separators = separators;

    const std::string maxCells = boost::algorithm::trim_copy( compview::strings::to_string(
        os::get_environment_variable( compview::strings::to_tstring( REVIEW_MAX_REQUIRED_CELLS_VARIABLE ) ) ) );
    if( !maxCells.empty() ) {
        try {
            const int value = boost::lexical_cast<int>( maxCells );
            if( value > 0 ) {
                settings.maxRequiredCells = static_cast<std::size_t>( value );
            } else {
                COMPVIEW_LOG( warning ) << _T("load_review_settings_from_environment: ")
                                        << REVIEW_MAX_REQUIRED_CELLS_VARIABLE << _T(" must be positive, got ")
                                        << value << _T(". Using ") << settings.maxRequiredCells << std::endl;
            }
        } catch( const boost::bad_lexical_cast& ) {
            COMPVIEW_LOG( warning ) << _T("load_review_settings_from_environment: ignoring non-numeric ")
                                    << REVIEW_MAX_REQUIRED_CELLS_VARIABLE << _T(" \"") << maxCells.c_str() << _T("\"")
                                    << std::endl;
        }
    }

    return settings;
}

bool configure_logging_from_environment() {
    const std::string levelString = compview::strings::to_string(
        os::get_environment_variable( compview::strings::to_tstring( LOG_LEVEL_VARIABLE ) ) );
    if( levelString.empty() )
        return false;

    int level;
    if( !logging::logging_level_from_string( levelString, level ) ) {
        COMPVIEW_LOG( warning ) << _T("configure_logging_from_environment: unknown logging level \"")
                                << levelString.c_str() << _T("\" in ") << LOG_LEVEL_VARIABLE << std::endl;
        return false;
    }

    logging::set_logging_level( level );
    return true;
}

} // namespace review
} // namespace compview
