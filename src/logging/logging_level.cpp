// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/logging/logging_level.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <iostream>

static int g_loggingLevel = compview::logging::level::stats;

#ifdef COMPVIEW_USE_WCHAR
#define COMPVIEW_TCLOG ( std::wclog )
#define COMPVIEW_TCERR ( std::wcerr )
#define COMPVIEW_TCOUT ( std::wcout )
#else
#define COMPVIEW_TCLOG ( std::clog )
#define COMPVIEW_TCERR ( std::cerr )
#define COMPVIEW_TCOUT ( std::cout )
#endif

namespace compview {
namespace logging {

std::basic_ostream<compview::tchar> debug( COMPVIEW_TCLOG.rdbuf() );
std::basic_ostream<compview::tchar> stats( COMPVIEW_TCLOG.rdbuf() );
std::basic_ostream<compview::tchar> progress( COMPVIEW_TCLOG.rdbuf() );
std::basic_ostream<compview::tchar> warning( COMPVIEW_TCLOG.rdbuf() );
std::basic_ostream<compview::tchar> error( COMPVIEW_TCERR.rdbuf() );

std::string logging_level_as_string( int level ) {
    switch( level ) {
    case level::none:
        return "0 - No Logging";
    case level::error:
        return "1 - Errors";
    case level::warning:
        return "2 - Warnings";
    case level::progress:
        return "3 - Progress";
    case level::stats:
        return "4 - Stats";
    default:
        return "5 - Debug";
    }
}

bool logging_level_from_string( const std::string& levelString, int& outLevel ) {
    const std::string name = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( levelString ) );

    static const char* names[] = { "none", "error", "warning", "progress", "stats", "debug" };
    for( int i = level::none; i <= level::debug; ++i ) {
        if( name == names[i] || ( name.size() == 1 && name[0] == '0' + i ) ) {
            outLevel = i;
            return true;
        }
    }

    // accept the plural forms used by logging_level_as_string()
    if( name == "errors" ) {
        outLevel = level::error;
        return true;
    } else if( name == "warnings" ) {
        outLevel = level::warning;
        return true;
    }

    return false;
}

std::basic_ostream<compview::tchar>& get_logging_stream( int streamLevel ) {
    switch( streamLevel ) {
    case level::error:
        return error;
    case level::warning:
        return warning;
    case level::progress:
        return progress;
    case level::stats:
        return stats;
    case level::debug:
        return debug;
    default:
        return COMPVIEW_TCOUT;
    }
}

void redirect_all_streams( std::basic_streambuf<compview::tchar>* newBuff ) {
    debug.rdbuf( newBuff );
    stats.rdbuf( newBuff );
    progress.rdbuf( newBuff );
    warning.rdbuf( newBuff );
    error.rdbuf( newBuff );
}

void reset_default_streams() {
    debug.rdbuf( COMPVIEW_TCLOG.rdbuf() );
    stats.rdbuf( COMPVIEW_TCLOG.rdbuf() );
    progress.rdbuf( COMPVIEW_TCLOG.rdbuf() );
    warning.rdbuf( COMPVIEW_TCLOG.rdbuf() );
    error.rdbuf( COMPVIEW_TCERR.rdbuf() );
}

void set_logging_level( int level ) { g_loggingLevel = level; }

int get_logging_level() { return g_loggingLevel; }

std::string get_logging_level_string() { return logging_level_as_string( g_loggingLevel ); }

set_logging_level_in_scope::set_logging_level_in_scope( int level )
    : m_oldLevel( get_logging_level() ) {
    set_logging_level( level );
}

set_logging_level_in_scope::~set_logging_level_in_scope() { set_logging_level( m_oldLevel ); }

bool is_logging_errors() { return g_loggingLevel >= level::error; }

} // namespace logging
} // namespace compview
