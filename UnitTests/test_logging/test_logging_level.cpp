// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest-helper.h"
#include "utilities/scoped_log_capture.hpp"

#include <compview/logging/logging_level.hpp>

#include <iostream>
#include <sstream>

using namespace compview::logging;

TEST( LoggingLevel, LevelFromString ) {
    int level = -1;

    EXPECT_TRUE( logging_level_from_string( "none", level ) );
    EXPECT_EQ( level::none, level );
    EXPECT_TRUE( logging_level_from_string( " Warning ", level ) );
    EXPECT_EQ( level::warning, level );
    EXPECT_TRUE( logging_level_from_string( "errors", level ) );
    EXPECT_EQ( level::error, level );
    EXPECT_TRUE( logging_level_from_string( "STATS", level ) );
    EXPECT_EQ( level::stats, level );
    EXPECT_TRUE( logging_level_from_string( "5", level ) );
    EXPECT_EQ( level::debug, level );

    EXPECT_FALSE( logging_level_from_string( "", level ) );
    EXPECT_FALSE( logging_level_from_string( "6", level ) );
    EXPECT_FALSE( logging_level_from_string( "verbose", level ) );
    EXPECT_EQ( level::debug, level );
}

TEST( LoggingLevel, LevelAsString ) {
    EXPECT_EQ( "0 - No Logging", logging_level_as_string( level::none ) );
    EXPECT_EQ( "2 - Warnings", logging_level_as_string( level::warning ) );
    EXPECT_EQ( "5 - Debug", logging_level_as_string( level::debug ) );
}

TEST( LoggingLevel, SetInScopeRestoresLevel ) {
    const int original = get_logging_level();
    {
        set_logging_level_in_scope scoped( level::none );
        EXPECT_EQ( level::none, get_logging_level() );
        EXPECT_FALSE( is_logging_errors() );
        EXPECT_EQ( logging_level_as_string( level::none ), get_logging_level_string() );
    }
    EXPECT_EQ( original, get_logging_level() );
}

TEST( LoggingLevel, MacroRespectsLevel ) {
    {
        scoped_log_capture capture( warning, level::warning );
        COMPVIEW_LOG( warning ) << _T("shown");
        COMPVIEW_LOG( debug ) << _T("hidden");
        EXPECT_EQ( _T("shown"), capture.str() );
    }
    {
        scoped_log_capture capture( warning, level::error );
        COMPVIEW_LOG( warning ) << _T("hidden");
        EXPECT_TRUE( capture.str().empty() );
    }
}

TEST( LoggingLevel, NullBufferDisablesStream ) {
    scoped_log_capture capture( stats, level::debug );
    redirect_stream( stats, 0 );

    // nothing is evaluated on the right hand side when the stream has no buffer
    int evaluations = 0;
    COMPVIEW_LOG( stats ) << ++evaluations;
    EXPECT_EQ( 0, evaluations );
}

TEST( LoggingLevel, GetLoggingStream ) {
    EXPECT_EQ( &error, &get_logging_stream( level::error ) );
    EXPECT_EQ( &warning, &get_logging_stream( level::warning ) );
    EXPECT_EQ( &debug, &get_logging_stream( level::debug ) );
}

TEST( LoggingLevel, RedirectAndResetAllStreams ) {
    set_logging_level_in_scope scoped( level::debug );

    std::basic_ostringstream<compview::tchar> buffer;
    redirect_all_streams( buffer.rdbuf() );

    COMPVIEW_LOG( error ) << _T("e");
    COMPVIEW_LOG( warning ) << _T("w");
    COMPVIEW_LOG( progress ) << _T("p");
    COMPVIEW_LOG( stats ) << _T("s");
    COMPVIEW_LOG( debug ) << _T("d");

    reset_default_streams();
    EXPECT_EQ( _T("ewpsd"), buffer.str() );

#ifdef COMPVIEW_USE_WCHAR
    EXPECT_EQ( std::wcerr.rdbuf(), error.rdbuf() );
    EXPECT_EQ( std::wclog.rdbuf(), warning.rdbuf() );
    EXPECT_EQ( std::wclog.rdbuf(), debug.rdbuf() );
#else
    EXPECT_EQ( std::cerr.rdbuf(), error.rdbuf() );
    EXPECT_EQ( std::clog.rdbuf(), warning.rdbuf() );
    EXPECT_EQ( std::clog.rdbuf(), debug.rdbuf() );
#endif
}
