// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <compview/strings/tstring.hpp>

#include <ostream>
#include <string>

// Implemented as a macro so that nothing on the right hand side is evaluated when the stream is disabled.
// Usage:
//		COMPVIEW_LOG( warning ) << "Skipping pattern " << pattern << std::endl;
#define COMPVIEW_LOG( stream )                                                                                         \
    if( compview::logging::get_logging_level() >= compview::logging::level::stream &&                                  \
        compview::logging::stream.rdbuf() )                                                                            \
    compview::logging::stream

namespace compview {
namespace logging {

// 0 is no logging, 1 is errors only, 2 is warnings, 3 is with progress, 4 is with stats, 5 is debugging
namespace level {
enum { none = 0, error, warning, progress, stats, debug };
}

// By default the log streams write to std::clog, except error which writes to std::cerr. Use redirect_stream() or
// std::ostream::rdbuf() to send them somewhere else.
extern std::basic_ostream<compview::tchar> debug;
extern std::basic_ostream<compview::tchar> stats;
extern std::basic_ostream<compview::tchar> progress;
extern std::basic_ostream<compview::tchar> warning;
extern std::basic_ostream<compview::tchar> error;

inline void redirect_stream( std::basic_ostream<compview::tchar>& stream,
                             std::basic_streambuf<compview::tchar>* newBuff ) {
    stream.rdbuf( newBuff );
}

void redirect_all_streams( std::basic_streambuf<compview::tchar>* newBuff );
void reset_default_streams();

void set_logging_level( int level );
int get_logging_level();
std::string get_logging_level_string();

/**
 * Sets the logging level for the lifetime of the object and restores the previous level on destruction.
 */
class set_logging_level_in_scope {
  public:
    explicit set_logging_level_in_scope( int level );
    ~set_logging_level_in_scope();

  private:
    int m_oldLevel;
};

std::string logging_level_as_string( int level );

/**
 * Parses a logging level as written in a configuration value. Accepts the level names ("none", "error",
 * "warning", "progress", "stats", "debug", case insensitive) or a number from 0 to 5.
 *
 * @param levelString the text to parse
 * @param outLevel receives the parsed level on success
 * @return true if levelString named a valid level
 */
bool logging_level_from_string( const std::string& levelString, int& outLevel );

std::basic_ostream<compview::tchar>& get_logging_stream( int streamLevel );

bool is_logging_errors();

} // namespace logging
} // namespace compview
