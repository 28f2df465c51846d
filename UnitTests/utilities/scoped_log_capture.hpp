// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <sstream>

#include <boost/noncopyable.hpp>

#include <compview/logging/logging_level.hpp>

// Sends one log stream into a string buffer at the given level, restoring the stream and level on destruction.
class scoped_log_capture : boost::noncopyable {
  public:
    scoped_log_capture( std::basic_ostream<compview::tchar>& stream, int level )
        : m_stream( stream )
        , m_oldBuffer( stream.rdbuf() )
        , m_level( level ) {
        compview::logging::redirect_stream( m_stream, m_buffer.rdbuf() );
    }

    ~scoped_log_capture() { compview::logging::redirect_stream( m_stream, m_oldBuffer ); }

    compview::tstring str() const { return m_buffer.str(); }

  private:
    std::basic_ostream<compview::tchar>& m_stream;
    std::basic_streambuf<compview::tchar>* m_oldBuffer;
    compview::logging::set_logging_level_in_scope m_level;
    std::basic_ostringstream<compview::tchar> m_buffer;
};
