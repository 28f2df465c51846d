// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/os/environment.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

#if defined( _WIN32 )
#include <windows.h>
#endif

#if defined( _MSC_VER )
#pragma warning( push )
#pragma warning( disable : 4996 )
#endif

namespace compview {
namespace os {

namespace {

void throw_environment_error( const char* action, const compview::tstring& key ) {
    std::stringstream ss;
    ss << "Failed to " << action << " environment variable \"" << compview::strings::to_string( key )
       << "\" because:\n\n";
    ss << "Error number " << errno << "\n";
    ss << strerror( errno );
    throw std::runtime_error( ss.str() );
}

} // anonymous namespace

void set_environment_variable( const compview::tstring& key, const compview::tstring& value ) {
#if defined( _WIN32 )
    if( _tputenv( ( key + _T("=") + value ).c_str() ) < 0 )
        throw_environment_error( "set", key );
#else
    if( 0 != setenv( key.c_str(), value.c_str(), 1 ) )
        throw_environment_error( "set", key );
#endif
}

void unset_environment_variable( const compview::tstring& key ) {
#if defined( _WIN32 )
    // an empty assignment removes the variable from the process environment
    if( _tputenv( ( key + _T("=") ).c_str() ) < 0 )
        throw_environment_error( "unset", key );
#else
    if( 0 != unsetenv( key.c_str() ) )
        throw_environment_error( "unset", key );
#endif
}

compview::tstring get_environment_variable( const compview::tstring& key ) {
#if defined( _WIN32 )
    DWORD buffSize = GetEnvironmentVariable( key.c_str(), 0, 0 );

    if( buffSize == 0 )
        return _T("");

    std::vector<compview::tchar> buffer( buffSize );
    GetEnvironmentVariable( key.c_str(), &buffer[0], buffSize );
    return compview::tstring( &buffer[0] );
#else
    const char* cvalue = getenv( key.c_str() );
    compview::tstring value;
    if( cvalue != 0 )
        value = cvalue;
    return value;
#endif
}

} // namespace os
} // namespace compview

#if defined( _MSC_VER )
#pragma warning( pop )
#endif
