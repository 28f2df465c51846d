// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#if defined( _WIN32 ) || defined( _WIN64 )
#include <tchar.h>
#else
#include <cstdlib>
#include <stdexcept>
#include <vector>
#endif

// Define COMPVIEW_USE_WCHAR to build the library on wchar_t-based strings.
// Filenames coming from the viewer are UTF-8 on Linux, so the narrow build is the default there.
#if defined( UNICODE ) || defined( _UNICODE )
#define COMPVIEW_USE_WCHAR
#endif

#if !defined( _WIN32 ) && !defined( _WIN64 )
#ifndef _T
#ifdef COMPVIEW_USE_WCHAR
#define _T( x ) L##x
#else
#define _T( x ) x
#endif
#endif
#endif

namespace compview {
namespace strings {

#ifdef COMPVIEW_USE_WCHAR
typedef std::wstring tstring;
typedef wchar_t tchar;
#else
typedef std::string tstring;
typedef char tchar;
#endif

inline const std::string& to_string( const std::string& s ) { return s; }

inline std::string to_string( const char* s ) { return s ? std::string( s ) : std::string(); }

#if !defined( _WIN32 ) && !defined( _WIN64 )
// Only needed by wide builds, which convert through the current C locale.
inline std::string to_string( const std::wstring& ws ) {
    const std::size_t size = wcstombs( 0, ws.c_str(), 0 );
    if( size == static_cast<std::size_t>( -1 ) )
        throw std::runtime_error( "to_string: input does not correspond to a valid multibyte sequence" );

    std::vector<char> buffer( size + 1 );
    wcstombs( &buffer[0], ws.c_str(), size + 1 );
    return std::string( buffer.begin(), buffer.begin() + size );
}

inline std::wstring to_wstring( const std::string& s ) {
    const std::size_t size = mbstowcs( 0, s.c_str(), 0 );
    if( size == static_cast<std::size_t>( -1 ) )
        throw std::runtime_error( "to_wstring: invalid multibyte character in input" );

    std::vector<wchar_t> buffer( size + 1 );
    mbstowcs( &buffer[0], s.c_str(), size + 1 );
    return std::wstring( buffer.begin(), buffer.begin() + size );
}
#endif

#ifdef COMPVIEW_USE_WCHAR
inline const std::wstring& to_tstring( const std::wstring& s ) { return s; }
inline std::wstring to_tstring( const std::string& s ) { return to_wstring( s ); }
#else
inline const std::string& to_tstring( const std::string& s ) { return s; }
inline std::string to_tstring( const char* s ) { return to_string( s ); }
#endif

} // namespace strings

using compview::strings::tchar;
using compview::strings::tstring;

} // namespace compview
