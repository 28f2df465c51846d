// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/files/files.hpp>

#include <stdexcept>

#include <boost/filesystem/operations.hpp>

namespace fs = boost::filesystem;

namespace compview {
namespace files {

bool directory_exists( const compview::tstring& dirname ) {
    boost::system::error_code ec;
    return fs::is_directory( fs::path( dirname ), ec );
}

void get_filenames_in_directory( const compview::tstring& directory, std::vector<compview::tstring>& fileListing ) {
    fileListing.clear();

    const fs::path dirPath( directory );
    if( !fs::exists( dirPath ) ) {
        throw std::runtime_error( "files::get_filenames_in_directory(): Directory does not exist: " +
                                  compview::strings::to_string( directory ) );
    }
    if( !fs::is_directory( dirPath ) ) {
        throw std::runtime_error( "files::get_filenames_in_directory(): Path is not a directory: " +
                                  compview::strings::to_string( directory ) );
    }

    // directory_iterator reports unreadable directories by throwing fs::filesystem_error, which is a
    // std::runtime_error, so callers only need to handle one exception type.
    for( fs::directory_iterator i( dirPath ), ie; i != ie; ++i ) {
        bool accept = false;

        boost::system::error_code ec;
        const fs::file_status status = i->status( ec );
        if( !ec ) {
            // status() follows symlinks, so a link to a regular file is accepted and a dangling link is not
            accept = fs::is_regular_file( status );
        }

        if( accept ) {
            fileListing.push_back( to_tstring( i->path().filename() ) );
        }
    }
}

compview::tstring concatenate_path( const compview::tstring& directory, const compview::tstring& filename ) {
    return to_tstring( fs::path( directory ) / fs::path( filename ) );
}

compview::tstring make_absolute_path( const compview::tstring& path ) {
    if( path.empty() )
        return path;
    return to_tstring( fs::absolute( fs::path( path ) ) );
}

compview::tstring to_tstring( const boost::filesystem::path& path ) {
#ifdef COMPVIEW_USE_WCHAR
    return path.wstring();
#else
    return path.string();
#endif
}

} // namespace files
} // namespace compview
