// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vector>

#include <boost/filesystem/path.hpp>

#include <compview/strings/tstring.hpp>

namespace compview {
namespace files {

bool directory_exists( const compview::tstring& dirname );

/**
 * get_filenames_in_directory() retrieves a flat listing of the files in the specified directory. Regular files and
 * symlinks that resolve to regular files are listed, sub directories are not. The names are the bare filenames in
 * the order the filesystem enumerates them.
 *
 * An exception is thrown if the directory does not exist or cannot be read.
 *
 * @param directory The directory from which to get the filenames.
 * @param fileListing Receives the filenames. It is cleared first.
 */
void get_filenames_in_directory( const compview::tstring& directory, std::vector<compview::tstring>& fileListing );

// Joins a directory and a filename with the platform's separator.
compview::tstring concatenate_path( const compview::tstring& directory, const compview::tstring& filename );

// Returns the path made absolute against the current working directory. Does not touch the filesystem.
compview::tstring make_absolute_path( const compview::tstring& path );

compview::tstring to_tstring( const boost::filesystem::path& path );

} // namespace files
} // namespace compview
