// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/files/directory_lister.hpp>
#include <compview/files/files.hpp>

#include <stdexcept>

namespace compview {
namespace files {

void filesystem_directory_lister::list_entries( const compview::tstring& directory,
                                                std::vector<compview::tstring>& outNames ) const {
    get_filenames_in_directory( directory, outNames );
}

void memory_directory_lister::add_directory( const compview::tstring& directory ) { m_directories[directory]; }

void memory_directory_lister::add_entry( const compview::tstring& directory, const compview::tstring& name ) {
    m_directories[directory].push_back( name );
}

void memory_directory_lister::remove_directory( const compview::tstring& directory ) {
    m_directories.erase( directory );
}

void memory_directory_lister::list_entries( const compview::tstring& directory,
                                            std::vector<compview::tstring>& outNames ) const {
    outNames.clear();

    std::map<compview::tstring, std::vector<compview::tstring>>::const_iterator it = m_directories.find( directory );
    if( it == m_directories.end() ) {
        throw std::runtime_error( "memory_directory_lister::list_entries(): Directory does not exist: " +
                                  compview::strings::to_string( directory ) );
    }

    outNames = it->second;
}

const directory_lister& default_directory_lister() {
    static filesystem_directory_lister lister;
    return lister;
}

} // namespace files
} // namespace compview
