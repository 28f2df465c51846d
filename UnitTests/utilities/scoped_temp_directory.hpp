// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fstream>

#include <boost/filesystem.hpp>
#include <boost/noncopyable.hpp>

#include <compview/files/files.hpp>

// A uniquely named directory under the temp directory, removed with its contents when the object goes out of scope.
class scoped_temp_directory : boost::noncopyable {
  public:
    scoped_temp_directory()
        : m_path( boost::filesystem::unique_path( boost::filesystem::temp_directory_path() /
                                                  "compview-%%%%-%%%%-%%%%-%%%%" ) ) {
        boost::filesystem::create_directory( m_path );
    }

    ~scoped_temp_directory() {
        boost::system::error_code ec;
        boost::filesystem::remove_all( m_path, ec );
    }

    // Creates an empty file in the directory.
    void create_file( const compview::tstring& filename ) const {
        std::ofstream out( ( m_path / filename ).string().c_str() );
    }

    void create_subdirectory( const compview::tstring& name ) const {
        boost::filesystem::create_directory( m_path / name );
    }

    compview::tstring get_path() const { return compview::files::to_tstring( m_path ); }

  private:
    boost::filesystem::path m_path;
};
