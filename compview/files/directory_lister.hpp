// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <vector>

#include <compview/strings/tstring.hpp>

namespace compview {
namespace files {

/**
 * The capability of listing the entries of a directory. Everything in the review code that reads a directory goes
 * through one of these, so the listing can come from the real filesystem or from memory.
 *
 * A listing is flat: entry names only, no recursion. Implementations throw std::runtime_error when the directory
 * cannot be listed.
 */
class directory_lister {
  public:
    virtual ~directory_lister() {}

    /**
     * Fills outNames with the names of the entries in directory, in enumeration order.
     *
     * @param directory The directory to list.
     * @param outNames Receives the entry names. It is cleared first.
     */
    virtual void list_entries( const compview::tstring& directory,
                               std::vector<compview::tstring>& outNames ) const = 0;
};

/**
 * Lists directories on disk with get_filenames_in_directory().
 */
class filesystem_directory_lister : public directory_lister {
  public:
    virtual void list_entries( const compview::tstring& directory, std::vector<compview::tstring>& outNames ) const;
};

/**
 * A directory tree held in memory. Entries are listed in the order they were added. Listing a directory that was
 * never added throws, the same way listing a missing directory on disk does.
 */
class memory_directory_lister : public directory_lister {
  public:
    // Registers an empty directory. Does nothing if it is already known.
    void add_directory( const compview::tstring& directory );

    // Adds a file to a directory, registering the directory if needed.
    void add_entry( const compview::tstring& directory, const compview::tstring& name );

    void remove_directory( const compview::tstring& directory );

    virtual void list_entries( const compview::tstring& directory, std::vector<compview::tstring>& outNames ) const;

  private:
    std::map<compview::tstring, std::vector<compview::tstring>> m_directories;
};

// The lister used by the overloads that do not take one explicitly.
const directory_lister& default_directory_lister();

} // namespace files
} // namespace compview
