// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/files/files.hpp>
#include <compview/logging/logging_level.hpp>
#include <compview/review/file_resolver.hpp>

#include <stdexcept>

namespace compview {
namespace review {

std::vector<boost::optional<compview::tstring>> resolve_files_for_radix( const compview::tstring& directory,
                                                                          const compview::tstring& radix,
                                                                          const std::vector<cell_pattern>& cellPatterns,
                                                                          const files::directory_lister& lister ) {
    std::vector<boost::optional<compview::tstring>> result( cellPatterns.size() );

    std::vector<compiled_cell_pattern> compiled;
    compile_cell_patterns( cellPatterns, compiled );

    std::vector<compview::tstring> entries;
    try {
        lister.list_entries( directory, entries );
    } catch( const std::runtime_error& e ) {
        COMPVIEW_LOG( warning ) << _T("resolve_files_for_radix: cannot list \"") << directory << _T("\": ")
                                << e.what() << std::endl;
        return result;
    }

    std::size_t numResolved = 0;
    for( std::size_t i = 0; i < entries.size() && numResolved < result.size(); ++i ) {
        for( std::size_t cellIndex = 0; cellIndex < compiled.size(); ++cellIndex ) {
            if( result[cellIndex] )
                continue;

            const boost::optional<compview::tstring> captured = compiled[cellIndex].capture_radix( entries[i] );
            if( captured && *captured == radix ) {
                result[cellIndex] = files::concatenate_path( directory, entries[i] );
                ++numResolved;
            }
        }
    }

    COMPVIEW_LOG( debug ) << _T("resolve_files_for_radix: \"") << radix << _T("\" resolved ") << numResolved
                          << _T(" of ") << result.size() << _T(" cells") << std::endl;

    return result;
}

std::vector<boost::optional<compview::tstring>>
resolve_files_for_radix( const compview::tstring& directory, const compview::tstring& radix,
                         const std::vector<cell_pattern>& cellPatterns ) {
    return resolve_files_for_radix( directory, radix, cellPatterns, files::default_directory_lister() );
}

} // namespace review
} // namespace compview
