// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include <compview/logging/logging_level.hpp>
#include <compview/review/radix_scanner.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace compview {
namespace review {

std::size_t required_corroborating_cells( std::size_t numCells, const review_settings& settings ) {
    return std::min( numCells, settings.maxRequiredCells );
}

std::vector<compview::tstring> scan_radixes( const compview::tstring& directory,
                                             const std::vector<cell_pattern>& cellPatterns,
                                             const files::directory_lister& lister,
                                             const review_settings& settings ) {
    std::vector<compview::tstring> result;

    std::vector<compiled_cell_pattern> compiled;
    compile_cell_patterns( cellPatterns, compiled );

    std::vector<compview::tstring> entries;
    try {
        lister.list_entries( directory, entries );
    } catch( const std::runtime_error& e ) {
        COMPVIEW_LOG( warning ) << _T("scan_radixes: cannot list \"") << directory << _T("\": ") << e.what()
                                << std::endl;
        return result;
    }

    // the cells that matched a file with each candidate radix
    typedef std::map<compview::tstring, std::set<std::size_t>> radix_cells_t;
    radix_cells_t radixCells;

    for( std::size_t i = 0; i < entries.size(); ++i ) {
        for( std::size_t cellIndex = 0; cellIndex < compiled.size(); ++cellIndex ) {
            const boost::optional<compview::tstring> radix = compiled[cellIndex].capture_radix( entries[i] );
            if( radix )
                radixCells[*radix].insert( cellIndex );
        }
    }

    const std::size_t minCells = required_corroborating_cells( cellPatterns.size(), settings );
    for( radix_cells_t::const_iterator it = radixCells.begin(), itEnd = radixCells.end(); it != itEnd; ++it ) {
        if( it->second.size() >= minCells )
            result.push_back( it->first );
    }

    COMPVIEW_LOG( stats ) << _T("scan_radixes: ") << entries.size() << _T(" entries in \"") << directory
                          << _T("\", ") << radixCells.size() << _T(" candidate radixes, ") << result.size()
                          << _T(" matched at least ") << minCells << _T(" cells") << std::endl;

    return result;
}

std::vector<compview::tstring> scan_radixes( const compview::tstring& directory,
                                             const std::vector<cell_pattern>& cellPatterns ) {
    return scan_radixes( directory, cellPatterns, files::default_directory_lister() );
}

} // namespace review
} // namespace compview
