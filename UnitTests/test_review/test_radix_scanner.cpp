// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// clang-format off
#include "stdafx.h"
// clang-format on

#include "gtest-helper.h"
#include "utilities/scoped_log_capture.hpp"
#include "utilities/scoped_temp_directory.hpp"

#include <boost/assign/list_of.hpp>

#include <compview/files/directory_lister.hpp>
#include <compview/review/pattern_extractor.hpp>
#include <compview/review/radix_scanner.hpp>

using namespace compview;
using namespace compview::review;
using compview::files::memory_directory_lister;

namespace {

const tstring renderDir = _T("/renders");

std::vector<cell_pattern> make_cells( const std::vector<tstring>& tails ) {
    std::vector<cell_pattern> cells;
    for( std::size_t i = 0; i < tails.size(); ++i )
        cells.push_back( cell_pattern( derive_cell_label( tails[i] ), tails[i], make_tail_pattern( tails[i] ) ) );
    return cells;
}

void add_entries( memory_directory_lister& lister, const tstring& directory, const std::vector<tstring>& names ) {
    lister.add_directory( directory );
    for( std::size_t i = 0; i < names.size(); ++i )
        lister.add_entry( directory, names[i] );
}

} // anonymous namespace

TEST( RadixScanner, RequiredCorroboratingCells ) {
    EXPECT_EQ( 0u, required_corroborating_cells( 0 ) );
    EXPECT_EQ( 1u, required_corroborating_cells( 1 ) );
    EXPECT_EQ( 2u, required_corroborating_cells( 2 ) );
    EXPECT_EQ( 2u, required_corroborating_cells( 5 ) );

    review_settings settings;
    settings.maxRequiredCells = 3;
    EXPECT_EQ( 3u, required_corroborating_cells( 5, settings ) );
    EXPECT_EQ( 2u, required_corroborating_cells( 2, settings ) );
}

TEST( RadixScanner, FindsCompleteSetsInSortedOrder ) {
    memory_directory_lister lister;
    std::vector<tstring> names = boost::assign::list_of<tstring>( _T("shot_002_specular.jpg") )(
        _T("shot_001_diffuse.jpg") )( _T("shot_002_diffuse.jpg") )( _T("shot_001_specular.jpg") )(
        _T("photo_holiday.png") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_diffuse.jpg") )( _T("_specular.jpg") );
    const std::vector<tstring> radixes = scan_radixes( renderDir, make_cells( tails ), lister );

    std::vector<tstring> expected = boost::assign::list_of<tstring>( _T("shot_001") )( _T("shot_002") );
    EXPECT_EQ( expected, radixes );
}

TEST( RadixScanner, MixedExtensions ) {
    memory_directory_lister lister;
    std::vector<tstring> names = boost::assign::list_of<tstring>( _T("frame_10.jpg") )( _T("frame_10_depth.exr") )(
        _T("frame_11.jpg") )( _T("frame_11_depth.exr") )( _T("frame_12.jpg") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T(".jpg") )( _T("_depth.exr") );
    const std::vector<tstring> radixes = scan_radixes( renderDir, make_cells( tails ), lister );

    // frame_12 only has one of its two cells on disk
    std::vector<tstring> expected = boost::assign::list_of<tstring>( _T("frame_10") )( _T("frame_11") );
    EXPECT_EQ( expected, radixes );
}

TEST( RadixScanner, OneCellIsNotEnoughCorroboration ) {
    memory_directory_lister lister;
    std::vector<tstring> names =
        boost::assign::list_of<tstring>( _T("a_left.png") )( _T("a_right.png") )( _T("b_left.png") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_left.png") )( _T("_right.png") );
    const std::vector<tstring> radixes = scan_radixes( renderDir, make_cells( tails ), lister );

    ASSERT_EQ( 1u, radixes.size() );
    EXPECT_EQ( _T("a"), radixes[0] );
}

TEST( RadixScanner, TwoOfThreeCellsIsEnough ) {
    memory_directory_lister lister;
    std::vector<tstring> names = boost::assign::list_of<tstring>( _T("s1_a.png") )( _T("s1_b.png") )(
        _T("s1_c.png") )( _T("s2_a.png") )( _T("s2_c.png") )( _T("s3_b.png") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_a.png") )( _T("_b.png") )( _T("_c.png") );
    const std::vector<tstring> radixes = scan_radixes( renderDir, make_cells( tails ), lister );

    std::vector<tstring> expected = boost::assign::list_of<tstring>( _T("s1") )( _T("s2") );
    EXPECT_EQ( expected, radixes );

    // requiring every cell leaves only the complete set
    review_settings strict;
    strict.maxRequiredCells = 3;
    const std::vector<tstring> strictRadixes = scan_radixes( renderDir, make_cells( tails ), lister, strict );
    ASSERT_EQ( 1u, strictRadixes.size() );
    EXPECT_EQ( _T("s1"), strictRadixes[0] );
}

TEST( RadixScanner, SinglePatternNeedsOneMatch ) {
    memory_directory_lister lister;
    std::vector<tstring> names = boost::assign::list_of<tstring>( _T("b_beauty.exr") )( _T("a_beauty.exr") )(
        _T("a_beauty.exr.tmp") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_beauty.exr") );
    const std::vector<tstring> radixes = scan_radixes( renderDir, make_cells( tails ), lister );

    std::vector<tstring> expected = boost::assign::list_of<tstring>( _T("a") )( _T("b") );
    EXPECT_EQ( expected, radixes );
}

TEST( RadixScanner, NoCellsFindsNothing ) {
    memory_directory_lister lister;
    lister.add_entry( renderDir, _T("a_left.png") );

    EXPECT_TRUE( scan_radixes( renderDir, std::vector<cell_pattern>(), lister ).empty() );
}

TEST( RadixScanner, InvalidPatternIsSkipped ) {
    memory_directory_lister lister;
    std::vector<tstring> names = boost::assign::list_of<tstring>( _T("a_x.png") )( _T("a_y.png") )(
        _T("a_z.png") )( _T("b_x.png") )( _T("b_z.png") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_x.png") )( _T("_y.png") )( _T("_z.png") );
    std::vector<cell_pattern> cells = make_cells( tails );
    cells[1].pattern = _T("^(.*_y\\.png$");

    std::vector<tstring> radixes;
    {
        scoped_log_capture capture( compview::logging::warning, compview::logging::level::warning );
        radixes = scan_radixes( renderDir, cells, lister );
        EXPECT_FALSE( capture.str().empty() );
    }

    std::vector<tstring> expected = boost::assign::list_of<tstring>( _T("a") )( _T("b") );
    EXPECT_EQ( expected, radixes );
}

TEST( RadixScanner, NamesContinuingPastTheTailAreNotCandidates ) {
    memory_directory_lister lister;
    std::vector<tstring> names = boost::assign::list_of<tstring>( _T("shot_009_diffuse.jpg\nbackup") )(
        _T("shot_009_specular.jpg\nbackup") )( _T("shot_010_diffuse.jpg") )( _T("shot_010_specular.jpg") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_diffuse.jpg") )( _T("_specular.jpg") );
    const std::vector<tstring> radixes = scan_radixes( renderDir, make_cells( tails ), lister );

    ASSERT_EQ( 1u, radixes.size() );
    EXPECT_EQ( _T("shot_010"), radixes[0] );
}

TEST( RadixScanner, UnlistableDirectoryFindsNothing ) {
    memory_directory_lister lister;
    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_left.png") )( _T("_right.png") );

    std::vector<tstring> radixes;
    {
        scoped_log_capture capture( compview::logging::warning, compview::logging::level::warning );
        radixes = scan_radixes( _T("/does/not/exist"), make_cells( tails ), lister );
        EXPECT_NE( tstring::npos, capture.str().find( _T("/does/not/exist") ) );
    }

    EXPECT_TRUE( radixes.empty() );
}

TEST( RadixScanner, ScanningTwiceGivesTheSameResult ) {
    memory_directory_lister lister;
    std::vector<tstring> names = boost::assign::list_of<tstring>( _T("b_l.png") )( _T("b_r.png") )( _T("a_l.png") )(
        _T("a_r.png") );
    add_entries( lister, renderDir, names );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_l.png") )( _T("_r.png") );
    const std::vector<cell_pattern> cells = make_cells( tails );

    EXPECT_EQ( scan_radixes( renderDir, cells, lister ), scan_radixes( renderDir, cells, lister ) );
}

TEST( RadixScanner, ScansRealDirectory ) {
    scoped_temp_directory dir;
    dir.create_file( _T("shot_001_diffuse.jpg") );
    dir.create_file( _T("shot_001_specular.jpg") );
    dir.create_file( _T("shot_002_diffuse.jpg") );
    dir.create_file( _T("shot_002_specular.jpg") );
    dir.create_file( _T("notes.txt") );
    // directories are not candidates even when their names match
    dir.create_subdirectory( _T("shot_003_diffuse.jpg") );
    dir.create_subdirectory( _T("shot_003_specular.jpg") );

    std::vector<tstring> tails = boost::assign::list_of<tstring>( _T("_diffuse.jpg") )( _T("_specular.jpg") );
    const std::vector<tstring> radixes = scan_radixes( dir.get_path(), make_cells( tails ) );

    std::vector<tstring> expected = boost::assign::list_of<tstring>( _T("shot_001") )( _T("shot_002") );
    EXPECT_EQ( expected, radixes );
}
