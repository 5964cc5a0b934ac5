/// Test the Playlist and Track_navigator
///
///    tnav  --log_level=all

/*   Part of the tunemux package.
 *
 *   Copyright 2026 The tunemux authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 *
 */

/// Dynamically link boost test framework
#define BOOST_TEST_MODULE nav_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <set>

#include "logging.hpp"
#include "navigator.hpp"
#include "playlist.hpp"

namespace fs = boost::filesystem;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("tnav","tnav_%2N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LogFixture);

static const std::vector<Track_ref> ABC { "a", "b", "c" };

//////////////////////////////////////////////////////////////////////////

/// Sequential mode wraps in both directions.
///
BOOST_AUTO_TEST_CASE( sequential_wraps )
{
    Playlist pl;
    pl.replace( ABC );
    Track_navigator nav { pl };
    BOOST_CHECK_EQUAL( *nav.current(), "a" );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::next), "b" );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::next), "c" );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::next), "a" );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::prev), "c" );
    Nav_cursor c = nav.cursor();
    BOOST_CHECK_EQUAL( c.current, 2u );
    BOOST_CHECK_EQUAL( c.next, 0u );
    BOOST_CHECK_EQUAL( c.prev, 1u );
}

/// An empty playlist yields nothing and leaves the cursor at zero.
///
BOOST_AUTO_TEST_CASE( empty_playlist )
{
    Playlist pl;
    Track_navigator nav { pl };
    BOOST_TEST( not nav.navigate(Direction::next) );
    BOOST_TEST( not nav.navigate(Direction::prev) );
    BOOST_TEST( not nav.current() );
    BOOST_CHECK_EQUAL( nav.cursor().current, 0u );
}

/// Shuffle never repeats the current track on next, and prev returns to
/// the track before the last move.
///
BOOST_AUTO_TEST_CASE( shuffle_moves )
{
    Playlist pl;
    pl.replace( {"t0","t1","t2","t3","t4","t5"} );
    Track_navigator nav { pl };
    nav.seed( 42 );
    nav.set_shuffle( true );
    std::set<size_t> visited;
    for (int i=0; i<200; ++i) {
        size_t before = nav.cursor().current;
        auto t = nav.navigate( Direction::next );
        BOOST_REQUIRE( t );
        size_t after = nav.cursor().current;
        BOOST_TEST( after != before );
        BOOST_CHECK_EQUAL( *t, *pl.at(after) );
        visited.insert( after );
    }
    BOOST_CHECK_EQUAL( visited.size(), 6u );
    //
    size_t here = nav.cursor().current;
    nav.navigate( Direction::next );
    auto back = nav.navigate( Direction::prev );
    BOOST_REQUIRE( back );
    BOOST_CHECK_EQUAL( nav.cursor().current, here );
}

/// A single track shuffles onto itself.
///
BOOST_AUTO_TEST_CASE( shuffle_single_track )
{
    Playlist pl;
    pl.replace( {"only"} );
    Track_navigator nav { pl };
    nav.set_shuffle( true );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::next), "only" );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::prev), "only" );
}

/// Toggling shuffle keeps the playlist order and the current track.
///
BOOST_AUTO_TEST_CASE( toggle_keeps_order )
{
    Playlist pl;
    pl.replace( ABC );
    Track_navigator nav { pl };
    nav.navigate( Direction::next );
    BOOST_TEST( nav.toggle_shuffle() );
    BOOST_TEST( nav.shuffle() );
    BOOST_TEST( (pl.snapshot() == ABC) );
    BOOST_CHECK_EQUAL( *nav.current(), "b" );
    BOOST_TEST( not nav.toggle_shuffle() );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::next), "c" );
}

/// A playlist that shrank under the cursor is clamped, not overrun.
///
BOOST_AUTO_TEST_CASE( playlist_shrinks )
{
    Playlist pl;
    pl.replace( {"a","b","c","d","e"} );
    Track_navigator nav { pl };
    BOOST_TEST( nav.jump(4) );
    BOOST_TEST( not nav.jump(5) );
    pl.replace( {"x","y"} );
    BOOST_CHECK_EQUAL( nav.cursor().current, 1u );
    BOOST_CHECK_EQUAL( *nav.current(), "y" );
    BOOST_CHECK_EQUAL( *nav.navigate(Direction::next), "x" );
    pl.clear();
    BOOST_TEST( not nav.navigate(Direction::next) );
}

/// Removing an earlier entry keeps the cursor on the same track.
///
BOOST_AUTO_TEST_CASE( removal_keeps_current )
{
    Playlist pl;
    pl.replace( {"a","b","c","d"} );
    Track_navigator nav { pl };
    nav.jump( 2 );
    BOOST_TEST( pl.remove(0) );
    nav.note_removed( 0 );
    BOOST_CHECK_EQUAL( *nav.current(), "c" );
    BOOST_TEST( not pl.remove(9) );
}

/// Playlist editing.
///
BOOST_AUTO_TEST_CASE( playlist_edits )
{
    Playlist pl;
    BOOST_TEST( pl.empty() );
    pl.append( "a" );
    pl.append( "b" );
    pl.append( "c" );
    BOOST_CHECK_EQUAL( pl.size(), 3u );
    BOOST_TEST( (pl.snapshot() == ABC) );
    BOOST_TEST( not pl.at(3) );
    pl.replace( ABC, "letters" );
    BOOST_CHECK_EQUAL( pl.name(), "letters" );
}

/// Read a list file: comments and blanks skipped, a name line, relative
/// entries resolved against the file's directory.
///
BOOST_AUTO_TEST_CASE( list_file )
{
    fs::path lp { TEST_DATA_DIR "/evening.lst" };
    std::string name;
    auto tracks = Playlist::load_list_file( lp, name );
    BOOST_CHECK_EQUAL( name, "Evening Mix" );
    BOOST_REQUIRE_EQUAL( tracks.size(), 3u );
    BOOST_CHECK_EQUAL( tracks[0], (lp.parent_path() / "songs/one.mp3").string() );
    BOOST_CHECK_EQUAL( tracks[1], "/srv/music/two.ogg" );
    BOOST_CHECK_EQUAL( fs::path(tracks[2]).filename().string(), "three.flac" );
    //
    BOOST_CHECK_THROW( Playlist::load_list_file( TEST_DATA_DIR "/no_such.lst",
                                                 name ),
                       Playlist_file_error );
}
