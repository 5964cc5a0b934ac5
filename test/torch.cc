/// Test the Playback_orchestrator: source handoff and exclusivity
///
///    torch  --log_level=all

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
#define BOOST_TEST_MODULE orchestrator_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <atomic>
#include <thread>

#include "logging.hpp"
#include "fake_sources.hpp"

using namespace std::chrono_literals;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("torch","torch_%2N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LogFixture);

/// Position of the first journal event matching pred, or -1.
template <typename Pred>
static int find_event( const std::vector<Event> &ev, Pred pred )
{
    auto it = std::find_if( ev.begin(), ev.end(), pred );
    return (it == ev.end() ? -1 : static_cast<int>(it - ev.begin()));
}

//////////////////////////////////////////////////////////////////////////

/// Local is playing; switching to a plugin stops local first and
/// publishes exactly one SOURCE_CHANGED.
///
BOOST_AUTO_TEST_CASE( handoff_from_local )
{
    Rig rig;
    auto spotify = rig.add_remote( "spotify" );
    rig.psm.load_playlist( {"a","b","c"} );
    BOOST_REQUIRE( rig.psm.play() );
    BOOST_TEST( rig.engine->busy() );
    BOOST_TEST( rig.orch.is_playing(LOCAL_SOURCE) );
    rig.bus.clear_journal();
    //
    BOOST_TEST( rig.orch.ensure_exclusive_playback("spotify") );
    BOOST_TEST( not rig.engine->busy() );
    BOOST_TEST( not rig.local->armed() );
    BOOST_CHECK_EQUAL( rig.orch.active_source(), "spotify" );
    auto sc = rig.events( Event_type::source_changed );
    BOOST_REQUIRE_EQUAL( sc.size(), 1u );
    BOOST_CHECK_EQUAL( sc[0].previous, LOCAL_SOURCE );
    BOOST_CHECK_EQUAL( sc[0].current, "spotify" );
    // local went quiet before the switch was announced
    auto ev = rig.events();
    int stopped = find_event( ev, [](const Event &e){
            return e.type == Event_type::state_changed
                and e.new_state == PlayerState::Stopped
                and e.source == LOCAL_SOURCE; } );
    int switched = find_event( ev, [](const Event &e){
            return e.type == Event_type::source_changed; } );
    BOOST_TEST( stopped >= 0 );
    BOOST_TEST( stopped < switched );
    BOOST_CHECK_EQUAL( rig.orch.snapshot().track_name, "" );
    auto calls = rig.engine->calls();
    BOOST_TEST( (std::find(calls.begin(), calls.end(), "stop") != calls.end()) );
}

/// Asking for the active source again changes nothing; an unknown
/// source is refused.
///
BOOST_AUTO_TEST_CASE( ensure_same_or_unknown )
{
    Rig rig;
    rig.bus.clear_journal();
    BOOST_TEST( rig.orch.ensure_exclusive_playback(LOCAL_SOURCE) );
    BOOST_TEST( not rig.orch.ensure_exclusive_playback("nosuch") );
    BOOST_CHECK_EQUAL( rig.orch.active_source(), LOCAL_SOURCE );
    BOOST_TEST( rig.events().empty() );
}

/// Plugin to plugin: the outgoing plugin is stopped before the other
/// starts, so the speaker never carries two sources.
///
BOOST_AUTO_TEST_CASE( handoff_between_plugins )
{
    Rig rig;
    auto r1 = rig.add_remote( "r1" );
    auto r2 = rig.add_remote( "r2" );
    BOOST_REQUIRE( rig.psm.play_source("r1", {"first"}) );
    BOOST_TEST( r1->playing() );
    BOOST_CHECK_EQUAL( rig.psm.state(), PlayerState::Playing );
    BOOST_REQUIRE( rig.psm.play_source("r2") );
    BOOST_TEST( not r1->playing() );
    BOOST_TEST( r2->playing() );
    BOOST_CHECK_EQUAL( rig.speaker.peak.load(), 1 );
    BOOST_CHECK_EQUAL( rig.orch.active_source(), "r2" );
}

/// A plugin without stop is paused instead.
///
BOOST_AUTO_TEST_CASE( quiesce_by_pause )
{
    Rig rig;
    auto r1 = rig.add_remote( "r1", Cap_play|Cap_pause|Cap_query );
    BOOST_REQUIRE( rig.psm.play_source("r1") );
    BOOST_TEST( rig.orch.ensure_exclusive_playback(LOCAL_SOURCE) );
    BOOST_TEST( not r1->playing() );
    auto calls = r1->calls();
    BOOST_TEST( (std::find(calls.begin(), calls.end(), "pause") != calls.end()) );
    BOOST_TEST( (std::find(calls.begin(), calls.end(), "stop") == calls.end()) );
}

/// A plugin that ignores stop delays the switch by the poll budget
/// only; the switch happens anyway.
///
BOOST_AUTO_TEST_CASE( unconfirmed_stop_proceeds )
{
    Rig rig;
    auto r1 = rig.add_remote( "r1" );
    rig.add_remote( "r2" );
    BOOST_REQUIRE( rig.psm.play_source("r1") );
    r1->set_stubborn( true );
    BOOST_TEST( rig.orch.ensure_exclusive_playback("r2") );
    BOOST_CHECK_EQUAL( rig.orch.active_source(), "r2" );
    BOOST_TEST( r1->playing() );
}

/// A collaborator cannot switch sources through update_playback_info.
///
BOOST_AUTO_TEST_CASE( update_ignores_foreign_source )
{
    Rig rig;
    rig.add_remote( "r1" );
    Playback_update upd {};
    upd.source = std::string("r1");
    upd.track_name = std::string("intruder");
    rig.orch.update_playback_info( upd );
    Playback_info pi = rig.orch.snapshot();
    BOOST_CHECK_EQUAL( pi.source, LOCAL_SOURCE );
    BOOST_CHECK_EQUAL( pi.track_name, "intruder" );
    BOOST_TEST( rig.events(Event_type::source_changed).empty() );
    auto tc = rig.events( Event_type::track_changed );
    BOOST_REQUIRE_EQUAL( tc.size(), 1u );
    BOOST_CHECK_EQUAL( tc[0].current, "intruder" );
}

/// The active plugin's self report refreshes the shared info.
///
BOOST_AUTO_TEST_CASE( plugin_report_refresh )
{
    Rig rig;
    auto r1 = rig.add_remote( "r1" );
    BOOST_REQUIRE( rig.psm.play_source("r1", {"song"}) );
    Playback_info pi = rig.orch.get_current_playback();
    BOOST_CHECK_EQUAL( pi.source, "r1" );
    BOOST_CHECK_EQUAL( pi.track_name, "song" );
    BOOST_CHECK_EQUAL( pi.state, PlayerState::Playing );
    r1->stop( Source_args{} );          // stopped behind our back
    pi = rig.orch.get_current_playback();
    BOOST_CHECK_EQUAL( pi.state, PlayerState::Paused );
}

/// Many threads switching sources at once never leave two sources
/// sounding.
///
BOOST_AUTO_TEST_CASE( concurrent_switching )
{
    Rig rig;
    auto r1 = rig.add_remote( "r1" );
    auto r2 = rig.add_remote( "r2" );
    rig.psm.load_playlist( {"a","b","c"} );
    const std::vector<std::string> names { LOCAL_SOURCE, "r1", "r2" };
    std::vector<std::thread> workers;
    for (unsigned t=0; t<4; ++t) {
        workers.emplace_back( [&rig,&names,t]{
                for (unsigned i=0; i<40; ++i) {
                    const std::string &n = names[(i + t) % names.size()];
                    if (i % 3) {
                        rig.psm.play_source( n );
                    } else {
                        rig.orch.ensure_exclusive_playback( n );
                    }
                }
            } );
    }
    for (auto &w : workers) w.join();
    BOOST_TEST( rig.speaker.peak.load() <= 1 );
    BOOST_TEST( rig.speaker.audible.load() <= 1 );
}

/// While playing, the info timestamp never goes backwards across
/// updates from the command path and from a reporting collaborator.
///
BOOST_AUTO_TEST_CASE( timestamp_monotonic )
{
    Rig rig;
    rig.psm.load_playlist( {"a","b","c"} );
    BOOST_REQUIRE( rig.psm.play() );
    auto last = rig.orch.snapshot().updated;
    std::atomic<bool> done {false};
    std::thread reporter( [&]{
            double pos = 0.0;
            while (not done) {
                Playback_update upd {};
                upd.position = (pos += 0.1);
                rig.orch.update_playback_info( upd );
            }
        } );
    for (int i=0; i < 200; ++i) {
        if (i % 50 == 0) rig.psm.next();
        Playback_info pi = rig.orch.snapshot();
        if (pi.state == PlayerState::Playing) {
            BOOST_TEST( (pi.updated >= last) );
            last = pi.updated;
        }
        std::this_thread::sleep_for( 1ms );
    }
    done = true;
    reporter.join();
    BOOST_CHECK_EQUAL( rig.psm.state(), PlayerState::Playing );
}
