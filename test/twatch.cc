/// Test the Watchdog loop and end-of-track auto-advance
///
///    twatch  --log_level=all

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
#define BOOST_TEST_MODULE watchdog_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

#include "logging.hpp"
#include "watchdog.hpp"
#include "fake_sources.hpp"

using namespace std::chrono_literals;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("twatch","twatch_%2N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LogFixture);

/// Wait up to limit for pred to hold.
template <typename Pred>
static bool eventually( Pred pred, std::chrono::milliseconds limit=2000ms )
{
    auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for( 5ms );
    }
    return pred();
}

//////////////////////////////////////////////////////////////////////////

/// The engine going idle by itself advances to the next track, with
/// exactly one TRACK_CHANGED.
///
BOOST_AUTO_TEST_CASE( auto_advance )
{
    Rig rig;
    Watchdog wd { [&rig]{ return rig.psm.check_engine(); } };
    wd.set_interval( 10ms );
    rig.psm.load_playlist( {"a","b"} );
    BOOST_REQUIRE( rig.psm.play() );
    rig.bus.clear_journal();
    wd.start();
    std::this_thread::sleep_for( 50ms );
    BOOST_CHECK_EQUAL( wd.advances(), 0u );
    rig.engine->finish();
    BOOST_TEST( eventually([&rig]{ return rig.orch.snapshot().track_name == "b"; }) );
    std::this_thread::sleep_for( 50ms );
    BOOST_TEST( wd.stop() );
    BOOST_CHECK_EQUAL( wd.advances(), 1u );
    BOOST_CHECK_EQUAL( rig.psm.state(), PlayerState::Playing );
    BOOST_TEST( rig.engine->busy() );
    auto tc = rig.events( Event_type::track_changed );
    BOOST_REQUIRE_EQUAL( tc.size(), 1u );
    BOOST_CHECK_EQUAL( tc[0].previous, "a" );
    BOOST_CHECK_EQUAL( tc[0].current, "b" );
}

/// An explicit stop is not an end of track.
///
BOOST_AUTO_TEST_CASE( user_stop_not_advanced )
{
    Rig rig;
    Watchdog wd { [&rig]{ return rig.psm.check_engine(); } };
    wd.set_interval( 10ms );
    rig.psm.load_playlist( {"a","b"} );
    BOOST_REQUIRE( rig.psm.play() );
    wd.start();
    BOOST_REQUIRE( rig.psm.stop() );
    BOOST_REQUIRE( rig.psm.play() );
    BOOST_REQUIRE( rig.psm.pause() );
    std::this_thread::sleep_for( 100ms );
    BOOST_TEST( wd.stop() );
    BOOST_TEST( wd.ticks() > 2u );
    BOOST_CHECK_EQUAL( wd.advances(), 0u );
    BOOST_CHECK_EQUAL( rig.orch.snapshot().track_name, "a" );
    BOOST_CHECK_EQUAL( rig.psm.state(), PlayerState::Paused );
}

/// The watchdog does nothing while a plugin is active.
///
BOOST_AUTO_TEST_CASE( idle_for_plugins )
{
    Rig rig;
    rig.add_remote( "r1" );
    rig.psm.load_playlist( {"a","b"} );
    BOOST_REQUIRE( rig.psm.play() );
    BOOST_REQUIRE( rig.psm.play_source("r1") );
    BOOST_TEST( not rig.psm.check_engine() );
    BOOST_CHECK_EQUAL( rig.orch.active_source(), "r1" );
}

/// A failing check is logged and counted, and the loop keeps going.
///
BOOST_AUTO_TEST_CASE( check_failures_survive )
{
    std::atomic<int> calls {0};
    Watchdog wd { [&calls]() -> bool {
            if (++calls <= 2) throw std::runtime_error("engine query failed");
            return false; } };
    wd.set_interval( 5ms );
    wd.start();
    BOOST_TEST( eventually([&calls]{ return calls.load() > 5; }) );
    BOOST_TEST( wd.stop() );
    BOOST_CHECK_EQUAL( wd.failures(), 2u );
    BOOST_TEST( not wd.running() );
}

/// A check that will not return in time is abandoned after the join
/// timeout.
///
BOOST_AUTO_TEST_CASE( bounded_join )
{
    auto flag = std::make_shared<std::atomic<bool>>(false);
    Watchdog wd { [flag]{
            *flag = true;
            std::this_thread::sleep_for( 400ms );
            return false; } };
    wd.set_interval( 5ms );
    wd.set_join_timeout( 50ms );
    wd.start();
    BOOST_TEST( eventually([flag]{ return flag->load(); }) );
    auto t0 = std::chrono::steady_clock::now();
    BOOST_TEST( not wd.stop() );
    BOOST_TEST( (std::chrono::steady_clock::now() - t0 < 300ms) );
    std::this_thread::sleep_for( 500ms );   // let the abandoned loop end
}

/// After close() an abandoned loop is no longer inside its check and
/// never enters it again.
///
BOOST_AUTO_TEST_CASE( close_after_abandon )
{
    auto inside = std::make_shared<std::atomic<bool>>(false);
    auto calls = std::make_shared<std::atomic<int>>(0);
    Watchdog wd { [inside, calls]{
            *inside = true;
            ++*calls;
            std::this_thread::sleep_for( 200ms );
            *inside = false;
            return false; } };
    wd.set_interval( 1ms );
    wd.set_join_timeout( 20ms );
    wd.start();
    BOOST_TEST( eventually([inside]{ return inside->load(); }) );
    BOOST_TEST( not wd.stop() );
    wd.close();
    BOOST_TEST( not inside->load() );
    const int seen = calls->load();
    std::this_thread::sleep_for( 300ms );
    BOOST_CHECK_EQUAL( calls->load(), seen );
    BOOST_TEST( not inside->load() );
}
