/// Test the Event_bus
///
///    tbus  --log_level=all

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
#define BOOST_TEST_MODULE bus_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "logging.hpp"
#include "eventbus.hpp"

using namespace std::chrono_literals;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("tbus","tbus_%2N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LogFixture);

//////////////////////////////////////////////////////////////////////////

/// A throwing subscriber must not keep the others from their events.
///
BOOST_AUTO_TEST_CASE( subscriber_isolation )
{
    Event_bus bus {2};
    std::atomic<int> got_a {0}, got_c {0};
    bus.subscribe( Event_type::track_changed,
                   [&](const Event&){ ++got_a; }, "a" );
    bus.subscribe( Event_type::track_changed,
                   [](const Event&){ throw std::runtime_error("b broke"); },
                   "b" );
    bus.subscribe( Event_type::track_changed,
                   [&](const Event&){ ++got_c; }, "c" );
    bus.publish( Event::track_changed("x","y") );
    bus.publish( Event::track_changed("y","z") );
    BOOST_TEST( bus.drain(2000ms) );
    BOOST_CHECK_EQUAL( got_a.load(), 2 );
    BOOST_CHECK_EQUAL( got_c.load(), 2 );
    BOOST_CHECK_EQUAL( bus.handler_errors(), 2u );
    BOOST_CHECK_EQUAL( bus.delivered(), 4u );
}

/// Events only reach subscribers of their own type.
///
BOOST_AUTO_TEST_CASE( delivery_by_type )
{
    Event_bus bus {2};
    std::atomic<int> vols {0}, states {0};
    bus.subscribe( Event_type::volume_changed,
                   [&](const Event &e){ if (e.new_volume == 40) ++vols; } );
    bus.subscribe( Event_type::state_changed,
                   [&](const Event&){ ++states; } );
    bus.publish( Event::volume_changed(20,40) );
    BOOST_TEST( bus.drain(2000ms) );
    BOOST_CHECK_EQUAL( vols.load(), 1 );
    BOOST_CHECK_EQUAL( states.load(), 0 );
}

/// One subscriber sees its events in publish order, even with several
/// workers.
///
BOOST_AUTO_TEST_CASE( per_subscriber_order )
{
    Event_bus bus {4};
    std::mutex mx;
    std::vector<unsigned> seen;
    bus.subscribe( Event_type::volume_changed, [&](const Event &e){
            std::lock_guard<std::mutex> lk(mx);
            seen.push_back( e.new_volume ); } );
    for (unsigned i=0; i<100; ++i) {
        bus.publish( Event::volume_changed(i, i+1) );
    }
    BOOST_TEST( bus.drain(3000ms) );
    std::lock_guard<std::mutex> lk(mx);
    BOOST_REQUIRE_EQUAL( seen.size(), 100u );
    for (unsigned i=0; i<100; ++i) {
        BOOST_CHECK_EQUAL( seen[i], i+1 );
    }
}

/// Handlers may publish, subscribe and unsubscribe from inside a
/// delivery without deadlock.
///
BOOST_AUTO_TEST_CASE( reentrant_handlers )
{
    Event_bus bus {2};
    std::atomic<int> positions {0};
    std::atomic<int> late {0};
    Subscription_id self {0};
    self = bus.subscribe( Event_type::state_changed, [&](const Event &e){
            bus.publish( Event::position_changed(1.0, 2.0) );
            bus.subscribe( Event_type::track_changed,
                           [&](const Event&){ ++late; } );
            bus.unsubscribe( Event_type::state_changed, self );
            (void)e; } );
    bus.subscribe( Event_type::position_changed,
                   [&](const Event&){ ++positions; } );
    bus.publish( Event::state_changed(PlayerState::Stopped,
                                      PlayerState::Playing, "local") );
    std::this_thread::sleep_for( 50ms );
    BOOST_TEST( bus.drain(2000ms) );
    BOOST_CHECK_EQUAL( positions.load(), 1 );
    BOOST_CHECK_EQUAL( bus.subscriber_count(Event_type::state_changed), 0u );
    BOOST_CHECK_EQUAL( bus.subscriber_count(Event_type::track_changed), 1u );
    bus.publish( Event::track_changed("a","b") );
    BOOST_TEST( bus.drain(2000ms) );
    BOOST_CHECK_EQUAL( late.load(), 1 );
}

/// After unsubscribe no new events are scheduled for the handler.
///
BOOST_AUTO_TEST_CASE( unsubscribe_stops_delivery )
{
    Event_bus bus {2};
    std::atomic<int> got {0};
    auto id = bus.subscribe( Event_type::track_changed,
                             [&](const Event&){ ++got; } );
    bus.publish( Event::track_changed("a","b") );
    BOOST_TEST( bus.drain(2000ms) );
    BOOST_TEST( bus.unsubscribe(Event_type::track_changed, id) );
    BOOST_TEST( not bus.unsubscribe(Event_type::track_changed, id) );
    bus.publish( Event::track_changed("b","c") );
    BOOST_TEST( bus.drain(2000ms) );
    BOOST_CHECK_EQUAL( got.load(), 1 );
}

/// publish() returns without waiting for a slow handler.
///
BOOST_AUTO_TEST_CASE( publish_does_not_block )
{
    Event_bus bus {1};
    std::atomic<bool> done {false};
    bus.subscribe( Event_type::track_changed, [&](const Event&){
            std::this_thread::sleep_for( 300ms );
            done = true; } );
    auto t0 = std::chrono::steady_clock::now();
    bus.publish( Event::track_changed("a","b") );
    auto dt = std::chrono::steady_clock::now() - t0;
    BOOST_TEST( (dt < 200ms) );
    BOOST_TEST( bus.drain(2000ms) );
    BOOST_TEST( done.load() );
}

/// The journal keeps the most recent events, bounded in size.
///
BOOST_AUTO_TEST_CASE( journal_bounded )
{
    Event_bus bus {1, 3};
    for (unsigned i=0; i<5; ++i) {
        bus.publish( Event::volume_changed(i, i+1) );
    }
    auto j = bus.journal();
    BOOST_REQUIRE_EQUAL( j.size(), 3u );
    BOOST_CHECK_EQUAL( j.front().new_volume, 3u );
    BOOST_CHECK_EQUAL( j.back().new_volume, 5u );
    BOOST_CHECK_EQUAL( bus.published(), 5u );
    bus.clear_journal();
    BOOST_TEST( bus.journal().empty() );
}

/// Events published after shutdown are journaled but not delivered.
///
BOOST_AUTO_TEST_CASE( shutdown_drops_deliveries )
{
    Event_bus bus {2};
    std::atomic<int> got {0};
    bus.subscribe( Event_type::track_changed, [&](const Event&){ ++got; } );
    bus.publish( Event::track_changed("a","b") );
    bus.shutdown( 2000ms );
    BOOST_CHECK_EQUAL( got.load(), 1 );
    bus.publish( Event::track_changed("b","c") );
    BOOST_CHECK_EQUAL( got.load(), 1 );
    BOOST_CHECK_EQUAL( bus.journal().size(), 2u );
}
