#pragma once

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

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "source.hpp"
#include "registry.hpp"
#include "eventbus.hpp"
#include "navigator.hpp"

class Config;

/**
 * Playback_orchestrator
 *   Owns the active-source pointer and the shared Playback_info.  It
 * guarantees that at most one source is producing sound: before a new
 * source becomes active, a playing outgoing source is told to stop (or
 * pause) and is polled briefly for confirmation.  A source that does
 * not confirm is logged and the switch goes ahead anyway.
 *
 * Every change to Playback_info goes through update_playback_info,
 * which merges the change and publishes the resulting events.
 *
 * The mutex is recursive.  The state machine holds it (via lock())
 * across a whole command, and the calls it makes back in here take it
 * again.  The watchdog takes the same lock.
 *
 * Whether a source is playing is judged per source type: the local
 * source is always asked directly; plugins are asked at most once per
 * report_refresh_ms and their cached answer is used in between.
 */
class Playback_orchestrator : public Source_host, public Source_failover {
private:
    using Clock = std::chrono::steady_clock;
    struct Report {
        Source_status status {};
        Clock::time_point when {};
    };
    mutable std::recursive_mutex m_mutex {};
    Event_bus &m_bus;
    Source_registry &m_registry;
    Track_navigator &m_nav;
    std::string m_active { LOCAL_SOURCE };
    Playback_info m_info {};
    std::map<std::string,Report> m_reports {};
    unsigned m_stop_poll_attempts {5};
    std::chrono::milliseconds m_stop_poll { 50 };
    std::chrono::milliseconds m_report_refresh { 1000 };
    //
    void apply( const Playback_update& );
    boost::optional<Source_status> query( const spSource&, bool fresh );
    bool reports_playing( const spSource&, bool fresh );
    void quiesce( const spSource& );
public:
    Playback_orchestrator( Event_bus&, Source_registry&, Track_navigator& );
    Playback_orchestrator( const Playback_orchestrator& ) = delete;
    void operator=( Playback_orchestrator const& ) = delete;
    //
    std::unique_lock<std::recursive_mutex> lock() const;
    void configure( Config& );
    //
    bool ensure_exclusive_playback( const std::string& ) override;
    void update_playback_info( const Playback_update& ) override;
    Playback_info get_current_playback() override;
    boost::optional<Track_ref> navigate_track( Direction ) override;
    bool retire_source( const std::string&,
                        const std::function<bool()>& ) override;
    //
    std::string active_source() const;
    spSource active_handle() const;
    void force_local();
    bool is_playing( const std::string& );
    Playback_info snapshot() const;
};
