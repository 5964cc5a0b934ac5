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

#include <string>
#include "common.hpp"

/// Kinds of events published on the Event_bus.
///
enum class Event_type {
    state_changed,      //! previous_state, new_state, source
    source_changed,     //! previous, current (source names)
    track_changed,      //! previous, current (track names)
    position_changed,   //! position, duration
    volume_changed      //! previous_volume, new_volume
};

/// Number of distinct Event_type values
constexpr unsigned N_EVENT_TYPES { 5 };

const char* event_name( Event_type );

/**
 * Event payload.  One flat value type carries every kind of event;
 * only the fields listed for its Event_type are meaningful.  Events
 * are copied to each subscriber, so handlers never share one.
 */
struct Event {
    Event_type type { Event_type::state_changed };
    PlayerState previous_state { PlayerState::Stopped };
    PlayerState new_state { PlayerState::Stopped };
    std::string previous {};
    std::string current {};
    std::string source {};
    double position {0.0};
    double duration {0.0};
    unsigned previous_volume {0};
    unsigned new_volume {0};
    //
    static Event state_changed( PlayerState, PlayerState, const std::string& );
    static Event source_changed( const std::string&, const std::string& );
    static Event track_changed( const std::string&, const std::string& );
    static Event position_changed( double, double );
    static Event volume_changed( unsigned, unsigned );
    //
    std::string describe() const;
};
