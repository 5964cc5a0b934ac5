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

#include <sstream>
#include "events.hpp"


/// Printable name of a PlayerState
///
const char* state_name( PlayerState s )
{
    switch (s) {
    case PlayerState::Stopped:
        return "STOPPED";
    case PlayerState::Playing:
        return "PLAYING";
    case PlayerState::Paused:
        return "PAUSED";
    }
    return "UNKNOWN";
}

std::ostream& operator<<( std::ostream &os, PlayerState s )
{
    return os << state_name(s);
}

/// Printable name of an Event_type
///
const char* event_name( Event_type t )
{
    switch (t) {
    case Event_type::state_changed:
        return "STATE_CHANGED";
    case Event_type::source_changed:
        return "SOURCE_CHANGED";
    case Event_type::track_changed:
        return "TRACK_CHANGED";
    case Event_type::position_changed:
        return "POSITION_CHANGED";
    case Event_type::volume_changed:
        return "VOLUME_CHANGED";
    }
    return "UNKNOWN_EVENT";
}

Event Event::state_changed( PlayerState prev, PlayerState now,
                            const std::string &src )
{
    Event e {};
    e.type = Event_type::state_changed;
    e.previous_state = prev;
    e.new_state = now;
    e.source = src;
    return e;
}

Event Event::source_changed( const std::string &prev, const std::string &now )
{
    Event e {};
    e.type = Event_type::source_changed;
    e.previous = prev;
    e.current = now;
    e.source = now;
    return e;
}

Event Event::track_changed( const std::string &prev, const std::string &now )
{
    Event e {};
    e.type = Event_type::track_changed;
    e.previous = prev;
    e.current = now;
    return e;
}

Event Event::position_changed( double pos, double dur )
{
    Event e {};
    e.type = Event_type::position_changed;
    e.position = pos;
    e.duration = dur;
    return e;
}

Event Event::volume_changed( unsigned prev, unsigned now )
{
    Event e {};
    e.type = Event_type::volume_changed;
    e.previous_volume = prev;
    e.new_volume = now;
    return e;
}

/// One line summary for logs and the status display.
///
std::string Event::describe() const
{
    std::ostringstream oss;
    oss << event_name(type) << "{";
    switch (type) {
    case Event_type::state_changed:
        oss << state_name(previous_state) << "->" << state_name(new_state)
            << " source=" << source;
        break;
    case Event_type::source_changed:
    case Event_type::track_changed:
        oss << "'" << previous << "'->'" << current << "'";
        break;
    case Event_type::position_changed:
        oss << position << "/" << duration;
        break;
    case Event_type::volume_changed:
        oss << previous_volume << "->" << new_volume;
        break;
    }
    oss << "}";
    return oss.str();
}
