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

/// Some elementary definitions used in multiple sources...

#include <exception>
#include <iosfwd>
#include <string>
#include <vector>

/// Modes of the player at any given time:
///   Stopped : not playing anything right now
///   Playing : the active source is producing sound
///   Paused  : not producing sound, but may resume where interrupted
///
enum class PlayerState {
    Stopped,
    Playing,
    Paused
};

/// Printable name of a PlayerState
const char* state_name( PlayerState );
std::ostream& operator<<( std::ostream&, PlayerState );

/// Directions a track cursor can move
enum class Direction { next, prev };

/// Track references are pathnames (local) or opaque ids (plugins)
using Track_ref = std::string;

/// Arguments passed verbatim to a source transport verb
using Source_args = std::vector<std::string>;

/// Name of the default (always loaded) local source
constexpr const char* LOCAL_SOURCE { "local" };


/// Thrown on problems in the playback core. Specialized below.
///
struct Tunemux_exception : public std::exception {
    const char* what() const throw() { return "Generic tunemux exception"; }
};

/// An engine failed to start, stop, pause or resume.
struct Engine_error : public Tunemux_exception {
    const char* what() const throw() { return "Engine error"; }
};

/// The engine cannot play the requested track (missing, unsupported type).
struct Engine_format_error : public Engine_error {
    const char* what() const throw() { return "Unsupported or missing track"; }
};

/// The engine could not launch playback.
struct Engine_start_error : public Engine_error {
    const char* what() const throw() { return "Engine failed to start"; }
};

/// The engine would not pause, resume or stop.
struct Engine_control_error : public Engine_error {
    const char* what() const throw() { return "Engine control failure"; }
};

/// The operation targets a source that is not registered/loaded.
struct Source_unavailable : public Tunemux_exception {
    const char* what() const throw() { return "Source not available"; }
};

/// Navigation was attempted on an empty playlist.
struct Navigation_error : public Tunemux_exception {
    const char* what() const throw() { return "Playlist is empty"; }
};
