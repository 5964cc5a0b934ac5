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
#include <string>
#include <boost/optional.hpp>
#include "common.hpp"

/**
 * The single shared record of what is playing.  Components never
 * modify one of these in place; they submit a Playback_update to the
 * orchestrator, which merges it and publishes the resulting events.
 */
struct Playback_info {
    std::string source { LOCAL_SOURCE };
    std::string track_name {};
    std::string artist {};
    std::string album {};
    std::string genre {};
    double position {0.0};              // seconds
    double duration {0.0};              // seconds, 0 if unknown
    PlayerState state { PlayerState::Stopped };
    unsigned volume {0};                // 0..100
    std::chrono::steady_clock::time_point updated {};
};

/**
 * A partial update to Playback_info: only fields that are set take
 * effect.  A started track is announced even when its name did not
 * change, e.g. replaying the track that was stopped.
 */
struct Playback_update {
    boost::optional<std::string> source {};
    boost::optional<std::string> track_name {};
    boost::optional<std::string> artist {};
    boost::optional<std::string> album {};
    boost::optional<std::string> genre {};
    boost::optional<double> position {};
    boost::optional<double> duration {};
    boost::optional<PlayerState> state {};
    boost::optional<unsigned> volume {};
    bool track_started {false};
};

/// What a source reports about its own playback, if it can tell.
///
struct Source_status {
    std::string track_name {};
    std::string artist {};
    std::string album {};
    double position {0.0};
    double duration {0.0};
    bool is_playing {false};
};

/// Status summary for display: playback plus navigation and plugin
/// bookkeeping.
///
struct Player_status {
    Playback_info info {};
    size_t playlist_size {0};
    size_t cursor {0};
    bool shuffle {false};
    size_t plugins_loaded {0};
    size_t plugins_available {0};
};
