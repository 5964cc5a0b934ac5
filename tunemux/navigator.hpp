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

#include <mutex>
#include <random>
#include <boost/optional.hpp>

#include "common.hpp"
#include "playlist.hpp"

class Config;

/// Cursor positions, for display and tests.
struct Nav_cursor {
    size_t current {0};
    size_t next {0};
    size_t prev {0};
    bool shuffle {false};
};

/**
 * Track_navigator
 *   Keeps the (current, next, prev) cursor over a live Playlist.  The
 * playlist length is re-read on every call and indices are clamped,
 * so a playlist that shrank between calls never causes an out of
 * range access.
 *
 * Sequential mode steps by one, modulo the length.  Shuffle mode picks
 * the next index uniformly among all but the current one; prev returns
 * to the index that was current before the last move.  Only one level
 * of shuffle history is kept: repeated prev calls alternate between
 * two tracks.
 *
 * Called from both the command path and the watchdog.
 */
class Track_navigator {
private:
    mutable std::mutex m_mutex {};
    Playlist &m_playlist;
    size_t m_current {0};
    size_t m_next {0};
    size_t m_prev {0};
    bool m_shuffle {false};
    std::mt19937 m_rng { std::random_device{}() };
    //
    void recompute( size_t );
    size_t random_other( size_t, size_t );
public:
    explicit Track_navigator( Playlist& );
    Track_navigator( const Track_navigator& ) = delete;
    void operator=( Track_navigator const& ) = delete;
    //
    void configure( Config& );
    boost::optional<Track_ref> navigate( Direction );
    boost::optional<Track_ref> current() const;
    Nav_cursor cursor() const;
    bool jump( size_t );
    void note_removed( size_t );
    void reset();
    void seed( unsigned );
    void set_shuffle( bool );
    bool shuffle() const;
    bool toggle_shuffle();
};
