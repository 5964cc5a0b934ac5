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

#include "navigator.hpp"
#include "config.hpp"
#include "logging.hpp"


/// CTOR
///
Track_navigator::Track_navigator( Playlist &pl )
    : m_playlist(pl)
{
}

/// Configure from the "General" section: shuffle.
///
void Track_navigator::configure( Config &cfg )
{
    bool sh { false };
    if (cfg.get_bool( "General", "shuffle", sh )) {
        set_shuffle( sh );
    }
}

/// Fix the random sequence, for repeatable runs.
///
void Track_navigator::seed( unsigned s )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rng.seed( s );
}

/// Uniform random index in [0,n) other than avoid (n > 1).
/// Caller holds the lock.
///
size_t Track_navigator::random_other( size_t avoid, size_t n )
{
    if (n < 2) return 0;
    std::uniform_int_distribution<size_t> dist( 0, n-2 );
    size_t r = dist( m_rng );
    return (r >= avoid ? r+1 : r);
}

/// Clamp the cursor into [0,n) and refresh the precomputed neighbors.
/// In shuffle mode a still valid m_prev is kept.  Caller holds the lock.
///
void Track_navigator::recompute( size_t n )
{
    if (0 == n) {
        m_current = m_next = m_prev = 0;
        return;
    }
    if (m_current >= n) m_current = n-1;
    if (m_shuffle) {
        m_next = random_other( m_current, n );
        if (m_prev >= n) m_prev = (m_current + n - 1) % n;
    } else {
        m_next = (m_current + 1) % n;
        m_prev = (m_current + n - 1) % n;
    }
}

/// Move the cursor one step in direction dir and return the new
/// current track, or none if the playlist is empty.
///
/// * Will not throw
///
boost::optional<Track_ref> Track_navigator::navigate( Direction dir )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = m_playlist.size();
    if (0 == n) {
        LOG_WARNING(Lgr) << "Track_navigator: " << Navigation_error().what();
        m_current = m_next = m_prev = 0;
        return boost::none;
    }
    if (m_current >= n) m_current = n-1;
    const size_t old = m_current;
    if (not m_shuffle) {
        m_current = (dir == Direction::next ? (old + 1) % n : (old + n - 1) % n);
        recompute( n );
    } else if (dir == Direction::next) {
        size_t target = m_next;
        if ((target >= n) or ((target == old) and (n > 1))) {
            target = random_other( old, n );
        }
        m_current = target;
        m_prev = old;
        m_next = random_other( m_current, n );
    } else {
        size_t target = (m_prev < n ? m_prev : (old + n - 1) % n);
        m_current = target;
        m_prev = old;
        m_next = random_other( m_current, n );
    }
    LOG_DEBUG(Lgr) << "Track_navigator " << (dir==Direction::next ? "next" : "prev")
                   << ": " << old << " -> " << m_current << " of " << n;
    auto t = m_playlist.at( m_current );
    if (not t) {
        // shrank under us since size() was read
        return m_playlist.at( 0 );
    }
    return t;
}

/// Track at the cursor, or none if the playlist is empty.
///
boost::optional<Track_ref> Track_navigator::current() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = m_playlist.size();
    if (0 == n) return boost::none;
    return m_playlist.at( m_current < n ? m_current : n-1 );
}

/// Cursor positions clamped to the live playlist length.
///
Nav_cursor Track_navigator::cursor() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = m_playlist.size();
    Nav_cursor c {};
    c.shuffle = m_shuffle;
    if (n) {
        c.current = (m_current < n ? m_current : n-1);
        c.next = (m_next < n ? m_next : 0);
        c.prev = (m_prev < n ? m_prev : 0);
    }
    return c;
}

/// Place the cursor at index i.  Returns false if out of range.
///
bool Track_navigator::jump( size_t i )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = m_playlist.size();
    if (i >= n) return false;
    m_prev = m_current;
    m_current = i;
    recompute( n );
    return true;
}

/// Keep the cursor on the same track after the playlist entry at
/// index i was removed.
///
void Track_navigator::note_removed( size_t i )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if ((i < m_current) and (m_current > 0)) {
        --m_current;
    }
    if ((i < m_prev) and (m_prev > 0)) {
        --m_prev;
    }
    recompute( m_playlist.size() );
}

/// Back to the first track, e.g. after loading a new playlist.
///
void Track_navigator::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current = 0;
    m_prev = 0;
    recompute( m_playlist.size() );
}

void Track_navigator::set_shuffle( bool on )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shuffle = on;
    const size_t n = m_playlist.size();
    if (n) {
        // neighbors in the new mode; the playlist order is not changed
        if (m_current >= n) m_current = n-1;
        m_next = (on ? random_other(m_current, n) : (m_current + 1) % n);
        m_prev = (m_current + n - 1) % n;
    }
    LOG_INFO(Lgr) << "Shuffle " << (on ? "on" : "off");
}

bool Track_navigator::shuffle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shuffle;
}

/// Flip the shuffle mode and return the new setting.
///
bool Track_navigator::toggle_shuffle()
{
    bool on = not shuffle();
    set_shuffle( on );
    return on;
}
