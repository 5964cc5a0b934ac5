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

#include "localsource.hpp"
#include "logging.hpp"


/// CTOR
///
Local_source::Local_source( spEngine engine )
    : Source(LOCAL_SOURCE), m_engine(engine)
{
}

Cap_set Local_source::capabilities() const
{
    return Cap_play|Cap_pause|Cap_stop|Cap_volume|Cap_query|Cap_shutdown;
}

/// Start track from the beginning.
///
/// * May throw Engine_error
///
void Local_source::start( const Track_ref &track )
{
    m_armed = false;
    m_paused = false;
    m_engine->start( track );
    m_track = track;
    m_duration = m_engine->duration( track );
    m_start = Clock::now();
    m_armed = true;
}

/// Pause the engine and freeze the elapsed position.
///
/// * May throw Engine_control_error
///
void Local_source::suspend()
{
    if (m_paused or not m_armed) return;
    m_engine->pause();
    m_pause_at = Clock::now();
    m_paused = true;
    m_armed = false;
}

/// Resume the engine; the start baseline moves forward by the time
/// spent paused.
///
/// * May throw Engine_control_error
///
void Local_source::resume()
{
    if (not m_paused) return;
    m_engine->resume();
    m_start += (Clock::now() - m_pause_at);
    m_paused = false;
    m_armed = true;
}

/// Stop the engine and clear position tracking.  The track name is
/// kept so that the next start can report what changed.
///
/// * Will not throw
///
void Local_source::halt()
{
    m_armed = false;
    m_paused = false;
    m_engine->stop();
    m_start = Clock::time_point {};
}

/// Engine has a track loaded (playing or paused).
///
bool Local_source::busy()
{
    return m_engine->busy();
}

/// Seconds of audio played so far in the current track.
///
double Local_source::elapsed() const
{
    using fsecs = std::chrono::duration<double>;
    if (m_paused) {
        return fsecs(m_pause_at - m_start).count();
    }
    if (m_armed) {
        return fsecs(Clock::now() - m_start).count();
    }
    return 0.0;
}

/// play: with a track argument start it; otherwise resume if paused.
///
bool Local_source::play( const Source_args &args )
{
    try {
        if (not args.empty()) {
            start( args.front() );
        } else if (m_paused) {
            resume();
        } else if (not m_track.empty() and not m_armed) {
            start( m_track );
        }
        return m_armed;
    }
    catch (Engine_error &ex) {
        LOG_WARNING(Lgr) << "Local_source play: " << ex.what();
        return false;
    }
}

bool Local_source::pause( const Source_args& )
{
    try {
        suspend();
        return true;
    }
    catch (Engine_error &ex) {
        LOG_WARNING(Lgr) << "Local_source pause: " << ex.what();
        return false;
    }
}

bool Local_source::stop( const Source_args& )
{
    halt();
    return true;
}

bool Local_source::set_volume( unsigned level )
{
    return m_engine->set_volume( level );
}

/// Live report straight from the engine.
///
boost::optional<Source_status> Local_source::get_current_playback()
{
    Source_status st {};
    st.track_name = m_track;
    st.position = elapsed();
    st.duration = m_duration;
    st.is_playing = (m_armed and m_engine->busy());
    return st;
}

void Local_source::on_shutdown()
{
    halt();
}
