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

#include <algorithm>

#include "playerstate.hpp"
#include "orchestrator.hpp"
#include "registry.hpp"
#include "navigator.hpp"
#include "playlist.hpp"
#include "logging.hpp"


Player_state::~Player_state()
{
}

////////////////////////////////// STOPPED ////////////////////////////////

bool Stopped_state::play( const Source_args &args )
{
    return m_psm.start_current( args );
}

bool Stopped_state::pause()
{
    m_psm.report( "cannot pause: stopped" );
    return false;
}

bool Stopped_state::stop()
{
    return true;
}

/// Stage the next track without making a sound.
bool Stopped_state::next_track()
{
    return m_psm.step( Direction::next, false );
}

bool Stopped_state::previous_track()
{
    return m_psm.step( Direction::prev, false );
}

////////////////////////////////// PLAYING ////////////////////////////////

/// Already playing: a bare play is a no-op; play with arguments
/// restarts with them.
bool Playing_state::play( const Source_args &args )
{
    if (args.empty()) {
        return true;
    }
    m_psm.stop_active();
    return m_psm.start_current( args );
}

bool Playing_state::pause()
{
    return m_psm.pause_active();
}

bool Playing_state::stop()
{
    return m_psm.stop_active();
}

bool Playing_state::next_track()
{
    return m_psm.step( Direction::next, true );
}

bool Playing_state::previous_track()
{
    return m_psm.step( Direction::prev, true );
}

////////////////////////////////// PAUSED /////////////////////////////////

bool Paused_state::play( const Source_args &args )
{
    if (args.empty()) {
        return m_psm.resume_active();
    }
    m_psm.stop_active();
    return m_psm.start_current( args );
}

bool Paused_state::pause()
{
    m_psm.report( "already paused" );
    return true;
}

bool Paused_state::stop()
{
    return m_psm.stop_active();
}

bool Paused_state::next_track()
{
    return m_psm.step( Direction::next, true );
}

bool Paused_state::previous_track()
{
    return m_psm.step( Direction::prev, true );
}

///////////////////////////// Player_state_machine ////////////////////////

/// CTOR
///
Player_state_machine::Player_state_machine( Playback_orchestrator &orch,
                                            Source_registry &reg,
                                            Track_navigator &nav,
                                            Playlist &pl,
                                            spLocal local )
    : m_orch(orch), m_registry(reg), m_nav(nav), m_playlist(pl),
      m_local(local)
{
}

/// State object for the current PlayerState.
///
Player_state& Player_state_machine::current()
{
    switch (m_orch.snapshot().state) {
    case PlayerState::Playing:
        return m_playing;
    case PlayerState::Paused:
        return m_paused;
    case PlayerState::Stopped:
        break;
    }
    return m_stopped;
}

/// Record a user visible message and log it.
///
void Player_state_machine::report( const std::string &msg, bool error )
{
    if (error) {
        LOG_ERROR(Lgr) << msg;
    } else {
        LOG_INFO(Lgr) << msg;
    }
    std::lock_guard<std::mutex> lock(m_msg_mutex);
    m_message = msg;
}

std::string Player_state_machine::last_message() const
{
    std::lock_guard<std::mutex> lock(m_msg_mutex);
    return m_message;
}

/// Run a command under the orchestrator lock; anything it throws is
/// reported and leaves the player STOPPED.
///
bool Player_state_machine::guarded( const char *what,
                                    const std::function<bool()> &fn )
{
    auto lk = m_orch.lock();
    try {
        return fn();
    }
    catch (std::exception &ex) {
        report( std::string(what) + " failed: " + ex.what(), true );
        set_stopped();
        return false;
    }
}

/// Force STOPPED after a failure.  Will not throw.
///
void Player_state_machine::set_stopped()
{
    try {
        if (m_orch.active_source() == LOCAL_SOURCE) {
            m_local->halt();
        }
        Playback_update upd {};
        upd.state = PlayerState::Stopped;
        upd.position = 0.0;
        m_orch.update_playback_info( upd );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "Could not reset player state: " << ex.what();
    }
}

/// Start the current track on the active source: for local, the
/// navigator's current track; for a plugin, its play verb with args.
///
bool Player_state_machine::start_current( const Source_args &args )
{
    const std::string act = m_orch.active_source();
    if (act == LOCAL_SOURCE) {
        auto track = m_nav.current();
        if (not track) {
            report( std::string("cannot play: ") + Navigation_error().what() );
            return false;
        }
        try {
            m_local->start( *track );
        }
        catch (Engine_error &ex) {
            report( "cannot play " + *track + ": " + ex.what(), true );
            Playback_update upd {};
            upd.state = PlayerState::Stopped;
            upd.track_name = *track;
            upd.position = 0.0;
            upd.duration = 0.0;
            m_orch.update_playback_info( upd );
            return false;
        }
        Playback_update upd {};
        upd.state = PlayerState::Playing;
        upd.track_name = *track;
        upd.track_started = true;
        upd.position = 0.0;
        upd.duration = m_local->duration();
        m_orch.update_playback_info( upd );
        report( "playing " + *track );
        return true;
    }
    spSource src = m_registry.find( act );
    if (not src) {
        report( act + ": " + Source_unavailable().what(), true );
        m_orch.force_local();
        return false;
    }
    if (not m_registry.has_cap( act, Cap_play )) {
        report( act + " cannot play" );
        return false;
    }
    if (not src->play( args )) {
        report( act + " failed to play", true );
        set_stopped();
        return false;
    }
    Playback_update upd {};
    upd.state = PlayerState::Playing;
    upd.position = 0.0;
    m_orch.update_playback_info( upd );
    report( "playing on " + act );
    return true;
}

/// Pause the active source.  A plugin that cannot pause but can stop
/// is stopped instead.
///
bool Player_state_machine::pause_active()
{
    const std::string act = m_orch.active_source();
    Playback_update upd {};
    if (act == LOCAL_SOURCE) {
        try {
            m_local->suspend();
        }
        catch (Engine_error &ex) {
            report( std::string("cannot pause: ") + ex.what(), true );
            if (not m_local->busy()) set_stopped();
            return false;
        }
        upd.state = PlayerState::Paused;
        upd.position = m_local->elapsed();
        m_orch.update_playback_info( upd );
        report( "paused" );
        return true;
    }
    spSource src = m_registry.find( act );
    if (src and m_registry.has_cap( act, Cap_pause )) {
        if (not src->pause( Source_args{} )) {
            report( act + " failed to pause", true );
            return false;
        }
        upd.state = PlayerState::Paused;
        m_orch.update_playback_info( upd );
        report( "paused" );
        return true;
    }
    if (src and m_registry.has_cap( act, Cap_stop )) {
        report( act + " cannot pause; stopping instead" );
        return stop_active();
    }
    report( act + " can neither pause nor stop" );
    return false;
}

/// Resume after pause.  For local, the engine continues and the
/// elapsed-time baseline skips the paused interval.
///
bool Player_state_machine::resume_active()
{
    const std::string act = m_orch.active_source();
    Playback_update upd {};
    if (act == LOCAL_SOURCE) {
        if (not m_local->paused()) {
            return start_current( Source_args{} );
        }
        try {
            m_local->resume();
        }
        catch (Engine_error &ex) {
            report( std::string("cannot resume: ") + ex.what(), true );
            set_stopped();
            return false;
        }
        upd.state = PlayerState::Playing;
        upd.position = m_local->elapsed();
        m_orch.update_playback_info( upd );
        report( "resumed" );
        return true;
    }
    spSource src = m_registry.find( act );
    if (not src or not m_registry.has_cap( act, Cap_play )) {
        report( act + " cannot resume" );
        return false;
    }
    if (not src->play( Source_args{} )) {
        report( act + " failed to resume", true );
        return false;
    }
    upd.state = PlayerState::Playing;
    m_orch.update_playback_info( upd );
    report( "resumed" );
    return true;
}

/// Stop the active source.  Always ends STOPPED; a source that will not
/// stop is reported.
///
bool Player_state_machine::stop_active()
{
    const std::string act = m_orch.active_source();
    if (act == LOCAL_SOURCE) {
        m_local->halt();
    } else {
        spSource src = m_registry.find( act );
        bool ok = false;
        if (src and m_registry.has_cap( act, Cap_stop )) {
            ok = src->stop( Source_args{} );
        } else if (src and m_registry.has_cap( act, Cap_pause )) {
            ok = src->pause( Source_args{} );
        }
        if (not ok) {
            LOG_WARNING(Lgr) << act << " did not acknowledge stop";
        }
    }
    Playback_update upd {};
    upd.state = PlayerState::Stopped;
    upd.position = 0.0;
    m_orch.update_playback_info( upd );
    report( "stopped" );
    return true;
}

/// Move one track in dir.  A plugin does its own track navigation.
/// For local: if audible, stop, move the cursor, and play the new
/// track; otherwise only move the cursor and stage the track.
///
bool Player_state_machine::step( Direction dir, bool audible )
{
    const char *dname = (dir == Direction::next ? "next" : "prev");
    const std::string act = m_orch.active_source();
    if (act != LOCAL_SOURCE) {
        const Source_cap cap = (dir == Direction::next ? Cap_next : Cap_prev);
        spSource src = m_registry.find( act );
        if (not src or not m_registry.has_cap( act, cap )) {
            report( act + " cannot skip tracks" );
            return false;
        }
        bool ok = (dir == Direction::next ? src->next( Source_args{} )
                                          : src->prev( Source_args{} ));
        if (not ok) {
            report( act + " failed to skip " + dname, true );
        }
        return ok;
    }
    if (audible) {
        m_local->halt();
    }
    auto track = m_nav.navigate( dir );
    if (not track) {
        report( std::string("cannot skip ") + dname + ": "
                + Navigation_error().what() );
        if (audible) set_stopped();
        return false;
    }
    if (not audible) {
        Playback_update upd {};
        upd.track_name = *track;
        upd.position = 0.0;
        upd.duration = 0.0;
        m_orch.update_playback_info( upd );
        report( std::string(dname) + " track " + *track );
        return true;
    }
    return start_current( Source_args{} );
}

//////////////////////////////// Commands /////////////////////////////////

bool Player_state_machine::play( const Source_args &args )
{
    return guarded( "play", [&]{ return current().play(args); } );
}

bool Player_state_machine::pause()
{
    return guarded( "pause", [&]{ return current().pause(); } );
}

bool Player_state_machine::stop()
{
    return guarded( "stop", [&]{ return current().stop(); } );
}

bool Player_state_machine::next()
{
    return guarded( "next", [&]{ return current().next_track(); } );
}

bool Player_state_machine::prev()
{
    return guarded( "prev", [&]{ return current().previous_track(); } );
}

/// Make name the active source (silencing any other) and play on it.
///
bool Player_state_machine::play_source( const std::string &name,
                                        const Source_args &args )
{
    return guarded( "play_source", [&]{
            if (not m_orch.ensure_exclusive_playback( name )) {
                report( name + ": " + Source_unavailable().what(), true );
                return false;
            }
            return current().play( args );
        } );
}

/// Make name the active source without starting it.
///
bool Player_state_machine::select_source( const std::string &name )
{
    return guarded( "select_source", [&]{
            if (not m_orch.ensure_exclusive_playback( name )) {
                report( name + ": " + Source_unavailable().what(), true );
                return false;
            }
            report( "source " + name );
            return true;
        } );
}

/// Route "<source> <verb> [args]": play switches to the source; the
/// other transport verbs apply only to the active source.
///
bool Player_state_machine::source_command( const std::string &name,
                                           const std::string &verb,
                                           const Source_args &args )
{
    if (verb == "play") {
        return play_source( name, args );
    }
    if (verb == "select") {
        return select_source( name );
    }
    if (not m_registry.is_loaded( name )) {
        report( name + ": " + Source_unavailable().what() );
        return false;
    }
    if (m_orch.active_source() != name) {
        report( name + " is not the active source" );
        return false;
    }
    if (verb == "pause") return pause();
    if (verb == "stop")  return stop();
    if (verb == "next")  return next();
    if (verb == "prev")  return prev();
    if ((verb == "volume") and not args.empty()) {
        try {
            return set_volume( static_cast<unsigned>(std::stoul(args.front())) );
        }
        catch (std::exception&) {
            report( "volume must be a number 0-100" );
            return false;
        }
    }
    report( "unknown command " + verb + " for " + name );
    return false;
}

/// Set the volume of the active source; on success the level is
/// recorded and VOLUME_CHANGED published.
///
bool Player_state_machine::set_volume( unsigned level )
{
    level = std::min( level, 100u );
    return guarded( "volume", [&]{
            const std::string act = m_orch.active_source();
            spSource src = m_registry.find( act );
            if (not src or not m_registry.has_cap( act, Cap_volume )) {
                report( act + " cannot set volume" );
                return false;
            }
            if (not src->set_volume( level )) {
                report( act + " failed to set volume", true );
                return false;
            }
            Playback_update upd {};
            upd.volume = level;
            m_orch.update_playback_info( upd );
            report( "volume " + std::to_string(level) );
            return true;
        } );
}

/// Flip shuffle mode; returns the new setting.
///
bool Player_state_machine::toggle_shuffle()
{
    bool on = m_nav.toggle_shuffle();
    report( std::string("shuffle ") + (on ? "on" : "off") );
    return on;
}

/// Replace the playlist.  Local playback stops and the cursor returns
/// to the first track, which is staged.
///
bool Player_state_machine::load_playlist( const std::vector<Track_ref> &tracks,
                                          const std::string &name )
{
    return guarded( "load", [&]{
            const bool local = (m_orch.active_source() == LOCAL_SOURCE);
            if (local and (m_orch.snapshot().state != PlayerState::Stopped)) {
                stop_active();
            }
            m_playlist.replace( tracks, name );
            m_nav.reset();
            auto first = m_nav.current();
            if (local and first) {
                Playback_update upd {};
                upd.track_name = *first;
                upd.position = 0.0;
                upd.duration = 0.0;
                m_orch.update_playback_info( upd );
            }
            report( "playlist " + (name.empty() ? std::string("(unnamed)") : name)
                    + " has " + std::to_string(tracks.size()) + " track(s)" );
            return not tracks.empty();
        } );
}

bool Player_state_machine::load_playlist_file( const boost::filesystem::path &p )
{
    std::vector<Track_ref> tracks {};
    std::string name {};
    try {
        tracks = Playlist::load_list_file( p, name );
    }
    catch (Playlist_file_error &ex) {
        report( std::string(ex.what()) + ": " + p.string(), true );
        return false;
    }
    return load_playlist( tracks, name );
}

bool Player_state_machine::add_track( const Track_ref &t )
{
    return guarded( "add", [&]{
            const bool was_empty = m_playlist.empty();
            m_playlist.append( t );
            if (was_empty) {
                m_nav.reset();
            }
            report( "added " + t );
            return true;
        } );
}

/// Remove the track at index i.  Removing the track that is playing
/// on the local source stops it first.
///
bool Player_state_machine::remove_track( size_t i )
{
    return guarded( "remove", [&]{
            if (i >= m_playlist.size()) {
                report( "no track at index " + std::to_string(i) );
                return false;
            }
            if ((m_orch.active_source() == LOCAL_SOURCE)
                and (m_nav.cursor().current == i)
                and (m_orch.snapshot().state != PlayerState::Stopped)) {
                stop_active();
            }
            if (not m_playlist.remove( i )) {
                return false;
            }
            m_nav.note_removed( i );
            report( "removed track " + std::to_string(i) );
            return true;
        } );
}

/// Make playlist entry i the current track.  If local is sounding the
/// new track starts at once; otherwise it is only staged.
///
bool Player_state_machine::select_track( size_t i )
{
    return guarded( "select", [&]{
            if (not m_nav.jump( i )) {
                report( "no track at index " + std::to_string(i) );
                return false;
            }
            if (m_orch.active_source() != LOCAL_SOURCE) {
                report( "track " + std::to_string(i) + " is next for local" );
                return true;
            }
            if (m_orch.snapshot().state != PlayerState::Stopped) {
                m_local->halt();
                return start_current( Source_args{} );
            }
            auto track = m_nav.current();
            Playback_update upd {};
            upd.track_name = *track;
            upd.position = 0.0;
            upd.duration = 0.0;
            m_orch.update_playback_info( upd );
            report( "selected track " + *track );
            return true;
        } );
}

/// One watchdog tick.  If local is active and PLAYING, and the engine
/// was started but has gone idle without being told to stop, the track
/// ended by itself: advance and play the next one.  Returns true if
/// it advanced.
///
bool Player_state_machine::check_engine()
{
    auto lk = m_orch.lock();
    try {
        if (m_orch.active_source() != LOCAL_SOURCE) return false;
        if (m_orch.snapshot().state != PlayerState::Playing) return false;
        if (not m_local->armed() or m_local->busy()) return false;
        LOG_INFO(Lgr) << "Track finished: " << m_local->track();
        m_local->halt();
        Playback_update upd {};
        upd.state = PlayerState::Stopped;
        upd.position = 0.0;
        m_orch.update_playback_info( upd );
        if (not m_nav.navigate( Direction::next )) {
            report( std::string("cannot advance: ") + Navigation_error().what() );
            return false;
        }
        return m_stopped.play( Source_args{} );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "Watchdog check failed: " << ex.what();
        return false;
    }
}

PlayerState Player_state_machine::state()
{
    return m_orch.snapshot().state;
}

/// Playback info (refreshed from the active source) plus playlist,
/// cursor, and plugin counts.
///
Player_status Player_state_machine::get_status()
{
    Player_status st {};
    st.info = m_orch.get_current_playback();
    st.playlist_size = m_playlist.size();
    Nav_cursor c = m_nav.cursor();
    st.cursor = c.current;
    st.shuffle = c.shuffle;
    st.plugins_available = m_registry.available_count();
    size_t loaded = m_registry.loaded_count();
    if (m_registry.is_loaded( LOCAL_SOURCE ) and loaded) --loaded;
    st.plugins_loaded = loaded;
    return st;
}
