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
#include <thread>
#include <vector>

#include "orchestrator.hpp"
#include "config.hpp"
#include "logging.hpp"


/// CTOR
///
Playback_orchestrator::Playback_orchestrator( Event_bus &bus,
                                              Source_registry &reg,
                                              Track_navigator &nav )
    : m_bus(bus), m_registry(reg), m_nav(nav)
{
    m_info.updated = Clock::now();
}

/// Hold the orchestrator lock for a compound operation.
///
std::unique_lock<std::recursive_mutex> Playback_orchestrator::lock() const
{
    return std::unique_lock<std::recursive_mutex>( m_mutex );
}

/// Configure from the "Orchestrator" section:
///   stop_poll_attempts - how many times to check an outgoing source
///   stop_poll_ms       - interval between those checks
///   report_refresh_ms  - how long a plugin's self-report stays fresh
/// and the initial volume from General.default_volume.
///
void Playback_orchestrator::configure( Config &cfg )
{
    constexpr const char *Section { "Orchestrator" };
    std::chrono::milliseconds poll { m_stop_poll };
    std::chrono::milliseconds refresh { m_report_refresh };
    unsigned attempts { m_stop_poll_attempts };
    cfg.get_unsigned( Section, "stop_poll_attempts", attempts );
    cfg.get_millis( Section, "stop_poll_ms", poll );
    cfg.get_millis( Section, "report_refresh_ms", refresh );
    unsigned volume { m_info.volume };
    cfg.get_unsigned( "General", "default_volume", volume );
    //
    auto lk = lock();
    m_stop_poll_attempts = attempts;
    m_stop_poll = poll;
    m_report_refresh = refresh;
    m_info.volume = std::min( volume, 100u );
}

/// Merge upd into m_info and publish what changed: SOURCE_CHANGED,
/// STATE_CHANGED, TRACK_CHANGED (only to a non-empty track, and once
/// per started track),
/// VOLUME_CHANGED, and POSITION_CHANGED when a position was given.
/// Caller holds the lock.
///
void Playback_orchestrator::apply( const Playback_update &upd )
{
    const Playback_info before = m_info;
    if (upd.source)     m_info.source = *upd.source;
    if (upd.track_name) m_info.track_name = *upd.track_name;
    if (upd.artist)     m_info.artist = *upd.artist;
    if (upd.album)      m_info.album = *upd.album;
    if (upd.genre)      m_info.genre = *upd.genre;
    if (upd.position)   m_info.position = *upd.position;
    if (upd.duration)   m_info.duration = *upd.duration;
    if (upd.state)      m_info.state = *upd.state;
    if (upd.volume)     m_info.volume = *upd.volume;
    auto now = Clock::now();
    if (now > m_info.updated) m_info.updated = now;
    //
    std::vector<Event> events {};
    if (m_info.source != before.source) {
        events.push_back( Event::source_changed(before.source, m_info.source) );
    }
    if (m_info.state != before.state) {
        events.push_back( Event::state_changed(before.state, m_info.state,
                                               m_info.source) );
    }
    if (((m_info.track_name != before.track_name) or upd.track_started)
        and not m_info.track_name.empty()) {
        events.push_back( Event::track_changed(before.track_name,
                                               m_info.track_name) );
    }
    if (m_info.volume != before.volume) {
        events.push_back( Event::volume_changed(before.volume, m_info.volume) );
    }
    if (upd.position and ((m_info.position != before.position)
                          or (m_info.duration != before.duration))) {
        events.push_back( Event::position_changed(m_info.position,
                                                  m_info.duration) );
    }
    for (const auto &e : events) {
        LOG_DEBUG(Lgr) << "Orchestrator " << e.describe();
        m_bus.publish( e );
    }
}

/// Merge fields reported by a collaborator.  The source field is only
/// honored if it names the active source; switching sources is done by
/// ensure_exclusive_playback alone.
///
/// * Will not throw except on allocation failure
///
void Playback_orchestrator::update_playback_info( const Playback_update &upd )
{
    auto lk = lock();
    if (upd.source and (*upd.source != m_active)) {
        LOG_WARNING(Lgr) << "Orchestrator ignoring source '" << *upd.source
                         << "' in update; active is " << m_active;
        Playback_update copy { upd };
        copy.source = boost::none;
        apply( copy );
        return;
    }
    apply( upd );
}

/// Ask src for its status.  The local source is always asked; other
/// sources are asked if fresh is set or the cached report is stale.
/// Caller holds the lock.
///
boost::optional<Source_status>
Playback_orchestrator::query( const spSource &src, bool fresh )
{
    const std::string &name = src->name();
    if (not m_registry.has_cap( name, Cap_query )) {
        return boost::none;
    }
    auto now = Clock::now();
    auto it = m_reports.find(name);
    const bool local = (name == LOCAL_SOURCE);
    if (not local and not fresh and (it != m_reports.end())
        and ((now - it->second.when) < m_report_refresh)) {
        return it->second.status;
    }
    boost::optional<Source_status> st {};
    try {
        st = src->get_current_playback();
    }
    catch (std::exception &ex) {
        LOG_WARNING(Lgr) << "Orchestrator query of " << name << " failed: "
                         << ex.what();
        return boost::none;
    }
    if (st and not local) {
        m_reports[name] = Report{ *st, now };
    }
    return st;
}

/// Does src appear to be producing sound?  Its own report counts, and
/// so does m_info if src is the active source.  Caller holds the lock.
///
bool Playback_orchestrator::reports_playing( const spSource &src, bool fresh )
{
    auto st = query( src, fresh );
    if (st and st->is_playing) return true;
    if (src->name() == LOCAL_SOURCE and st) {
        return false;           // the engine is the authority
    }
    return (src->name() == m_active) and (m_info.state == PlayerState::Playing);
}

/// Stop (preferred) or pause src, then poll a bounded number of times
/// for it to stop producing sound.  Never fails: an unconfirmed stop is
/// logged and the caller proceeds.  Caller holds the lock.
///
void Playback_orchestrator::quiesce( const spSource &src )
{
    const std::string &name = src->name();
    bool ok = false;
    try {
        if (m_registry.has_cap( name, Cap_stop )) {
            ok = src->stop( Source_args{} );
        } else if (m_registry.has_cap( name, Cap_pause )) {
            ok = src->pause( Source_args{} );
        } else {
            LOG_WARNING(Lgr) << "Orchestrator: " << name
                             << " can be neither stopped nor paused";
        }
    }
    catch (std::exception &ex) {
        LOG_WARNING(Lgr) << "Orchestrator stopping " << name << ": "
                         << ex.what();
    }
    if (ok) {
        auto it = m_reports.find(name);
        if (it != m_reports.end()) it->second.status.is_playing = false;
    }
    for (unsigned i=0; i < m_stop_poll_attempts; ++i) {
        auto st = query( src, true );
        if (not st) {
            if (ok) return;     // no way to check; trust the verb
        } else if (not st->is_playing) {
            return;
        }
        std::this_thread::sleep_for( m_stop_poll );
    }
    LOG_WARNING(Lgr) << "Orchestrator: " << name
                     << " did not confirm it stopped; switching anyway";
}

/// Make name the active source, first silencing the outgoing source
/// if it is playing.  Publishes SOURCE_CHANGED exactly once per actual
/// switch.  Returns true if name is (now) active, false if no such
/// source is loaded.
///
/// * Will not throw except on allocation failure
///
bool Playback_orchestrator::ensure_exclusive_playback( const std::string &name )
{
    auto lk = lock();
    if (name == m_active) {
        return true;
    }
    spSource incoming = m_registry.find( name );
    if (not incoming) {
        LOG_WARNING(Lgr) << "Orchestrator: " << Source_unavailable().what()
                         << ": " << name;
        return false;
    }
    spSource outgoing = m_registry.find( m_active );
    if (outgoing and reports_playing( outgoing, true )) {
        LOG_INFO(Lgr) << "Orchestrator silencing " << m_active
                      << " for " << name;
        quiesce( outgoing );
    }
    const std::string previous = m_active;
    m_active = name;
    if (m_info.state != PlayerState::Stopped) {
        Playback_update st {};
        st.state = PlayerState::Stopped;
        apply( st );
    }
    Playback_update upd {};
    upd.source = name;
    upd.track_name = std::string {};
    upd.artist = std::string {};
    upd.album = std::string {};
    upd.genre = std::string {};
    upd.duration = 0.0;
    upd.position = 0.0;
    apply( upd );
    LOG_INFO(Lgr) << "Orchestrator active source " << previous << " -> " << name;
    return true;
}

/// Snapshot of Playback_info after refreshing it from the active
/// source (live for local, bounded staleness for plugins).
///
Playback_info Playback_orchestrator::get_current_playback()
{
    auto lk = lock();
    spSource act = m_registry.find( m_active );
    if (act) {
        auto st = query( act, false );
        if (st) {
            Playback_update upd {};
            if (m_active == LOCAL_SOURCE) {
                if (m_info.state != PlayerState::Stopped) {
                    upd.position = st->position;
                    upd.duration = st->duration;
                }
            } else {
                if (not st->track_name.empty()) upd.track_name = st->track_name;
                if (not st->artist.empty()) upd.artist = st->artist;
                if (not st->album.empty()) upd.album = st->album;
                if (st->duration > 0.0) {
                    upd.position = st->position;
                    upd.duration = st->duration;
                }
                if (st->is_playing) {
                    upd.state = PlayerState::Playing;
                } else if (m_info.state == PlayerState::Playing) {
                    upd.state = PlayerState::Paused;
                }
            }
            apply( upd );
        }
    }
    return m_info;
}

boost::optional<Track_ref>
Playback_orchestrator::navigate_track( Direction dir )
{
    return m_nav.navigate( dir );
}

/// If name is the active source, silence it and fail over to local.
/// The source is then removed under the same lock, so no command or
/// hook can make it active again in between.
///
bool Playback_orchestrator::retire_source( const std::string &name,
                                           const std::function<bool()> &remove )
{
    auto lk = lock();
    if (name == m_active) {
        LOG_INFO(Lgr) << "Orchestrator releasing " << name;
        force_local();
    }
    m_reports.erase( name );
    return remove();
}

/// Make local the active source, whatever is active now.
///
void Playback_orchestrator::force_local()
{
    auto lk = lock();
    if (not ensure_exclusive_playback( LOCAL_SOURCE )) {
        LOG_WARNING(Lgr) << "Orchestrator: local source missing; "
                         << "marking it active anyway";
        m_active = LOCAL_SOURCE;
        Playback_update upd {};
        upd.source = std::string { LOCAL_SOURCE };
        upd.state = PlayerState::Stopped;
        apply( upd );
    }
}

std::string Playback_orchestrator::active_source() const
{
    auto lk = lock();
    return m_active;
}

spSource Playback_orchestrator::active_handle() const
{
    auto lk = lock();
    return m_registry.find( m_active );
}

/// Does the named source appear to be playing (fresh query)?
///
bool Playback_orchestrator::is_playing( const std::string &name )
{
    auto lk = lock();
    spSource src = m_registry.find( name );
    return src and reports_playing( src, true );
}

Playback_info Playback_orchestrator::snapshot() const
{
    auto lk = lock();
    return m_info;
}
