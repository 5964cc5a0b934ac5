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

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

#include "common.hpp"
#include "playinfo.hpp"
#include "localsource.hpp"

class Config;
class Player_state_machine;
class Playback_orchestrator;
class Playlist;
class Source_registry;
class Track_navigator;

/**
 * Behavior of one player state.  State objects carry no data of their
 * own, only the machine they act on; the current state is whatever
 * Playback_info says.
 */
class Player_state {
protected:
    Player_state_machine &m_psm;
public:
    explicit Player_state( Player_state_machine &psm ) : m_psm(psm) {}
    virtual ~Player_state();
    //
    virtual PlayerState id() const = 0;
    virtual bool play( const Source_args& ) = 0;
    virtual bool pause() = 0;
    virtual bool stop() = 0;
    virtual bool next_track() = 0;
    virtual bool previous_track() = 0;
};

class Stopped_state : public Player_state {
public:
    using Player_state::Player_state;
    PlayerState id() const override { return PlayerState::Stopped; }
    bool play( const Source_args& ) override;
    bool pause() override;
    bool stop() override;
    bool next_track() override;
    bool previous_track() override;
};

class Playing_state : public Player_state {
public:
    using Player_state::Player_state;
    PlayerState id() const override { return PlayerState::Playing; }
    bool play( const Source_args& ) override;
    bool pause() override;
    bool stop() override;
    bool next_track() override;
    bool previous_track() override;
};

class Paused_state : public Player_state {
public:
    using Player_state::Player_state;
    PlayerState id() const override { return PlayerState::Paused; }
    bool play( const Source_args& ) override;
    bool pause() override;
    bool stop() override;
    bool next_track() override;
    bool previous_track() override;
};


/**
 * Player_state_machine
 *   STOPPED / PLAYING / PAUSED transport over whichever source is
 * active.  Every public command holds the orchestrator lock from start
 * to finish, so commands and watchdog ticks never interleave.  Errors
 * never escape: the machine falls back to STOPPED where needed, logs,
 * leaves a message for last_message(), and returns false.
 */
class Player_state_machine {
    friend class Stopped_state;
    friend class Playing_state;
    friend class Paused_state;
private:
    Playback_orchestrator &m_orch;
    Source_registry &m_registry;
    Track_navigator &m_nav;
    Playlist &m_playlist;
    spLocal m_local;
    Stopped_state m_stopped { *this };
    Playing_state m_playing { *this };
    Paused_state m_paused { *this };
    mutable std::mutex m_msg_mutex {};
    std::string m_message {};
    //
    Player_state& current();
    void report( const std::string&, bool error=false );
    bool guarded( const char*, const std::function<bool()>& );
    void set_stopped();
    // transitions used by the state objects
    bool start_current( const Source_args& );
    bool pause_active();
    bool resume_active();
    bool stop_active();
    bool step( Direction, bool audible );
public:
    Player_state_machine( Playback_orchestrator&, Source_registry&,
                          Track_navigator&, Playlist&, spLocal );
    Player_state_machine( const Player_state_machine& ) = delete;
    void operator=( Player_state_machine const& ) = delete;
    //
    bool play( const Source_args& args = Source_args{} );
    bool pause();
    bool stop();
    bool next();
    bool prev();
    bool play_source( const std::string&, const Source_args& args = Source_args{} );
    bool select_source( const std::string& );
    bool source_command( const std::string&, const std::string&,
                         const Source_args& );
    bool set_volume( unsigned );
    bool toggle_shuffle();
    //
    bool load_playlist( const std::vector<Track_ref>&, const std::string& name="" );
    bool load_playlist_file( const boost::filesystem::path& );
    bool add_track( const Track_ref& );
    bool remove_track( size_t );
    bool select_track( size_t );
    //
    bool check_engine();
    PlayerState state();
    std::string last_message() const;
    Player_status get_status();
};
