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

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <boost/program_options.hpp>

#include "config.hpp"
#include "eventbus.hpp"
#include "localsource.hpp"
#include "main.hpp"

class Playlist;
class Track_navigator;
class Source_registry;
class Playback_orchestrator;
class Player_state_machine;
class Watchdog;

///////////////////////////////// Tunemux //////////////////////////////////


/// Owns and wires together the playback core and runs the command
/// loop.  Components receive the pieces they need by reference; there
/// are no other globals.
///
class Tunemux {
private:
    std::unique_ptr<Config> m_config;
    std::unique_ptr<Event_bus> m_bus;
    std::unique_ptr<Playlist> m_playlist;
    std::unique_ptr<Track_navigator> m_nav;
    std::unique_ptr<Source_registry> m_registry;
    std::unique_ptr<Playback_orchestrator> m_orch;
    spEngine m_engine;
    spLocal m_local;
    std::unique_ptr<Player_state_machine> m_psm;
    std::unique_ptr<Watchdog> m_watchdog;
    std::ostream &m_out;
    bool m_test;                        // true: configure only
    bool m_running {false};
    bool m_shut_down {false};
    std::string m_cfgversion {"?"};     // config file's version
    //
    std::mutex m_out_mutex {};
    //
    void cmd_help( std::ostream& );
    void cmd_list( std::ostream& );
    void cmd_plugins( std::ostream& );
    void cmd_status( std::ostream& );
    void emit( const std::string& );
    void subscribe_display();
public:
    Tunemux( bool test, spEngine engine, std::ostream &out=std::cout );
    Tunemux(const Tunemux&) = delete;
    void operator=(Tunemux const&) = delete;
    ~Tunemux();
    //
    void configure( const std::string&,
                    const boost::program_options::variables_map& );
    bool execute( const std::string& );
    void run( std::istream& );
    void shutdown();
    //
    Event_bus& bus() { return *m_bus; }
    Player_state_machine& player() { return *m_psm; }
    Source_registry& registry() { return *m_registry; }
    const std::string& get_config_version() const { return m_cfgversion; }
};
