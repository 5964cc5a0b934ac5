/// Main class for the tunemux application "Tunemux"

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

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "logging.hpp"
#include "tunemux.hpp"
#include "configutil.hpp"
#include "cmdsource.hpp"
#include "navigator.hpp"
#include "orchestrator.hpp"
#include "playerstate.hpp"
#include "playlist.hpp"
#include "registry.hpp"
#include "source.hpp"
#include "watchdog.hpp"

namespace po = boost::program_options;

/// CTOR.  Builds the components leaf first and registers the local
/// source with the given engine.
///
Tunemux::Tunemux( bool test, spEngine engine, std::ostream &out )
    : m_config( std::make_unique<Config>() ),
      m_bus( std::make_unique<Event_bus>() ),
      m_playlist( std::make_unique<Playlist>() ),
      m_engine( engine ),
      m_local( std::make_shared<Local_source>(engine) ),
      m_out( out ),
      m_test( test )
{
    m_nav = std::make_unique<Track_navigator>( *m_playlist );
    m_registry = std::make_unique<Source_registry>( *m_bus );
    m_orch = std::make_unique<Playback_orchestrator>( *m_bus, *m_registry,
                                                       *m_nav );
    m_registry->set_host( m_orch.get() );
    m_registry->set_failover( m_orch.get() );
    m_registry->add_factory( "command", &Command_source::create );
    m_registry->register_source( m_local, true );
    m_psm = std::make_unique<Player_state_machine>( *m_orch, *m_registry,
                                                    *m_nav, *m_playlist,
                                                    m_local );
    Player_state_machine *psm = m_psm.get();
    m_watchdog = std::make_unique<Watchdog>( [psm]{ return psm->check_engine(); } );
}

/// DTOR
///
Tunemux::~Tunemux()
{
    shutdown();
}

/// Configure the application from a file indicated by p with a program
/// options variables map vm (which may override settings in the config
/// file).  Without a config file the compiled-in defaults are used.
///
/// * May throw Config_error, Config_file_error, or Config_path_error
///
void Tunemux::configure( const std::string &p, const po::variables_map &vm )
{
    constexpr const char* GSection { "General" };
    m_config->set_config_path( p );
    bool named = (vm.count("config") > 0);
    if (named or boost::filesystem::exists(p)) {
        m_config->read_config();    // may throw
        std::string schema = m_config->get_schema();
        if (schema != "1.0") {
            LOG_ERROR(Lgr) << "Invalid schema '" << schema
                           << "' for file " << p;
            throw Config_error();
        }
        std::string appname {};
        if (not m_config->get_string(GSection,"application",appname)
            or appname != AppName) {
            LOG_ERROR(Lgr) << "Invalid application in config file " << p;
            throw Config_error();
        }
        m_config->log_about();
        if (not m_config->get_string(GSection,"version",m_cfgversion)) {
            LOG_ERROR(Lgr) << "No declared version in config file " << p;
            throw Config_error();
        }
    } else {
        LOG_WARNING(Lgr) << "No config file " << p << "; using defaults";
        m_config->read_string( "{}" );
    }
    m_bus->configure( *m_config );
    m_engine->configure( *m_config );
    m_orch->configure( *m_config );
    m_nav->configure( *m_config );
    m_watchdog->configure( *m_config );
    m_registry->configure( *m_config );
    m_registry->scan_plugin_directory();
    m_registry->load_enabled_plugins();
    //
    unsigned volume {0};
    if (m_config->get_unsigned( GSection, "default_volume", volume )) {
        m_engine->set_volume( volume );
    }
    // playlist: positional tracks win over --playlist, which wins over
    // General.playlist
    if (vm.count("track")) {
        m_psm->load_playlist( vm["track"].as<std::vector<std::string>>(),
                              "command line" );
    } else {
        boost::filesystem::path plpath {};
        if (vm.count("playlist")) {
            plpath = expand_home( vm["playlist"].as<std::string>() );
        } else {
            m_config->get_pathname( GSection, "playlist", FileCond::NA, plpath );
        }
        if (not plpath.empty()) {
            m_psm->load_playlist_file( plpath );
        }
    }
    subscribe_display();
}

/// Write text to the console in one piece.  Bus workers print too.
///
void Tunemux::emit( const std::string &text )
{
    std::lock_guard<std::mutex> lock(m_out_mutex);
    m_out << text << std::flush;
}

/// Echo track and state changes to the console.
///
void Tunemux::subscribe_display()
{
    m_bus->subscribe( Event_type::track_changed, [this](const Event &e) {
            emit( "Now playing: " + e.current + "\n" ); }, "display" );
    m_bus->subscribe( Event_type::state_changed, [this](const Event &e) {
            emit( std::string(state_name(e.previous_state)) + " -> "
                  + state_name(e.new_state) + " (" + e.source + ")\n" ); },
        "display" );
}

void Tunemux::cmd_help( std::ostream &os )
{
    os <<
        "Commands:\n"
        "  play               start or resume playback\n"
        "  pause | stop | next | prev\n"
        "  shuffle            toggle shuffle\n"
        "  volume N           set volume 0..100\n"
        "  status             show the current playback\n"
        "  source NAME        make NAME the active source\n"
        "  plugins            list loaded and available sources\n"
        "  enable NAME | disable NAME\n"
        "  load FILE          replace the playlist from a list file\n"
        "  add PATH | remove N | list\n"
        "  goto N             make playlist entry N current\n"
        "  NAME VERB [args]   send VERB (play, select, pause, stop, next,\n"
        "                     prev, volume) to the plugin NAME\n"
        "  quit\n";
}

void Tunemux::cmd_list( std::ostream &os )
{
    std::vector<Track_ref> tracks = m_playlist->snapshot();
    Nav_cursor c = m_nav->cursor();
    os << "Playlist '" << m_playlist->name() << "', "
       << tracks.size() << " tracks\n";
    for (size_t i=0; i<tracks.size(); ++i) {
        os << (i == c.current ? " * " : "   ")
           << std::setw(4) << i << "  " << tracks[i] << "\n";
    }
}

void Tunemux::cmd_plugins( std::ostream &os )
{
    std::string active = m_orch->active_source();
    for (const auto &name : m_registry->loaded_names()) {
        os << (name == active ? " * " : "   ") << name << "  ["
           << cap_string( m_registry->caps(name) ) << "]\n";
    }
    for (const auto &info : m_registry->available()) {
        os << "   " << info.name << " (" << info.type << ") "
           << (info.loaded ? "loaded" : "available")
           << (info.enabled ? ", enabled" : "")
           << (info.description.empty() ? "" : "  ") << info.description
           << "\n";
    }
}

void Tunemux::cmd_status( std::ostream &os )
{
    Player_status st = m_psm->get_status();
    const Playback_info &pi = st.info;
    os << "Source:   " << pi.source << "\n"
       << "State:    " << state_name(pi.state) << "\n"
       << "Track:    " << pi.track_name << "\n";
    if (not pi.artist.empty()) os << "Artist:   " << pi.artist << "\n";
    if (not pi.album.empty()) os << "Album:    " << pi.album << "\n";
    os << "Position: " << std::fixed << std::setprecision(1)
       << pi.position << " / " << pi.duration << " s\n"
       << "Volume:   " << pi.volume << "\n"
       << "Playlist: " << st.playlist_size << " tracks, at " << st.cursor
       << (st.shuffle ? ", shuffle" : "") << "\n"
       << "Plugins:  " << st.plugins_loaded << " loaded, "
       << st.plugins_available << " available\n";
}

/// Execute one command line.  Returns false when the user asked to
/// quit.  Failures are reported to the console but never end the loop.
///
bool Tunemux::execute( const std::string &line )
{
    std::vector<std::string> words = split_words( line );
    if (words.empty()) return true;
    const std::string cmd = words[0];
    Source_args args( words.begin()+1, words.end() );
    std::ostringstream os;
    bool ok {true};
    try {
        if (cmd == "quit" or cmd == "exit") {
            return false;
        } else if (cmd == "help" or cmd == "?") {
            cmd_help( os );
        } else if (cmd == "play") {
            ok = m_psm->play( args );
        } else if (cmd == "pause") {
            ok = m_psm->pause();
        } else if (cmd == "stop") {
            ok = m_psm->stop();
        } else if (cmd == "next") {
            ok = m_psm->next();
        } else if (cmd == "prev") {
            ok = m_psm->prev();
        } else if (cmd == "shuffle") {
            os << "Shuffle " << (m_psm->toggle_shuffle() ? "on" : "off") << "\n";
        } else if (cmd == "volume" and args.size() == 1) {
            ok = m_psm->set_volume( static_cast<unsigned>(std::stoul(args[0])) );
        } else if (cmd == "status") {
            cmd_status( os );
        } else if (cmd == "source" and args.size() == 1) {
            ok = m_psm->select_source( args[0] );
        } else if (cmd == "plugins" or cmd == "sources") {
            cmd_plugins( os );
        } else if (cmd == "enable" and args.size() == 1) {
            ok = m_registry->enable_plugin( args[0] );
        } else if (cmd == "disable" and args.size() == 1) {
            ok = m_registry->disable_plugin( args[0] );
        } else if (cmd == "load" and args.size() == 1) {
            ok = m_psm->load_playlist_file( expand_home(args[0]) );
        } else if (cmd == "add" and args.size() == 1) {
            ok = m_psm->add_track( expand_home(args[0]).string() );
        } else if (cmd == "remove" and args.size() == 1) {
            ok = m_psm->remove_track( std::stoul(args[0]) );
        } else if (cmd == "goto" and args.size() == 1) {
            ok = m_psm->select_track( std::stoul(args[0]) );
        } else if (cmd == "list") {
            cmd_list( os );
        } else if (m_registry->is_loaded(cmd) and not args.empty()) {
            const std::string verb = args[0];
            Source_args rest( args.begin()+1, args.end() );
            ok = m_psm->source_command( cmd, verb, rest );
        } else {
            os << "Unknown command: " << line << " (try 'help')\n";
        }
    }
    catch (std::logic_error&) {        // from stoul
        os << "Bad number in: " << line << "\n";
        ok = true;
    }
    if (not ok) {
        std::string msg = m_psm->last_message();
        os << "Failed: " << cmd << (msg.empty() ? "" : ": ") << msg << "\n";
    }
    emit( os.str() );
    return true;
}

/// Run the watchdog and the command loop until quit, end of input, or
/// a termination signal.  A test run returns at once.
///
void Tunemux::run( std::istream &in )
{
    if (m_test) {
        LOG_INFO(Lgr) << "Test mode: configuration is OK";
        return;
    }
    m_running = true;
    m_watchdog->start();
    LOG_INFO(Lgr) << "Tunemux command loop starting";
    std::string line;
    while (m_running and not Terminate) {
        emit( std::string(AppName) + "> " );
        if (not std::getline( in, line )) {
            if (Terminate or in.eof()) break;
            in.clear();                 // interrupted read
            continue;
        }
        if (not execute( line )) break;
    }
    LOG_INFO(Lgr) << "Tunemux command loop ending";
    shutdown();
}

/// Orderly shutdown: silence the player, fall back to local, let every
/// source clean up, then stop the watchdog and drain the bus.
///
/// * Will not throw
///
void Tunemux::shutdown()
{
    if (m_shut_down) return;
    m_shut_down = true;
    m_running = false;
    try {
        m_psm->stop();
        m_orch->force_local();
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "Shutdown: " << ex.what();
    }
    m_registry->shutdown_all();
    if (not m_watchdog->stop()) {
        LOG_WARNING(Lgr) << "Watchdog did not exit in time";
    }
    m_watchdog->close();
    m_bus->shutdown();
    LOG_INFO(Lgr) << "Tunemux shut down";
}
