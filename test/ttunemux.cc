/// Test the Tunemux application: configuration and console commands
///
///    ttunemux  --log_level=all

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

/// Dynamically link boost test framework
#define BOOST_TEST_MODULE tunemux_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <sstream>

#include <boost/program_options.hpp>

#include "logging.hpp"
#include "fake_sources.hpp"
#include "playerstate.hpp"
#include "registry.hpp"
#include "tunemux.hpp"

namespace po = boost::program_options;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("ttunemux","ttunemux_%2N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LogFixture);

const char *ConfName = TEST_DATA_DIR "/ttunemux.json";

/// Parse a command line the way main() does.
///
static po::variables_map parse( std::vector<const char*> argv )
{
    po::options_description desc("Allowed options");
    desc.add_options()
        ("config",po::value<std::string>(),"config file")
        ("playlist",po::value<std::string>(),"playlist file")
        ("track",po::value<std::vector<std::string>>(),"track to play");
    po::positional_options_description pos;
    pos.add("track", -1);
    argv.insert( argv.begin(), "tunemux" );
    po::variables_map vm;
    po::store( po::command_line_parser( static_cast<int>(argv.size()), argv.data() )
               .options(desc).positional(pos).run(), vm );
    po::notify(vm);
    return vm;
}

/// Run one console command and return what it printed, including any
/// display output from events it caused.
///
static std::string command( Tunemux &app, std::ostringstream &out,
                            const std::string &line, bool *more=nullptr )
{
    out.str("");
    bool ok = app.execute( line );
    if (more) *more = ok;
    app.bus().drain();
    return out.str();
}

static bool has( const std::string &text, const std::string &part )
{
    return text.find(part) != std::string::npos;
}

/// A full configuration loads the playlist, the enabled plugin, and
/// the default volume; relative paths resolve beside the config file.
///
BOOST_AUTO_TEST_CASE( configure_from_file )
{
    auto engine = std::make_shared<Fake_engine>();
    std::ostringstream out;
    Tunemux app( false, engine, out );
    app.configure( ConfName, parse({"--config", ConfName}) );
    BOOST_TEST( app.get_config_version() == "test-3" );
    BOOST_TEST( engine->volume() == 55u );
    BOOST_TEST( app.registry().is_loaded("echo") );
    BOOST_TEST( not app.registry().is_loaded("other") );
    BOOST_TEST( app.player().get_status().playlist_size == 3u );
    //
    std::string text = command( app, out, "list" );
    BOOST_TEST( has(text, "Evening Mix") );
    BOOST_TEST( has(text, " * ") );
    text = command( app, out, "status" );
    BOOST_TEST( has(text, "Source:   local") );
    BOOST_TEST( has(text, "3 tracks") );
    text = command( app, out, "plugins" );
    BOOST_TEST( has(text, "echo  [") );
    BOOST_TEST( has(text, "other (carrier-pigeon) available") );
}

/// Console commands drive the player; errors are reported and the
/// loop continues.
///
BOOST_AUTO_TEST_CASE( console_commands )
{
    auto engine = std::make_shared<Fake_engine>();
    std::ostringstream out;
    Tunemux app( false, engine, out );
    app.configure( ConfName, parse({"--config", ConfName}) );
    bool more {false};
    //
    std::string text = command( app, out, "bogus thing", &more );
    BOOST_TEST( more );
    BOOST_TEST( has(text, "Unknown command") );
    text = command( app, out, "volume abc", &more );
    BOOST_TEST( more );
    BOOST_TEST( has(text, "Bad number") );
    text = command( app, out, "shuffle" );
    BOOST_TEST( has(text, "Shuffle on") );
    text = command( app, out, "shuffle" );
    BOOST_TEST( has(text, "Shuffle off") );
    text = command( app, out, "help" );
    BOOST_TEST( has(text, "Commands:") );
    //
    text = command( app, out, "play" );
    BOOST_TEST( not has(text, "Failed") );
    BOOST_TEST( has(text, "Now playing: ") );
    BOOST_TEST( app.player().state() == PlayerState::Playing );
    //
    text = command( app, out, "echo play some song" );
    BOOST_TEST( not has(text, "Failed") );
    BOOST_TEST( app.player().get_status().info.source == "echo" );
    text = command( app, out, "echo next" );
    BOOST_TEST( has(text, "Failed: echo") );
    text = command( app, out, "disable echo" );
    BOOST_TEST( not has(text, "Failed") );
    BOOST_TEST( not app.registry().is_loaded("echo") );
    BOOST_TEST( app.player().get_status().info.source == "local" );
    //
    text = command( app, out, "remove 99" );
    BOOST_TEST( has(text, "Failed: remove") );
    BOOST_TEST( not command( app, out, "quit", &more ).size() );
    BOOST_TEST( not more );
}

/// Tracks on the command line replace the configured playlist.
///
BOOST_AUTO_TEST_CASE( positional_tracks )
{
    auto engine = std::make_shared<Fake_engine>();
    std::ostringstream out;
    Tunemux app( false, engine, out );
    app.configure( ConfName, parse({"--config", ConfName, "a.mp3", "b.mp3"}) );
    BOOST_TEST( app.player().get_status().playlist_size == 2u );
    std::string text = command( app, out, "list" );
    BOOST_TEST( has(text, "a.mp3") );
    BOOST_TEST( has(text, "b.mp3") );
}

/// Shutdown with a plugin playing silences it and fails over to local
/// before the plugin is told to shut down.
///
BOOST_AUTO_TEST_CASE( shutdown_with_plugin_active )
{
    std::ostringstream out;
    Tunemux app( false, std::make_shared<Fake_engine>(), out );
    app.configure( ConfName, parse({"--config", ConfName}) );
    auto remote = std::make_shared<Fake_remote>( "remote" );
    BOOST_REQUIRE( app.registry().register_source( remote ) );
    BOOST_REQUIRE( app.player().play_source( "remote", {"song"} ) );
    BOOST_REQUIRE( remote->playing() );
    app.shutdown();
    BOOST_TEST( not remote->playing() );
    BOOST_CHECK_EQUAL( remote->source_at_shutdown(), LOCAL_SOURCE );
    auto calls = remote->calls();
    BOOST_REQUIRE( not calls.empty() );
    BOOST_CHECK_EQUAL( calls.back(), "shutdown" );
    BOOST_TEST( (std::find(calls.begin(), calls.end(), "stop") != calls.end()) );
    app.shutdown();             // second call does nothing
}

/// Bad or missing config files are fatal.
///
BOOST_AUTO_TEST_CASE( config_errors )
{
    {
        std::ostringstream out;
        Tunemux app( false, std::make_shared<Fake_engine>(), out );
        const char *wrong = TEST_DATA_DIR "/wrongapp.json";
        BOOST_CHECK_THROW( app.configure( wrong, parse({"--config", wrong}) ),
                           Config_error );
    }
    {
        std::ostringstream out;
        Tunemux app( false, std::make_shared<Fake_engine>(), out );
        const char *missing = TEST_DATA_DIR "/no_such_config.json";
        BOOST_CHECK_THROW( app.configure( missing, parse({"--config", missing}) ),
                           Config_file_error );
    }
    {   // an unnamed default that does not exist is not an error
        std::ostringstream out;
        Tunemux app( false, std::make_shared<Fake_engine>(), out );
        BOOST_CHECK_NO_THROW( app.configure( DefaultConfigPath, parse({}) ) );
        BOOST_TEST( app.get_config_version() == "?" );
    }
}

/// The command loop reads until quit, then shuts down.
///
BOOST_AUTO_TEST_CASE( command_loop )
{
    auto engine = std::make_shared<Fake_engine>();
    std::ostringstream out;
    Tunemux app( false, engine, out );
    app.configure( ConfName, parse({"--config", ConfName}) );
    std::istringstream in( "status\nplay\nquit\nstatus\n" );
    app.run( in );
    std::string text = out.str();
    BOOST_TEST( has(text, "tunemux> ") );
    BOOST_TEST( has(text, "State:    STOPPED") );
    // the line after quit is never read
    std::string rest;
    BOOST_TEST( static_cast<bool>(std::getline( in, rest )) );
    BOOST_TEST( rest == "status" );
    BOOST_TEST( has(engine->calls().back(), "stop") );
}

/// End of input also ends the loop.
///
BOOST_AUTO_TEST_CASE( loop_end_of_input )
{
    std::ostringstream out;
    Tunemux app( false, std::make_shared<Fake_engine>(), out );
    app.configure( ConfName, parse({"--config", ConfName}) );
    std::istringstream in( "list\n" );
    app.run( in );
    BOOST_TEST( has(out.str(), "Evening Mix") );
}

/// A pending termination signal ends the loop before any input is read,
/// and test mode never enters it.
///
BOOST_AUTO_TEST_CASE( loop_terminate_and_test_mode )
{
    {
        std::ostringstream out;
        Tunemux app( false, std::make_shared<Fake_engine>(), out );
        app.configure( ConfName, parse({"--config", ConfName}) );
        std::istringstream in( "status\n" );
        Terminate = 1;
        app.run( in );
        Terminate = 0;
        BOOST_TEST( not has(out.str(), "State:") );
    }
    {
        std::ostringstream out;
        Tunemux app( true, std::make_shared<Fake_engine>(), out );
        app.configure( ConfName, parse({"--config", ConfName}) );
        std::istringstream in( "status\n" );
        app.run( in );
        BOOST_TEST( out.str().empty() );
    }
}
