/// Test Child_proc and the Process_engine built on it
///
///    tproc  --log_level=all

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
#define BOOST_TEST_MODULE proc_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <thread>
#include <boost/filesystem/fstream.hpp>

#include "logging.hpp"
#include "childproc.hpp"
#include "config.hpp"
#include "procengine.hpp"

namespace fs = boost::filesystem;
using namespace std::chrono_literals;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("tproc","tproc_%2N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LogFixture);

/// binaries
const fs::path TruePath {"/bin/true"};
const fs::path FalsePath {"/bin/false"};
const fs::path SleepPath {"/bin/sleep"};
const fs::path ShellPath {"/bin/sh"};
const fs::path BadBinaryPath {"/usr/local/bin/moggy_cat"};

/// A scratch track file that is removed at scope exit.
struct Scratch_track {
    fs::path path;
    explicit Scratch_track( const char *ext ) {
        path = fs::temp_directory_path() / fs::unique_path( "tproc-%%%%%%" );
        path += ext;
        fs::ofstream f( path );
        f << "not really audio\n";
    }
    ~Scratch_track() {
        boost::system::error_code ec;
        fs::remove( path, ec );
    }
};

//////////////////////////////////////////////////////////////////////////

/// Exit status of short commands.
///
BOOST_AUTO_TEST_CASE( run_and_wait_status )
{
    Child_proc t { TruePath };
    BOOST_CHECK_EQUAL( t.run_and_wait(2'000'000), 0 );
    BOOST_TEST( t.completed() );
    BOOST_CHECK_EQUAL( t.get_pid(), static_cast<pid_t>(NOTAPID) );

    Child_proc f { FalsePath };
    BOOST_CHECK_EQUAL( f.run_and_wait(2'000'000), 1 );

    Child_proc bad { BadBinaryPath };
    BOOST_CHECK_EQUAL( bad.run_and_wait(2'000'000), 127 );
}

/// A command that runs too long is killed and reported.
///
BOOST_AUTO_TEST_CASE( run_and_wait_timeout )
{
    Child_proc s { SleepPath };
    s.add_arg( 10 );
    auto t0 = std::chrono::steady_clock::now();
    BOOST_CHECK_THROW( s.run_and_wait(200'000), CP_timeout_exception );
    BOOST_TEST( (std::chrono::steady_clock::now() - t0 < 3s) );
    BOOST_TEST( s.completed() );
}

/// Pause, continue and kill a long running child.
///
BOOST_AUTO_TEST_CASE( phase_control )
{
    Child_proc s { SleepPath };
    s.set_name( "sleeper" );
    s.add_arg( 10 );
    s.start_child();
    BOOST_TEST( s.running() );
    BOOST_TEST( s.get_pid() != static_cast<pid_t>(NOTAPID) );
    s.stop_child( 500'000 );
    BOOST_TEST( s.paused() );
    BOOST_TEST( (s.cmd_phase() == ChildPhase::paused) );
    s.cont_child( 500'000 );
    BOOST_TEST( s.running() );
    s.kill_child();
    BOOST_TEST( s.completed() );
    BOOST_CHECK_EQUAL( s.get_exit_reason(), CLD_KILLED );
    BOOST_CHECK_THROW( s.stop_child(), CP_nochild_exception );
    s.kill_child();             // harmless when already gone
}

/// Engine configuration and format checks.
///
BOOST_AUTO_TEST_CASE( engine_formats )
{
    Process_engine eng;
    Config cfg;
    cfg.read_string( R"({ "Local_engine": {
        "decoder": "/bin/sh",
        "decoder_args": ["-c", "exec sleep 5"],
        "extensions": ["MP3", ".ogg"],
        "signal_wait_ms": 500 } })" );
    eng.configure( cfg );
    BOOST_TEST( eng.supports("/music/a.mp3") );
    BOOST_TEST( eng.supports("/music/b.OGG") );
    BOOST_TEST( not eng.supports("/music/c.flac") );
    BOOST_TEST( not eng.supports("/music/d.\xC3\x89P3") );
    BOOST_TEST( eng.supports("/music/\xC3\xA9t\xC3\xA9.Mp3") );
    BOOST_CHECK_THROW( eng.start("/music/c.flac"), Engine_format_error );
    BOOST_CHECK_THROW( eng.start("/no/such/track.mp3"), Engine_format_error );
    BOOST_TEST( not eng.busy() );
    BOOST_TEST( not eng.set_volume(50) );   // no volume_arg configured
    //
    Config bad;
    bad.read_string( R"({ "Local_engine": { "decoder": "/no/such/decoder" } })" );
    BOOST_CHECK_THROW( eng.configure(bad), Config_path_error );
}

/// Start, pause, resume and stop a decoder stand-in.
///
BOOST_AUTO_TEST_CASE( engine_lifecycle )
{
    Scratch_track track { ".mp3" };
    Process_engine eng;
    Config cfg;
    cfg.read_string( R"({ "Local_engine": {
        "decoder": "/bin/sh",
        "decoder_args": ["-c", "exec sleep 5"],
        "signal_wait_ms": 500 } })" );
    eng.configure( cfg );
    eng.start( track.path.string() );
    BOOST_TEST( eng.busy() );
    eng.pause();
    BOOST_TEST( eng.busy() );
    eng.resume();
    BOOST_TEST( eng.busy() );
    eng.stop();
    BOOST_TEST( not eng.busy() );
    BOOST_CHECK_THROW( eng.pause(), Engine_control_error );
}

/// A track that ends by itself leaves the engine idle.
///
BOOST_AUTO_TEST_CASE( engine_natural_end )
{
    Scratch_track track { ".ogg" };
    Process_engine eng;
    Config cfg;
    cfg.read_string( R"({ "Local_engine": {
        "decoder": "/bin/sh",
        "decoder_args": ["-c", "exec sleep 0.2"] } })" );
    eng.configure( cfg );
    eng.start( track.path.string() );
    BOOST_TEST( eng.busy() );
    std::this_thread::sleep_for( 1s );
    BOOST_TEST( not eng.busy() );
}
