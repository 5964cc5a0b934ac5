/**
 * Tunemux playback application.  Plays a local playlist through an
 * external decoder and hands the speaker to plugin sources on request,
 * one audible source at a time.
 *
 * Reads a configuration file, by default ~/.config/tunemux/tunemux.json,
 * then accepts commands on standard input (try "help").
 *
 * It responds to signals at runtime:
 *    TERM, INT (^c), QUIT -- stop playback, shut down sources and exit
 */

/*   Part of the tunemux package.
 *
 *   Copyright 2026 The tunemux authors
 *   Portions copyright 2020 Steven A. Harp (rsked)
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

#include <cstring>
#include <iostream>
#include <signal.h>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include "version.h"
#include "main.hpp"
#include "tunemux.hpp"
#include "procengine.hpp"
#include "logging.hpp"
#include "configutil.hpp"

namespace po = boost::program_options;

/// Our official name, checked against the config file
const char *AppName { "tunemux" };

/// Config file unless changed on the command line
std::string DefaultConfigPath { "~/.config/tunemux/tunemux.json" };

/// Log the version and compilation information.
/// If force==false, this will only print every LOG_INTERVAL_SECS.
///
void log_banner(bool force)
{
    constexpr const time_t LOG_INTERVAL_SECS { 600 };

    static time_t last=0;
    time_t now = time(0);
    if ( ((now - last) < LOG_INTERVAL_SECS) and not force ) {
        return;
    }
    LOG_INFO(Lgr) << AppName << " version "
                  << VERSION_STR "  built "  __DATE__ " " __TIME__ ;
    last = now;
}

/// Set when the command loop must exit due to a signal.
///
volatile std::sig_atomic_t Terminate = 0;
volatile std::sig_atomic_t gTermSignal = 0;


/// Signal handler function; the flag is examined by the command loop.
///
void my_signal_handler(int s)
{
    if ((s == SIGTERM) || (s == SIGINT) || (s==SIGQUIT)) {
        Terminate = 1;
        gTermSignal = s;
    }
}

/// Handle SIGTERM, SIGINT and SIGQUIT by flagging Terminate.  No
/// SA_RESTART: a blocked console read must return so the loop sees it.
///
void setup_term_handler()
{
    struct sigaction sa;
    memset( &sa, 0, sizeof(sa) );
    sa.sa_handler = my_signal_handler;
    sigaction(SIGTERM, &sa, NULL);
    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGQUIT, &sa, NULL);
}


////////////////////////////////////////////////////////////////////


/// Top Level Function initializes and finalizes logging, creates
/// a Tunemux object and runs its command loop until quit or signal.
///
int main(int ac, char **av)
{
    int return_code = 0;
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help","option information")
        ("config",po::value<std::string>(),"use a particular config file")
        ("console","echo log to console in addition to log file")
        ("debug","show debug level messages in logs")
        ("playlist",po::value<std::string>(),"override playlist file")
        ("test","test configuration and exit without running")
        ("version","print version identifier and exit without running")
        ("track",po::value<std::vector<std::string>>(),"track to play");
    po::positional_options_description pos;
    pos.add("track", -1);
    po::variables_map vm;
    try {
        po::store( po::command_line_parser(ac,av)
                   .options(desc).positional(pos).run(), vm );
        po::notify(vm);
    } catch( const std::exception &err) {
        std::cerr << "Fatal command line error: " << err.what() << std::endl;
        exit(13);
    }
    if (vm.count("help")) {
        std::cout << "Usage: " << AppName << " [options] [track...]\n"
                  << desc << "\n";
        exit(0);
    }
    if (vm.count("version")) {
        std::cout << AppName << " version "
                  << VERSION_STR "  built "  __DATE__ " " __TIME__  << "\n";
        exit(0);
    }
    bool test_mode = (vm.count("test") > 0);
    if (test_mode) {
        std::cerr << ";;; Test mode\n";
    }
    //
    setup_term_handler();
    auto  logpath = expand_home( "~/logs/tunemux_%5N.log" );
    int log_mode = (vm.count("console") ? (LF_FILE|LF_CONSOLE) : LF_FILE);
    if (test_mode) log_mode = LF_CONSOLE;
    //
    if (vm.count("debug")) { log_mode |= LF_DEBUG; }
    init_logging( AppName, logpath.c_str(), log_mode );
    log_banner(true);
    // -------------------------- RUN --------------------------
    try  {
        auto app = std::make_unique<Tunemux>( test_mode,
                                              std::make_shared<Process_engine>() );
        if (vm.count("config")) {
            std::string cstr { vm["config"].as<std::string>() };
            app->configure( expand_home(cstr).string(), vm );
        } else {
            app->configure( expand_home(DefaultConfigPath).string(), vm );
        }
        app->run( std::cin );
    }
    catch (Config_error &ex) {
        return_code = 1;
        LOG_ERROR(Lgr) << "main: fatal error--" << ex.what();
    }
    catch (std::exception &ex) {
        return_code = 2;
        LOG_ERROR(Lgr) << "main: fatal runtime error--" << ex.what();
    }
    catch (...) {
        return_code = 3;
        LOG_ERROR(Lgr) << "main: unexpected fatal error";
    };
    // ---------------------------------------------------------
    if (gTermSignal) {
        LOG_INFO(Lgr) << "Exiting on signal " << gTermSignal;
    }
    finish_logging();
    return return_code;
}
