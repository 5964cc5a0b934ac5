#pragma once

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

#include <sys/types.h>
#include <sys/wait.h>
#include <ctime>
#include <string>
#include <vector>
#include <memory>

#include <boost/filesystem.hpp>
#include "logging.hpp"

#include "cpexceptions.hpp"

/// Some symbolic values used in Child_proc:
///
enum { NOTAPID=(-1) };

/// Commanded and observed phases of child operation:
///
enum class ChildPhase {
    gone,                       //! process terminated
    running,                    //! process running
    paused,                     //! process stopped
    unknown                     //! state cannot be determined
};

///////////////////////////////////////////////////////////////////////

/**
 * Child_proc
 *   Manages one child process at a time: start it, pause it with
 * SIGSTOP, continue it with SIGCONT, terminate it, and track its exit.
 * Each instance is associated with a binary path and a set of
 * arguments; the child may be run 0 or more times.
 *
 * No SIGCHLD handler is installed.  The observed phase is brought up
 * to date by refresh(), which polls waitid() for this pid only, so
 * several Child_proc objects (and other code that forks) coexist.
 * All accessors that report the phase call refresh() first.
 *
 * Typical usage:
 *
 *   Child_proc cp { "/usr/bin/mpg123" };
 *   cp.set_name("decoder");
 *   cp.clear_args();
 *   cp.add_arg("-q");
 *   cp.add_arg( track );
 *   cp.start_child();     // fork/exec
 *   ...
 *   if (cp.completed()) { ... }   // exited by itself
 *   cp.kill_child();
 *
 * Caution:  not thread safe; owners serialize access.
 */
class Child_proc
{
private:
    pid_t m_pid {NOTAPID};             // last pid seen running
    pid_t m_old_pid {NOTAPID};         // pid before that, if any
    int m_exit_status {0};             // last exit status of child
    int m_exit_reason {0};             // CLD_EXITED or CLD_KILLED
    int m_terminate   {0};             // last kill signal (0 if none)
    ChildPhase m_cmd_phase = ChildPhase::gone;  // commanded phase
    ChildPhase m_obs_phase = ChildPhase::gone;  // observed phase
    std::vector<std::string> m_args {};   // cached args
    boost::filesystem::path m_bin_path {}; // application pathname
    std::string m_name {};             // user friendly name (optional)
    time_t m_start_time {0};           // time of last start
    time_t m_exit_time {0};            // time of observed exit
    //
    void launch_child_binary(std::vector<const char*>&);
    void postmortem( int, int );
    void presume_dead();
    void update_status( const siginfo_t & );

public:
    static const char* phase_name( ChildPhase );
    //
    void add_arg( const std::string& );
    void add_arg( int );
    void clear_args();
    ChildPhase cmd_phase() const { return m_cmd_phase; }
    bool completed();
    void cont_child( long wait_us=0 );
    int get_exit_reason() const { return m_exit_reason; }
    pid_t get_pid() const { return m_pid; }
    void kill_child( bool force=false, long wait_us=500'000 );
    ChildPhase last_obs_phase() const { return m_obs_phase; }
    bool paused();
    void refresh();
    int run_and_wait( long wait_us );
    bool running();
    void set_binary( const boost::filesystem::path & );
    void set_name( const std::string& );
    void signal_child( int );
    void start_child();
    void stop_child( long wait_us=0 );
    time_t uptime();
    bool wait_for_phase( ChildPhase, long wait_us );
    //
    Child_proc();
    explicit Child_proc( const boost::filesystem::path & );
    Child_proc( const Child_proc& ) = delete;
    Child_proc& operator=( const Child_proc& ) = delete;
    ~Child_proc();
};

/// smart pointer to a Child_proc:
using spCP = std::shared_ptr<Child_proc>;
