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

#include "childproc.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

////////////////////////////////////////////////////////////////////////

/// Polling granularity for wait_for_phase, microseconds
static constexpr long POLL_US { 2'000 };

/// CTOR.
///
Child_proc::Child_proc()
{
}

/// CTOR with binary path.
///
Child_proc::Child_proc( const boost::filesystem::path &bp )
    : m_bin_path(bp)
{
}

/// DTOR.  A child still alive at this point is killed without
/// ceremony so that it cannot outlive its manager as an orphan or
/// linger as a zombie.
///
Child_proc::~Child_proc()
{
    if (m_pid != NOTAPID) {
        kill_child(true, 200'000);
    }
}


/// Class method retrieves phase name
///
const char*
Child_proc::phase_name( ChildPhase p )
{
    switch (p) {
    case ChildPhase::gone:
        return "gone";
    case ChildPhase::running:
        return "running";
    case ChildPhase::paused:
        return "paused";
    default:
        return "unknown";
    }
}

/// Collect any pending status changes of our child without blocking.
/// A reaped child becomes "gone" and its pid is forgotten.
///
/// * Will not throw
///
void Child_proc::refresh()
{
    if (m_pid == NOTAPID) return;
    constexpr int event_mask = WEXITED|WSTOPPED|WCONTINUED|WNOHANG;
    siginfo_t status;
    for (;;) {
        memset(&status,0,sizeof(status));
        if (0 != waitid(P_PID, static_cast<id_t>(m_pid), &status, event_mask)) {
            if (errno == EINTR) continue;
            if (errno == ECHILD) {
                // somebody else reaped it, or it was never ours
                LOG_WARNING(Lgr) << "Child_proc " << m_name << " pid="
                                 << m_pid << " no longer waitable";
                presume_dead();
            }
            return;
        }
        if (0 == status.si_pid) return;  // no state change
        update_status( status );
        if (m_pid == NOTAPID) return;
    }
}

/// Return the number of seconds the child has apparently been running.
/// If the process is not running, return the duration of the last run.
/// If the process did not run, return 0.
///
time_t Child_proc::uptime()
{
    if (m_start_time > 0) {
        if (running()) {
            return (time(0) - m_start_time);
        }
        if (m_exit_time > m_start_time) {
            return (m_exit_time - m_start_time);
        }
    }
    return 0;
}

/// Check run status and return true if child is running.
///
bool Child_proc::running()
{
    refresh();
    return (m_obs_phase==ChildPhase::running);
}

/// Return true if the child is stopped (SIGSTOP).
///
bool Child_proc::paused()
{
    refresh();
    return (m_obs_phase==ChildPhase::paused);
}

/// Returns true if the observed phase is "gone".
/// NOTE: This does not imply *successful* completion....
///
bool Child_proc::completed()
{
    refresh();
    return (m_obs_phase == ChildPhase::gone);
}

/// Set the user friendly name string to nm.
///
void Child_proc::set_name( const std::string &nm )
{
    m_name = nm;
}

/// Set a particular binary path
void Child_proc::set_binary( const boost::filesystem::path &p )
{
    m_bin_path = p;
}

/// Add an argument. Arguments are *copied* into m_args.
///
void Child_proc::add_arg(const std::string& s)
{
    m_args.push_back(s);
}

/// Add an integer argument
///
void Child_proc::add_arg( int i )
{
    m_args.push_back(std::to_string(i));
}

/// Clear all arguments
void Child_proc::clear_args()
{
    m_args.clear();
}

/// Child exited with given status, reason=CLD_EXITED, (0 is
/// considered a normal exit) or was killed, reason=CLD_KILLED.
///
void Child_proc::postmortem( int status, int reason )
{
    m_old_pid = m_pid;
    m_pid = NOTAPID;
    m_exit_status = status;
    m_exit_reason = reason;
    m_obs_phase = ChildPhase::gone;
    m_exit_time = time(0);
    LOG_DEBUG(Lgr) << "Child_proc " << m_name << " pid=" << m_old_pid
                   << (reason==CLD_EXITED ? " exited status=" : " killed signal=")
                   << status;
}


/// Apply a waitid() status record, updating obs_phase.
///
/// * Will not throw
///
void Child_proc::update_status( const siginfo_t & infop )
{
    switch(infop.si_code) {
    case CLD_EXITED:
    case CLD_KILLED:
    case CLD_DUMPED:
        postmortem( infop.si_status, infop.si_code );
        break;
    case CLD_STOPPED:
        m_obs_phase = ChildPhase::paused;
        break;
    case CLD_CONTINUED:
        m_obs_phase = ChildPhase::running;
        break;
    default:
        m_obs_phase = ChildPhase::unknown;
    }
}


/// Send a signal to the child; caller is responsible for the results.
/// Do not use this to kill, pause, or continue the child--
/// use the designated methods instead.
///
/// * May throw CP_nochild_exception or CP_signal_exception
///
void Child_proc::signal_child(int sig)
{
    refresh();
    if (m_pid == NOTAPID) {
        LOG_WARNING(Lgr) << "Child_proc cannot signal " << m_name << ": no pid";
        throw CP_nochild_exception();
    }
    if (0 ==  kill(m_pid, sig)) {
        LOG_DEBUG(Lgr) << "Child_proc signalled " << m_name << " pid=" << m_pid
                       << " with signal " << sig;
    }
    else {
        LOG_WARNING(Lgr)
            << "Child_proc failed to signal " << m_name << " pid=" << m_pid
            << ": " << strerror(errno);
        throw CP_signal_exception();
    }
}

/// Wait up to wait_us MICROseconds for the observed phase to
/// transition to phase indicated by argument "tgt_phase".  Return
/// true if the observed phase is the desired target phase.
///
/// * Will NOT throw
///
bool Child_proc::wait_for_phase( ChildPhase tgt_phase, long wait_us )
{
    using namespace std::chrono;
    auto deadline = steady_clock::now() + microseconds(wait_us);
    refresh();
    while (m_obs_phase != tgt_phase) {
        auto now = steady_clock::now();
        if (now >= deadline) break;
        auto rem = duration_cast<microseconds>(deadline - now).count();
        std::this_thread::sleep_for( microseconds(std::min<long>(static_cast<long>(rem), POLL_US)) );
        refresh();
    }
    if (m_obs_phase != tgt_phase) {
        LOG_WARNING(Lgr) << "Child " << m_name << "(" << m_pid
                         << ") persists in phase " << phase_name(m_obs_phase)
                         << " instead of transitioning to "
                         << phase_name(tgt_phase);
        return false;
    }
    return true;
}


/// Stop (pause) the child process by sending SIGSTOP. If wait_us > 0
/// then wait for up to that many microseconds for the child to report
/// it has stopped--if this does not occur then throw an exception.
/// If wait_us==0 then just signal and return--do not verify.
///
/// * May throw CP_nochild_exception, CP_stop_exception, or CP_signal_exception
///
void Child_proc::stop_child( long wait_us )
{
    signal_child( SIGSTOP );
    m_cmd_phase = ChildPhase::paused;
    if (0 >= wait_us) {
        return;
    }
    if (not wait_for_phase( ChildPhase::paused, wait_us )) {
        if (m_obs_phase == ChildPhase::gone) {
            throw CP_nochild_exception();
        }
        throw CP_stop_exception();
    }
}

/// Continue a paused child process by sending child SIGCONT.  If a
/// non-zero wait_us is specified, the function will wait up to that
/// number of MICROseconds for the child to signal that is no longer
/// paused.  If no transition is observed then throw.
///
/// * May throw CP_nochild_exception, CP_cont_exception, or CP_signal_exception
///
void Child_proc::cont_child( long wait_us )
{
    signal_child( SIGCONT );
    m_cmd_phase = ChildPhase::running;
    if (0 >= wait_us) {
        return;
    }
    if (not wait_for_phase( ChildPhase::running, wait_us )) {
        if (m_obs_phase == ChildPhase::gone) {
            throw CP_nochild_exception();
        }
        throw CP_cont_exception();
    }
}


/// Signal child process to terminate.  SIGTERM is tried first unless
/// force is set; if the child has not gone within wait_us, SIGKILL
/// follows.  A paused child is continued before SIGTERM so that it can
/// handle the signal.  If even SIGKILL is not confirmed in time, the
/// child is presumed dead.
///
/// *  Will NOT throw.
///
void Child_proc::kill_child( bool force, long wait_us )
{
    refresh();
    m_cmd_phase = ChildPhase::gone;
    if (m_pid == NOTAPID) {
        m_obs_phase = ChildPhase::gone;
        return;
    }
    if ((m_obs_phase == ChildPhase::paused) and not force) {
        if (0 != kill(m_pid, SIGCONT)) {
            force = true;
        }
    }
    m_terminate = (force ? SIGKILL : SIGTERM);
    if (0 != kill( m_pid, m_terminate )) {
        LOG_WARNING(Lgr)
            << "Child_proc failed to kill " << m_name << " pid=" << m_pid
            << ": " << strerror(errno) << "  Presume dead.";
        refresh();
        if (m_pid != NOTAPID) presume_dead();
        return;
    }
    LOG_DEBUG(Lgr) << "Child_proc killed " << m_name << " pid=" << m_pid
        << " signal=" << (SIGTERM==m_terminate ? "SIGTERM" : "SIGKILL");
    if (wait_for_phase( ChildPhase::gone, wait_us )) {
        return;
    }
    if (not force) {
        LOG_WARNING(Lgr) << "Child_proc " << m_name
                         << " ignored SIGTERM; sending SIGKILL";
        m_terminate = SIGKILL;
        if ((0 == kill(m_pid, SIGKILL))
            and wait_for_phase( ChildPhase::gone, wait_us )) {
            return;
        }
    }
    LOG_ERROR(Lgr) << "Child_proc " << m_name << " pid=" << m_pid
                   << " did not die.  Presume dead.";
    presume_dead();
}

/// Presume the child is dead and reset various member vars.
///
/// *  Will NOT throw.
///
void Child_proc::presume_dead()
{
    m_obs_phase = ChildPhase::gone;
    m_old_pid = m_pid;
    m_pid = NOTAPID;
    m_terminate = 0;
    m_exit_time = time(0);
}

/// Launch the child process.  Clear args, then add arguments prior to
/// calling this function.  If a child is already running, it will
/// be killed ungently (SIGKILL) first.
///
/// * May throw CP_start_exception.
///
void Child_proc::start_child()
{
    if (m_pid != NOTAPID) {
        kill_child(true);
    }
    //
    std::vector<const char*> argv {};        // captive ptrs to args
    argv.push_back( m_bin_path.c_str() );    // arg0: the binary path
    for (std::string &s : m_args) {
        argv.push_back(s.c_str());
    }
    argv.push_back(nullptr);                 // terminate arg list
    //
    m_exit_status = 0;
    m_exit_reason = 0;
    m_terminate = 0;
    m_start_time = 0;
    m_exit_time = 0;

    pid_t pid = fork();
    if (-1 == pid) {
        LOG_ERROR(Lgr) << "Child_proc for " << m_name << " failed to fork "
                       << m_bin_path << ": " << strerror(errno);
        throw CP_start_exception();
    }
    if (pid != 0) {
        // nonzero pid:  I am running in the parent process...
        m_pid = pid;
        m_cmd_phase = ChildPhase::running;
        m_start_time = time(0);
        m_obs_phase = ChildPhase::running;
        LOG_INFO(Lgr) << "Child_proc started " << m_name
                      << " child pid=" << m_pid ;
        return;
    }
    launch_child_binary(argv);
}

/// This runs only in the child process.  Prepare file handles and exec
/// the child binary.  Only async-signal-safe calls are made here: the
/// parent may hold the logging lock in another thread at fork time.
///
void Child_proc::launch_child_binary(std::vector<const char*> &argv)
{
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) close(devnull);
    }
    execv( m_bin_path.c_str(), const_cast<char* const*>(&argv[0]) );
    _exit(127);   // exec failed; parent sees exit status 127
}

/// Run the child to completion, waiting up to wait_us microseconds,
/// and return its exit status (or 128+signal if it was killed).
///
/// * May throw CP_start_exception or CP_timeout_exception
///
int Child_proc::run_and_wait( long wait_us )
{
    start_child();
    if (not wait_for_phase( ChildPhase::gone, wait_us )) {
        kill_child(true);
        LOG_ERROR(Lgr) << "Child_proc " << m_name << " exceeded "
                       << wait_us/1000 << " ms";
        throw CP_timeout_exception();
    }
    if (m_exit_reason == CLD_EXITED) {
        return m_exit_status;
    }
    return 128 + m_exit_status;
}
