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

#include "watchdog.hpp"
#include "config.hpp"
#include "logging.hpp"


/// CTOR
///
Watchdog::Watchdog( Check_fn check )
    : m_check(check)
{
}

/// DTOR. Stops the loop if the owner did not.
///
Watchdog::~Watchdog()
{
    if (m_thread.joinable()) {
        stop();
    }
    close();
}

/// Configure from the "Watchdog" section: interval_ms, join_timeout_ms.
///
void Watchdog::configure( Config &cfg )
{
    constexpr const char *Section { "Watchdog" };
    std::chrono::milliseconds interval { m_interval };
    cfg.get_millis( Section, "interval_ms", interval );
    cfg.get_millis( Section, "join_timeout_ms", m_join_timeout );
    m_interval = std::max( interval, std::chrono::milliseconds(1) );
}

/// Thread body.  Only the shared block and copies are touched, so a
/// detached loop never reaches into a destroyed Watchdog.
///
void Watchdog::run_loop( std::shared_ptr<Shared> sh, Check_fn check,
                         std::chrono::milliseconds interval,
                         std::promise<void> done )
{
    LOG_DEBUG(Lgr) << "Watchdog running, interval " << interval.count() << " ms";
    while (sh->running) {
        ++sh->ticks;
        {
            std::lock_guard<std::mutex> gate(sh->check_mutex);
            if (sh->closed) break;
            try {
                if (check()) {
                    ++sh->advances;
                }
            }
            catch (std::exception &ex) {
                ++sh->failures;
                LOG_ERROR(Lgr) << "Watchdog check failed: " << ex.what();
            }
        }
        std::unique_lock<std::mutex> lock(sh->mutex);
        sh->wake.wait_for( lock, interval, [&sh]{ return not sh->running; } );
    }
    LOG_DEBUG(Lgr) << "Watchdog loop exits";
    done.set_value();
}

/// Launch the loop thread.  No effect if already running.
///
void Watchdog::start()
{
    if (m_thread.joinable()) {
        LOG_WARNING(Lgr) << "Watchdog already started";
        return;
    }
    m_shared->running = true;
    std::promise<void> done {};
    m_done = done.get_future();
    m_thread = std::thread( run_loop, m_shared, m_check, m_interval,
                            std::move(done) );
}

/// Ask the loop to finish and join it within the join timeout.
/// Returns true if it was joined, false if it had to be abandoned.
///
/// * Will not throw
///
bool Watchdog::stop()
{
    if (not m_thread.joinable()) {
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        m_shared->running = false;
    }
    m_shared->wake.notify_all();
    if (m_done.wait_for( m_join_timeout ) == std::future_status::ready) {
        m_thread.join();
        LOG_INFO(Lgr) << "Watchdog stopped after " << m_shared->ticks
                      << " ticks";
        return true;
    }
    LOG_WARNING(Lgr) << "Watchdog did not finish within "
                     << m_join_timeout.count() << " ms; abandoning it";
    m_thread.detach();
    return false;
}

/// Wait for a check in progress to return, and make sure the loop,
/// even an abandoned one, never calls the check again.
///
/// * Will not throw
///
void Watchdog::close()
{
    std::lock_guard<std::mutex> gate(m_shared->check_mutex);
    if (not m_shared->closed) {
        m_shared->closed = true;
        LOG_DEBUG(Lgr) << "Watchdog closed";
    }
}
