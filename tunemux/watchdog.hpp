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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

class Config;

/**
 * Watchdog
 *   Background loop that calls a check function on a fixed interval;
 * in tunemux the check is Player_state_machine::check_engine, which
 * detects natural end of track and advances.  Exceptions from the
 * check are logged and the loop carries on.
 *
 * stop() clears the running flag, wakes the loop, and waits at most
 * join_timeout for it to finish.  A loop that does not finish in time
 * is detached with a warning and shutdown proceeds.  close() then
 * waits out a check in progress and bars any later one, after which
 * the checked object may be destroyed.
 */
class Watchdog {
public:
    using Check_fn = std::function<bool()>;
private:
    struct Shared {
        std::atomic<bool> running {false};
        std::mutex mutex {};
        std::condition_variable wake {};
        std::atomic<unsigned long> ticks {0};
        std::atomic<unsigned long> advances {0};
        std::atomic<unsigned long> failures {0};
        std::mutex check_mutex {};      // held while check runs
        bool closed {false};
    };
    Check_fn m_check;
    std::shared_ptr<Shared> m_shared { std::make_shared<Shared>() };
    std::chrono::milliseconds m_interval { 100 };
    std::chrono::milliseconds m_join_timeout { 1000 };
    std::thread m_thread {};
    std::future<void> m_done {};
    //
    static void run_loop( std::shared_ptr<Shared>, Check_fn,
                          std::chrono::milliseconds, std::promise<void> );
public:
    explicit Watchdog( Check_fn );
    Watchdog( const Watchdog& ) = delete;
    void operator=( Watchdog const& ) = delete;
    ~Watchdog();
    //
    void configure( Config& );
    void set_interval( std::chrono::milliseconds i ) { m_interval = i; }
    void set_join_timeout( std::chrono::milliseconds t ) { m_join_timeout = t; }
    void start();
    bool stop();
    void close();
    bool running() const { return m_shared->running; }
    unsigned long ticks() const { return m_shared->ticks; }
    unsigned long advances() const { return m_shared->advances; }
    unsigned long failures() const { return m_shared->failures; }
};
