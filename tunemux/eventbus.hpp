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

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>
#include <boost/asio/strand.hpp>
#include <boost/circular_buffer.hpp>

#include "events.hpp"

class Config;

/// Callback invoked for each delivered event
using Event_handler = std::function<void(const Event&)>;

/// Token returned by subscribe(), used to unsubscribe
using Subscription_id = unsigned long;

/**
 * Event_bus
 *   Thread-safe publish/subscribe hub.  publish() takes a snapshot of
 * the subscribers for the event type under the lock, then schedules one
 * delivery per subscriber on a bounded worker pool and returns without
 * waiting.  Every subscription owns a strand: deliveries to a single
 * subscriber are serialized in publish order, while different
 * subscribers run in parallel.  A handler that throws is logged and
 * counted; neither the publisher nor other subscribers notice.
 *
 * Handlers may subscribe, unsubscribe and publish from inside a
 * delivery.  They must not call drain() or shutdown().
 *
 * A delivery already scheduled when unsubscribe() is called may still
 * run once.
 */
class Event_bus {
private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;
    struct Subscription {
        Subscription_id id;
        std::string owner;
        Event_handler handler;
        Strand strand;
    };
    using spSubscription = std::shared_ptr<Subscription>;
    //
    mutable std::mutex m_mutex {};      // guards all but the pending count
    std::array<std::vector<spSubscription>,N_EVENT_TYPES> m_subs {};
    Subscription_id m_next_id {1};
    unsigned m_workers {4};
    std::unique_ptr<boost::asio::thread_pool> m_pool {};
    boost::circular_buffer<Event> m_journal { 128 };
    bool m_shutdown {false};
    std::chrono::milliseconds m_drain_timeout { 2000 };
    //
    std::mutex m_pending_mutex {};
    std::condition_variable m_pending_cv {};
    unsigned long m_pending {0};
    //
    std::atomic<unsigned long> m_published {0};
    std::atomic<unsigned long> m_delivered {0};
    std::atomic<unsigned long> m_handler_errors {0};
    //
    void deliver( const spSubscription&, const Event& );
    void ensure_pool();
    void finish_one();
public:
    explicit Event_bus( unsigned workers=4, size_t journal_size=128 );
    Event_bus( const Event_bus& ) = delete;
    Event_bus& operator=( const Event_bus& ) = delete;
    ~Event_bus();
    //
    void configure( Config& );
    Subscription_id subscribe( Event_type, Event_handler,
                               const std::string& owner="" );
    bool unsubscribe( Event_type, Subscription_id );
    void publish( const Event& );
    bool drain( std::chrono::milliseconds );
    bool drain() { return drain(m_drain_timeout); }
    void shutdown( std::chrono::milliseconds );
    void shutdown() { shutdown(m_drain_timeout); }
    //
    void clear_journal();
    std::vector<Event> journal() const;
    size_t subscriber_count( Event_type ) const;
    unsigned long published() const { return m_published; }
    unsigned long delivered() const { return m_delivered; }
    unsigned long handler_errors() const { return m_handler_errors; }
};
