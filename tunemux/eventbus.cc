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

#include <boost/asio/post.hpp>

#include "eventbus.hpp"
#include "config.hpp"
#include "logging.hpp"


/// CTOR.  The worker pool is created lazily so that configure() may
/// still change its size.
///
Event_bus::Event_bus( unsigned workers, size_t journal_size )
    : m_workers(workers ? workers : 1),
      m_journal(journal_size)
{
}

/// DTOR. Drains and joins the workers if the owner has not already.
///
Event_bus::~Event_bus()
{
    if (not m_shutdown) {
        shutdown( m_drain_timeout );
    }
}

/// Configure from the "Event_bus" section:
///   workers          - size of the dispatch pool
///   journal_size     - number of recent events retained
///   drain_timeout_ms - default bound for drain() and shutdown()
///
/// * May throw Config_error (via Config)
///
void Event_bus::configure( Config &cfg )
{
    constexpr const char *Section { "Event_bus" };
    unsigned workers { m_workers };
    unsigned jsize { static_cast<unsigned>(m_journal.capacity()) };
    std::chrono::milliseconds drain { m_drain_timeout };
    cfg.get_unsigned( Section, "workers", workers );
    cfg.get_unsigned( Section, "journal_size", jsize );
    cfg.get_millis( Section, "drain_timeout_ms", drain );
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pool) {
        if (workers != m_workers) {
            LOG_WARNING(Lgr) << "Event_bus already running with " << m_workers
                             << " workers; ignoring workers=" << workers;
        }
    } else {
        m_workers = (workers ? workers : 1);
    }
    m_journal.set_capacity( jsize ? jsize : 1 );
    m_drain_timeout = drain;
}

/// Create the worker pool if needed.  Caller holds m_mutex.
///
void Event_bus::ensure_pool()
{
    if (not m_pool) {
        m_pool.reset( new boost::asio::thread_pool( m_workers ) );
        LOG_DEBUG(Lgr) << "Event_bus started " << m_workers << " workers";
    }
}

/// Add handler for events of type t. The owner string identifies the
/// subscriber in logs.  Returns the token needed to unsubscribe.
///
/// * Will not throw except on allocation failure
///
Subscription_id Event_bus::subscribe( Event_type t, Event_handler handler,
                                      const std::string &owner )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_pool();
    auto sub = std::make_shared<Subscription>(
        Subscription{ m_next_id++, owner, std::move(handler),
                      boost::asio::make_strand(*m_pool) } );
    m_subs[static_cast<size_t>(t)].push_back( sub );
    LOG_DEBUG(Lgr) << "Event_bus " << (owner.empty() ? "anonymous" : owner)
                   << " subscribed to " << event_name(t)
                   << " as #" << sub->id;
    return sub->id;
}

/// Remove the subscription with token id from event type t.
/// Returns false if no such subscription exists.
///
bool Event_bus::unsubscribe( Event_type t, Subscription_id id )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &subs = m_subs[static_cast<size_t>(t)];
    for (auto it=subs.begin(); it != subs.end(); ++it) {
        if ((*it)->id == id) {
            LOG_DEBUG(Lgr) << "Event_bus unsubscribed #" << id << " from "
                           << event_name(t);
            subs.erase(it);
            return true;
        }
    }
    return false;
}

/// Record e in the journal and schedule its delivery to every current
/// subscriber of its type.  Returns once delivery is scheduled.
///
/// * Will not throw except on allocation failure
///
void Event_bus::publish( const Event &e )
{
    std::vector<spSubscription> snapshot {};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_journal.push_back( e );
        ++m_published;
        if (m_shutdown) {
            LOG_DEBUG(Lgr) << "Event_bus shut down; dropped " << e.describe();
            return;
        }
        snapshot = m_subs[static_cast<size_t>(e.type)];
        if (not snapshot.empty()) {
            // counted before the lock drops, so a concurrent drain waits
            std::lock_guard<std::mutex> plock(m_pending_mutex);
            m_pending += snapshot.size();
        }
    }
    LOG_DEBUG(Lgr) << "Event_bus publish " << e.describe() << " to "
                   << snapshot.size() << " subscriber(s)";
    for (auto &sub : snapshot) {
        boost::asio::post( sub->strand, [this,sub,e]() { deliver(sub, e); } );
    }
}

/// Runs on a worker: invoke one handler in isolation.
///
void Event_bus::deliver( const spSubscription &sub, const Event &e )
{
    try {
        sub->handler( e );
        ++m_delivered;
    }
    catch (std::exception &ex) {
        ++m_handler_errors;
        LOG_ERROR(Lgr) << "Event_bus subscriber #" << sub->id << " "
                       << sub->owner << " failed on " << event_name(e.type)
                       << ": " << ex.what();
    }
    catch (...) {
        ++m_handler_errors;
        LOG_ERROR(Lgr) << "Event_bus subscriber #" << sub->id << " "
                       << sub->owner << " failed on " << event_name(e.type)
                       << ": unknown exception";
    }
    finish_one();
}

/// Count down one completed delivery and wake drain() waiters.
///
void Event_bus::finish_one()
{
    std::lock_guard<std::mutex> plock(m_pending_mutex);
    if (m_pending) --m_pending;
    if (0 == m_pending) {
        m_pending_cv.notify_all();
    }
}

/// Wait up to timeout for all scheduled deliveries to complete.
/// Returns true if nothing is left pending.
///
bool Event_bus::drain( std::chrono::milliseconds timeout )
{
    std::unique_lock<std::mutex> plock(m_pending_mutex);
    bool ok = m_pending_cv.wait_for( plock, timeout,
                                     [this]{ return 0 == m_pending; } );
    if (not ok) {
        LOG_WARNING(Lgr) << "Event_bus drain timed out with " << m_pending
                         << " deliveries pending";
    }
    return ok;
}

/// Stop accepting deliveries, wait (bounded) for the scheduled ones,
/// then stop and join the workers.
///
void Event_bus::shutdown( std::chrono::milliseconds timeout )
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
    }
    drain( timeout );
    std::unique_ptr<boost::asio::thread_pool> pool {};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pool.swap( m_pool );
        for (auto &subs : m_subs) { subs.clear(); }
    }
    if (pool) {
        pool->stop();
        pool->join();
    }
    LOG_INFO(Lgr) << "Event_bus shut down: " << m_published << " published, "
                  << m_delivered << " delivered, " << m_handler_errors
                  << " handler error(s)";
}

/// Copy of the recent events, oldest first.
///
std::vector<Event> Event_bus::journal() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<Event>( m_journal.begin(), m_journal.end() );
}

void Event_bus::clear_journal()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_journal.clear();
}

size_t Event_bus::subscriber_count( Event_type t ) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subs[static_cast<size_t>(t)].size();
}
