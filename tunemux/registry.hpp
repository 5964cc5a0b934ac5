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

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <boost/filesystem.hpp>

#include "source.hpp"
#include "eventbus.hpp"

class Config;

namespace Json {
    class Value;
}

/// What the registry knows about a plugin descriptor on disk.
///
struct Plugin_info {
    std::string name {};
    boost::filesystem::path path {};
    std::string type {};
    std::string description {};
    bool enabled {false};   // wanted loaded
    bool loaded {false};    // instantiated and registered
};

/**
 * Implemented by the orchestrator: make sure the named source is no
 * longer active, stopping or pausing it and failing over to "local",
 * then run remove while still holding off any switch back to it.
 * Returns what remove returned.
 */
class Source_failover {
public:
    virtual ~Source_failover()=0;
    virtual bool retire_source( const std::string&,
                                const std::function<bool()>& remove )=0;
};

/// Builds a source of some plugin type from its name and descriptor.
using Source_factory =
    std::function<spSource(const std::string&, const Json::Value&)>;

/**
 * Source_registry
 *   Owns every loaded source by name.  "Available" plugins are the
 * descriptors found in the plugin directory; "loaded" sources are
 * instantiated, attached to the host, subscribed to the events they
 * hook, and controllable.  Capabilities and hooks are read once at
 * registration and cached.
 *
 * The registry lock is never held while calling into the failover
 * or into a source.
 */
class Source_registry {
private:
    struct Entry {
        spSource source;
        Cap_set caps {0};
        Hook_set hooks {0};
        bool builtin {false};
        std::vector<std::pair<Event_type,Subscription_id>> subs {};
    };
    mutable std::mutex m_mutex {};
    Event_bus &m_bus;
    Source_host *m_host {nullptr};
    Source_failover *m_failover {nullptr};
    std::map<std::string,Entry> m_loaded {};
    std::map<std::string,Plugin_info> m_available {};
    std::map<std::string,Source_factory> m_factories {};
    boost::filesystem::path m_plugin_dir {};
    bool m_auto_load {false};
    std::vector<std::string> m_enabled_names {};
    //
    void subscribe_hooks( Entry& );
    void unsubscribe_hooks( Entry& );
    static void notify_shutdown( const spSource&, Cap_set );
public:
    explicit Source_registry( Event_bus& );
    Source_registry( const Source_registry& ) = delete;
    void operator=( Source_registry const& ) = delete;
    //
    void add_factory( const std::string&, Source_factory );
    void configure( Config& );
    void set_failover( Source_failover *f ) { m_failover = f; }
    void set_host( Source_host *h ) { m_host = h; }
    //
    bool register_source( spSource, bool builtin=false );
    bool unregister_source( const std::string& );
    spSource get( const std::string& ) const;
    spSource find( const std::string& ) const;
    Cap_set caps( const std::string& ) const;
    bool has_cap( const std::string&, Source_cap ) const;
    bool is_loaded( const std::string& ) const;
    std::vector<std::string> loaded_names() const;
    std::vector<Plugin_info> available() const;
    size_t available_count() const;
    size_t loaded_count() const;
    //
    size_t scan_plugin_directory();
    bool load_plugin( const std::string& );
    void load_enabled_plugins();
    bool enable_plugin( const std::string& );
    bool disable_plugin( const std::string& );
    void shutdown_all();
};
