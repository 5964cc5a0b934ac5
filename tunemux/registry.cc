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
#include <boost/filesystem/fstream.hpp>
#include <jsoncpp/json/json.h>

#include "registry.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace fs = boost::filesystem;


Source_failover::~Source_failover()
{
}

/// CTOR
///
Source_registry::Source_registry( Event_bus &bus )
    : m_bus(bus)
{
}

/// Make factory available for descriptors whose "type" is type.
///
void Source_registry::add_factory( const std::string &type,
                                   Source_factory factory )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_factories[type] = factory;
}

/// Configure from the "Plugins" section:
///   directory - where plugin descriptors (*.json) live
///   auto_load - load every available plugin
///   enabled   - names of plugins to load
///
/// * May throw Config_error or Config_path_error
///
void Source_registry::configure( Config &cfg )
{
    constexpr const char *Section { "Plugins" };
    fs::path dir {};
    if (cfg.get_pathname( Section, "directory", FileCond::NA, dir )) {
        m_plugin_dir = dir;
    }
    bool autol { m_auto_load };
    cfg.get_bool( Section, "auto_load", autol );
    std::vector<std::string> names {};
    cfg.get_strings( Section, "enabled", names );
    std::lock_guard<std::mutex> lock(m_mutex);
    m_auto_load = autol;
    m_enabled_names = names;
}

/// Subscribe the hooks an entry declares.  Handlers hold the source
/// weakly so a late delivery after unload is harmless.
///
void Source_registry::subscribe_hooks( Entry &e )
{
    std::weak_ptr<Source> wp { e.source };
    const std::string &owner = e.source->name();
    if (e.hooks & Hook_state) {
        e.subs.emplace_back( Event_type::state_changed,
            m_bus.subscribe( Event_type::state_changed, [wp](const Event &ev) {
                    if (auto sp = wp.lock()) sp->on_state_changed(ev); },
                owner ) );
    }
    if (e.hooks & Hook_track) {
        e.subs.emplace_back( Event_type::track_changed,
            m_bus.subscribe( Event_type::track_changed, [wp](const Event &ev) {
                    if (auto sp = wp.lock()) sp->on_track_changed(ev); },
                owner ) );
    }
    if (e.hooks & Hook_source) {
        e.subs.emplace_back( Event_type::source_changed,
            m_bus.subscribe( Event_type::source_changed, [wp](const Event &ev) {
                    if (auto sp = wp.lock()) sp->on_source_changed(ev); },
                owner ) );
    }
    if (e.hooks & Hook_volume) {
        e.subs.emplace_back( Event_type::volume_changed,
            m_bus.subscribe( Event_type::volume_changed, [wp](const Event &ev) {
                    if (auto sp = wp.lock()) sp->on_volume_changed(ev); },
                owner ) );
    }
}

void Source_registry::unsubscribe_hooks( Entry &e )
{
    for (auto &s : e.subs) {
        m_bus.unsubscribe( s.first, s.second );
    }
    e.subs.clear();
}

/// Tell a source it is being shut down, if its cached capabilities
/// include the shutdown hook, and detach it.  Failures are logged only.
///
void Source_registry::notify_shutdown( const spSource &src, Cap_set caps )
{
    try {
        if (caps & Cap_shutdown) {
            src->on_shutdown();
        }
    }
    catch (std::exception &ex) {
        LOG_WARNING(Lgr) << "Source " << src->name()
                         << " failed during shutdown: " << ex.what();
    }
    src->attach( nullptr );
}

/// Add src to the loaded set, caching its capabilities and hooks and
/// subscribing its hooks.  Returns false if the name is taken.
///
/// * Will not throw except on allocation failure
///
bool Source_registry::register_source( spSource src, bool builtin )
{
    if (not src) return false;
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string &name = src->name();
    if (m_loaded.count(name)) {
        LOG_WARNING(Lgr) << "Source_registry already has a source named "
                         << name;
        return false;
    }
    Entry e {};
    e.source = src;
    e.caps = src->capabilities();
    e.hooks = src->hooks();
    e.builtin = builtin;
    src->attach( m_host );
    subscribe_hooks( e );
    m_loaded.emplace( name, std::move(e) );
    auto ai = m_available.find(name);
    if (ai != m_available.end()) {
        ai->second.loaded = true;
    }
    LOG_INFO(Lgr) << "Source_registry loaded " << name << " ["
                  << cap_string(src->capabilities()) << "]";
    return true;
}

/// Remove the named source from the loaded set.  In order: fail over
/// away from it if it is active, drop its subscriptions, drop it from
/// the loaded set, then tell it to shut down.  The plugin stays
/// available while its descriptor still exists.  Built-in sources
/// cannot be unregistered.
///
/// * Will not throw except on allocation failure
///
bool Source_registry::unregister_source( const std::string &name )
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_loaded.find(name);
        if (it == m_loaded.end()) {
            LOG_WARNING(Lgr) << "Source_registry: " << name << " is not loaded";
            return false;
        }
        if (it->second.builtin) {
            LOG_WARNING(Lgr) << "Source_registry: " << name
                             << " is built in and cannot be unloaded";
            return false;
        }
    }
    spSource src {};
    Cap_set caps {0};
    auto remove = [&]() -> bool {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_loaded.find(name);
        if (it == m_loaded.end()) {
            return false;       // lost a race with another unregister
        }
        unsubscribe_hooks( it->second );
        src = it->second.source;
        caps = it->second.caps;
        m_loaded.erase( it );
        auto ai = m_available.find(name);
        if (ai != m_available.end()) {
            if (fs::exists(ai->second.path)) {
                ai->second.loaded = false;
            } else {
                m_available.erase( ai );
            }
        }
        return true;
    };
    bool removed = (m_failover ? m_failover->retire_source( name, remove )
                               : remove());
    if (not removed) return false;
    notify_shutdown( src, caps );
    LOG_INFO(Lgr) << "Source_registry unloaded " << name;
    return true;
}

/// Named loaded source.
///
/// * May throw Source_unavailable
///
spSource Source_registry::get( const std::string &name ) const
{
    spSource sp = find(name);
    if (not sp) {
        LOG_WARNING(Lgr) << "Source_registry: no source named " << name;
        throw Source_unavailable();
    }
    return sp;
}

/// Named loaded source, or nullptr.
///
spSource Source_registry::find( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_loaded.find(name);
    return (it == m_loaded.end() ? spSource {} : it->second.source);
}

/// Cached capabilities of a loaded source.
///
/// * May throw Source_unavailable
///
Cap_set Source_registry::caps( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_loaded.find(name);
    if (it == m_loaded.end()) {
        throw Source_unavailable();
    }
    return it->second.caps;
}

bool Source_registry::has_cap( const std::string &name, Source_cap c ) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_loaded.find(name);
    return (it != m_loaded.end()) and (it->second.caps & c);
}

bool Source_registry::is_loaded( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded.count(name) > 0;
}

std::vector<std::string> Source_registry::loaded_names() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names {};
    for (const auto &kv : m_loaded) {
        names.push_back( kv.first );
    }
    return names;
}

std::vector<Plugin_info> Source_registry::available() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Plugin_info> out {};
    for (const auto &kv : m_available) {
        out.push_back( kv.second );
    }
    return out;
}

size_t Source_registry::available_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t Source_registry::loaded_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded.size();
}

/// Read a plugin descriptor.
///
/// * May throw Config_file_error
///
static Json::Value read_descriptor( const fs::path &p )
{
    Json::Value root {};
    try {
        fs::ifstream sfile(p);
        sfile >> root;
    }
    catch (std::exception &e) {
        LOG_ERROR(Lgr) << "Plugin descriptor " << p << " unreadable: "
                       << e.what();
        throw Config_file_error();
    }
    return root;
}

/// Rescan the plugin directory for *.json descriptors.  The plugin
/// name is the file stem.  Returns the number of available plugins.
///
/// * Will not throw
///
size_t Source_registry::scan_plugin_directory()
{
    fs::path dir;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dir = m_plugin_dir;
    }
    std::map<std::string,Plugin_info> found {};
    if (dir.empty() or not fs::is_directory(dir)) {
        LOG_WARNING(Lgr) << "Source_registry: no plugin directory " << dir;
    } else {
        boost::system::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
            if (ec) break;
            const fs::path &p = it->path();
            if (p.extension() != ".json" or not fs::is_regular_file(p)) continue;
            Plugin_info info {};
            info.name = p.stem().string();
            info.path = p;
            try {
                Json::Value desc = read_descriptor(p);
                info.type = desc.get("type", "").asString();
                info.description = desc.get("description", "").asString();
            }
            catch (std::exception &ex) {
                LOG_WARNING(Lgr) << "Skipping plugin " << p << ": " << ex.what();
                continue;
            }
            found.emplace( info.name, info );
        }
        if (ec) {
            LOG_ERROR(Lgr) << "Source_registry scanning " << dir << ": "
                           << ec.message();
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &kv : found) {
        auto old = m_available.find(kv.first);
        if (old != m_available.end()) {
            kv.second.enabled = old->second.enabled;
        }
        kv.second.loaded = (m_loaded.count(kv.first) > 0);
    }
    for (auto &kv : m_available) {   // keep loaded plugins whose file vanished
        if (kv.second.loaded and not found.count(kv.first)) {
            found.insert( kv );
        }
    }
    m_available.swap( found );
    LOG_INFO(Lgr) << "Source_registry found " << m_available.size()
                  << " plugin(s) in " << dir;
    return m_available.size();
}

/// Instantiate and register an available plugin.
///
/// * Will not throw except on allocation failure
///
bool Source_registry::load_plugin( const std::string &name )
{
    Plugin_info info {};
    Source_factory factory {};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_loaded.count(name)) return true;
        auto ai = m_available.find(name);
        if (ai == m_available.end()) {
            LOG_WARNING(Lgr) << "Source_registry: plugin " << name
                             << " is not available";
            return false;
        }
        info = ai->second;
        auto fi = m_factories.find(info.type);
        if (fi == m_factories.end()) {
            LOG_ERROR(Lgr) << "Source_registry: plugin " << name
                           << " has unknown type '" << info.type << "'";
            return false;
        }
        factory = fi->second;
    }
    spSource src {};
    try {
        Json::Value desc = read_descriptor( info.path );
        src = factory( name, desc );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "Source_registry could not load plugin " << name
                       << ": " << ex.what();
        return false;
    }
    return register_source( src );
}

/// Load the plugins named in the configuration (all of them with
/// auto_load).  Failures are logged and skipped.
///
void Source_registry::load_enabled_plugins()
{
    std::vector<std::string> names {};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_auto_load) {
            for (auto &kv : m_available) names.push_back(kv.first);
        } else {
            names = m_enabled_names;
        }
        for (auto &n : names) {
            auto ai = m_available.find(n);
            if (ai != m_available.end()) ai->second.enabled = true;
        }
    }
    for (auto &n : names) {
        load_plugin( n );
    }
}

/// Mark an available plugin enabled and load it.
///
bool Source_registry::enable_plugin( const std::string &name )
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto ai = m_available.find(name);
        if (ai == m_available.end()) {
            LOG_WARNING(Lgr) << "Source_registry: cannot enable unknown plugin "
                             << name;
            return false;
        }
        ai->second.enabled = true;
    }
    return load_plugin( name );
}

/// Mark a plugin disabled and unload it if loaded.
///
bool Source_registry::disable_plugin( const std::string &name )
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto ai = m_available.find(name);
        if (ai != m_available.end()) {
            ai->second.enabled = false;
        }
    }
    if (not is_loaded(name)) {
        return false;
    }
    return unregister_source( name );
}

/// Shut down every loaded source: plugins first, built-ins last.  The
/// owner fails over to the local source before calling this.
///
void Source_registry::shutdown_all()
{
    std::vector<std::pair<spSource,Cap_set>> order {};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (int pass=0; pass < 2; ++pass) {
            for (auto &kv : m_loaded) {
                if (kv.second.builtin == (pass == 1)) {
                    unsubscribe_hooks( kv.second );
                    order.emplace_back( kv.second.source, kv.second.caps );
                }
            }
        }
        m_loaded.clear();
        for (auto &kv : m_available) {
            kv.second.loaded = false;
        }
    }
    for (auto &sc : order) {
        LOG_INFO(Lgr) << "Source_registry shutting down " << sc.first->name();
        notify_shutdown( sc.first, sc.second );
    }
}
