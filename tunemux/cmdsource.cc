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

#include <jsoncpp/json/json.h>

#include "cmdsource.hpp"
#include "childproc.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace fs = boost::filesystem;

/// Transport verbs a descriptor may define, with their capability bit
static const std::map<std::string,Source_cap> VerbCaps {
    {"play", Cap_play}, {"pause", Cap_pause}, {"stop", Cap_stop},
    {"next", Cap_next}, {"prev", Cap_prev}, {"volume", Cap_volume} };

/// Hook names a descriptor may define, with their hook bit
static const std::map<std::string,Source_hook> HookBits {
    {"state", Hook_state}, {"track", Hook_track},
    {"source", Hook_source}, {"volume", Hook_volume} };


/// Replace every occurrence of pat in s with rep, left to right.
///
static void replace_all( std::string &s, const std::string &pat,
                         const std::string &rep )
{
    size_t pos = 0;
    while ((pos = s.find(pat, pos)) != std::string::npos) {
        s.replace( pos, pat.size(), rep );
        pos += rep.size();
    }
}

/// Extract one argv template from jv, checking that it is a non-empty
/// array of strings whose first element is an absolute pathname.
///
/// * May throw Config_error
///
static std::vector<std::string>
load_argv( const std::string &plugin, const std::string &key,
           const Json::Value &jv )
{
    if (not jv.isArray() or jv.empty()) {
        LOG_ERROR(Lgr) << "Plugin " << plugin << " '" << key
                       << "' must be a non-empty array";
        throw Config_error();
    }
    std::vector<std::string> argv {};
    for (const Json::Value &item : jv) {
        if (not item.isString()) {
            LOG_ERROR(Lgr) << "Plugin " << plugin << " '" << key
                           << "' has a non-string element";
            throw Config_error();
        }
        argv.push_back( item.asString() );
    }
    fs::path bin { argv.front() };
    if (not bin.is_absolute()) {
        LOG_ERROR(Lgr) << "Plugin " << plugin << " '" << key
                       << "' needs an absolute program path, not " << bin;
        throw Config_error();
    }
    if (not fs::exists(bin)) {
        LOG_WARNING(Lgr) << "Plugin " << plugin << " '" << key
                         << "' program not found: " << bin;
    }
    return argv;
}

/// CTOR from the plugin descriptor.
///
/// * May throw Config_error
///
Command_source::Command_source( const std::string &name,
                                const Json::Value &desc )
    : Source(name)
{
    const Json::Value &cmds = desc["commands"];
    if (not cmds.isObject()) {
        LOG_ERROR(Lgr) << "Plugin " << name << " has no 'commands' object";
        throw Config_error();
    }
    for (const auto &verb : cmds.getMemberNames()) {
        auto vc = VerbCaps.find(verb);
        if (vc == VerbCaps.end()) {
            LOG_WARNING(Lgr) << "Plugin " << name << " ignores unknown verb '"
                             << verb << "'";
            continue;
        }
        m_commands[verb] = load_argv( name, verb, cmds[verb] );
        m_caps |= vc->second;
    }
    if (0 == (m_caps & Cap_play)) {
        LOG_ERROR(Lgr) << "Plugin " << name << " must define a play command";
        throw Config_error();
    }
    m_caps |= (Cap_query|Cap_shutdown);
    //
    const Json::Value &hooks = desc["hooks"];
    if (hooks.isObject()) {
        for (const auto &hname : hooks.getMemberNames()) {
            auto hb = HookBits.find(hname);
            if (hb == HookBits.end()) {
                LOG_WARNING(Lgr) << "Plugin " << name
                                 << " ignores unknown hook '" << hname << "'";
                continue;
            }
            m_hooks[hname] = load_argv( name, hname, hooks[hname] );
            m_hook_bits |= hb->second;
        }
    }
    const Json::Value &tmo = desc["timeout_ms"];
    if (not tmo.isNull()) {
        m_timeout_us = 1000L * tmo.asUInt();
    }
    LOG_INFO(Lgr) << "Plugin " << name << " capabilities: "
                  << cap_string(m_caps);
}

/// Factory used by the Source_registry for descriptors of type "command".
///
spSource Command_source::create( const std::string &name,
                                 const Json::Value &desc )
{
    return std::make_shared<Command_source>( name, desc );
}

/// Substitute placeholders in an argv template.
///
std::vector<std::string>
Command_source::expand( const Argv &tmpl, const Source_args &args,
                        unsigned volume )
{
    std::string joined {};
    for (const auto &a : args) {
        if (not joined.empty()) joined += " ";
        joined += a;
    }
    Argv out {};
    for (const auto &t : tmpl) {
        if (t == "{arg}") {
            out.insert( out.end(), args.begin(), args.end() );
            continue;
        }
        std::string s { t };
        replace_all( s, "{arg}", joined );
        replace_all( s, "{volume}", std::to_string(volume) );
        out.push_back( s );
    }
    return out;
}

/// Run the command for key from table with args; true iff it exits 0.
/// A missing key is reported as unsupported.
///
/// * Will not throw
///
bool Command_source::run( const std::map<std::string,Argv> &table,
                          const std::string &key,
                          const Source_args &args, unsigned volume ) const
{
    auto it = table.find(key);
    if (it == table.end()) {
        return unsupported( key.c_str() );
    }
    Argv argv = expand( it->second, args, volume );
    Child_proc cp { argv.front() };
    cp.set_name( name() + ":" + key );
    for (size_t i=1; i < argv.size(); ++i) {
        cp.add_arg( argv[i] );
    }
    try {
        int rc = cp.run_and_wait( m_timeout_us );
        if (rc != 0) {
            LOG_WARNING(Lgr) << "Plugin " << name() << " " << key
                             << " exited with status " << rc;
            return false;
        }
        return true;
    }
    catch (CP_exception &ex) {
        LOG_ERROR(Lgr) << "Plugin " << name() << " " << key << ": "
                       << ex.what();
        return false;
    }
}

bool Command_source::play( const Source_args &args )
{
    if (not run( m_commands, "play", args )) return false;
    std::string track {};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_playing = true;
        if (not args.empty()) {
            m_track.clear();
            for (const auto &a : args) {
                if (not m_track.empty()) m_track += " ";
                m_track += a;
            }
        }
        track = m_track;
    }
    if (m_host and not args.empty()) {
        Playback_update upd {};
        upd.track_name = track;
        m_host->update_playback_info( upd );
    }
    return true;
}

bool Command_source::pause( const Source_args &args )
{
    if (not run( m_commands, "pause", args )) return false;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_playing = false;
    return true;
}

bool Command_source::stop( const Source_args &args )
{
    if (not run( m_commands, "stop", args )) return false;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_playing = false;
    return true;
}

bool Command_source::next( const Source_args &args )
{
    return run( m_commands, "next", args );
}

bool Command_source::prev( const Source_args &args )
{
    return run( m_commands, "prev", args );
}

bool Command_source::set_volume( unsigned level )
{
    return run( m_commands, "volume", Source_args{}, level );
}

/// Self-reported status: what we last told the program to do.
///
boost::optional<Source_status> Command_source::get_current_playback()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Source_status st {};
    st.track_name = m_track;
    st.is_playing = m_playing;
    return st;
}

/// Run hook key with a single argument; failures are only logged.
///
void Command_source::run_hook( const char *key, const std::string &arg )
{
    run( m_hooks, key, Source_args{ arg } );
}

void Command_source::on_state_changed( const Event &e )
{
    run_hook( "state", state_name(e.new_state) );
}

void Command_source::on_track_changed( const Event &e )
{
    run_hook( "track", e.current );
}

void Command_source::on_source_changed( const Event &e )
{
    run_hook( "source", e.current );
}

void Command_source::on_volume_changed( const Event &e )
{
    run_hook( "volume", std::to_string(e.new_volume) );
}

/// Stop the program if we think it is playing.
///
void Command_source::on_shutdown()
{
    bool playing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        playing = m_playing;
    }
    if (playing and (m_caps & Cap_stop)) {
        stop( Source_args{} );
    }
    LOG_INFO(Lgr) << "Plugin " << name() << " shut down";
}
