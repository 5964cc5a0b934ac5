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

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

#include "source.hpp"

namespace Json {
    class Value;
}

/**
 * A plugin source whose transport verbs are external commands, one
 * argv template per verb, as given in the plugin descriptor:
 *
 *   { "type": "command",
 *     "timeout_ms": 3000,
 *     "commands": { "play":  ["/usr/bin/mpc", "play"],
 *                   "stop":  ["/usr/bin/mpc", "stop"],
 *                   "volume": ["/usr/bin/mpc", "volume", "{volume}"] },
 *     "hooks": { "track": ["/usr/bin/logger", "now playing {arg}"] } }
 *
 * An argv element exactly "{arg}" expands to all verb arguments; inside
 * a longer element "{arg}" is replaced by the arguments joined with
 * spaces.  "{volume}" is replaced by the volume level.  A verb succeeds
 * when its command exits with status 0.  Capabilities are the verbs
 * present, plus query and shutdown: the plugin keeps its own notion of
 * whether it is playing and which track it last played.
 */
class Command_source : public Source {
private:
    using Argv = std::vector<std::string>;
    std::map<std::string,Argv> m_commands {};
    std::map<std::string,Argv> m_hooks {};
    long m_timeout_us { 3'000'000 };
    Cap_set m_caps {0};
    Hook_set m_hook_bits {0};
    mutable std::mutex m_mutex {};
    bool m_playing {false};
    std::string m_track {};
    //
    bool run( const std::map<std::string,Argv>&, const std::string&,
              const Source_args&, unsigned volume=0 ) const;
    void run_hook( const char*, const std::string& );
public:
    Command_source( const std::string&, const Json::Value& );
    static spSource create( const std::string&, const Json::Value& );
    static Argv expand( const Argv&, const Source_args&, unsigned );
    //
    Cap_set capabilities() const override { return m_caps; }
    Hook_set hooks() const override { return m_hook_bits; }
    bool play( const Source_args& ) override;
    bool pause( const Source_args& ) override;
    bool stop( const Source_args& ) override;
    bool next( const Source_args& ) override;
    bool prev( const Source_args& ) override;
    bool set_volume( unsigned ) override;
    boost::optional<Source_status> get_current_playback() override;
    void on_state_changed( const Event& ) override;
    void on_track_changed( const Event& ) override;
    void on_source_changed( const Event& ) override;
    void on_volume_changed( const Event& ) override;
    void on_shutdown() override;
};
