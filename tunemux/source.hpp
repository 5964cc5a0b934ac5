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

#include <memory>
#include <string>
#include <boost/optional.hpp>

#include "common.hpp"
#include "events.hpp"
#include "playinfo.hpp"

/// Transport capabilities a source may offer, as bits of a Cap_set.
///
enum Source_cap : unsigned {
    Cap_play     = 0x01,
    Cap_pause    = 0x02,
    Cap_stop     = 0x04,
    Cap_next     = 0x08,
    Cap_prev     = 0x10,
    Cap_volume   = 0x20,
    Cap_query    = 0x40,
    Cap_shutdown = 0x80
};
using Cap_set = unsigned;

/// Event hooks a source implements, as bits of a Hook_set.
///
enum Source_hook : unsigned {
    Hook_state  = 0x01,
    Hook_track  = 0x02,
    Hook_source = 0x04,
    Hook_volume = 0x08
};
using Hook_set = unsigned;

const char* cap_name( Source_cap );
std::string cap_string( Cap_set );


/**
 * The narrow interface a source may use to talk back to the core.
 * Sources never hold the orchestrator itself.
 */
class Source_host {
public:
    virtual ~Source_host()=0;
    //
    virtual void update_playback_info( const Playback_update& )=0;
    virtual Playback_info get_current_playback()=0;
    virtual bool ensure_exclusive_playback( const std::string& )=0;
    virtual boost::optional<Track_ref> navigate_track( Direction )=0;
};


/**
 * Abstract Source interface. The local source and plugin sources
 * inherit from this.  Transport verbs return true on success; a verb
 * outside capabilities() returns false without side effects.  Hooks
 * are only invoked for the bits declared by hooks().  None of these
 * methods should throw; the registry and orchestrator log and contain
 * any exception that does escape.
 */
class Source {
private:
    std::string m_name;
protected:
    Source_host *m_host {nullptr};   // not owned
    bool unsupported( const char* ) const;
public:
    explicit Source( const std::string& );
    virtual ~Source()=0;
    Source(const Source&) = delete;
    void operator=(Source const&) = delete;
    //
    const std::string& name() const { return m_name; }
    void attach( Source_host *host ) { m_host = host; }
    //
    virtual Cap_set capabilities() const = 0;
    virtual Hook_set hooks() const { return 0; }
    //
    virtual bool play( const Source_args& );
    virtual bool pause( const Source_args& );
    virtual bool stop( const Source_args& );
    virtual bool next( const Source_args& );
    virtual bool prev( const Source_args& );
    virtual bool set_volume( unsigned );
    virtual boost::optional<Source_status> get_current_playback();
    //
    virtual void on_state_changed( const Event& ) {}
    virtual void on_track_changed( const Event& ) {}
    virtual void on_source_changed( const Event& ) {}
    virtual void on_volume_changed( const Event& ) {}
    virtual void on_shutdown() {}
};

/// Shared Pointer to a Source
using spSource = std::shared_ptr<Source>;
