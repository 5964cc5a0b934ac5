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

#include <sstream>
#include "source.hpp"
#include "logging.hpp"


Source_host::~Source_host()
{
}

/// Printable name of a single capability bit
///
const char* cap_name( Source_cap c )
{
    switch (c) {
    case Cap_play:     return "play";
    case Cap_pause:    return "pause";
    case Cap_stop:     return "stop";
    case Cap_next:     return "next";
    case Cap_prev:     return "prev";
    case Cap_volume:   return "volume";
    case Cap_query:    return "query";
    case Cap_shutdown: return "shutdown";
    }
    return "?";
}

/// Space separated names of the capabilities in caps.
///
std::string cap_string( Cap_set caps )
{
    static const Source_cap all[] { Cap_play, Cap_pause, Cap_stop, Cap_next,
                                    Cap_prev, Cap_volume, Cap_query,
                                    Cap_shutdown };
    std::ostringstream oss;
    bool first = true;
    for (Source_cap c : all) {
        if (caps & c) {
            if (not first) oss << " ";
            oss << cap_name(c);
            first = false;
        }
    }
    return oss.str();
}


Source::Source( const std::string &name )
    : m_name(name)
{
}

Source::~Source()
{
}

/// Note an attempt to use a verb this source does not offer.
///
bool Source::unsupported( const char *verb ) const
{
    LOG_WARNING(Lgr) << "Source " << m_name << " does not support " << verb;
    return false;
}

bool Source::play( const Source_args& )  { return unsupported("play"); }
bool Source::pause( const Source_args& ) { return unsupported("pause"); }
bool Source::stop( const Source_args& )  { return unsupported("stop"); }
bool Source::next( const Source_args& )  { return unsupported("next"); }
bool Source::prev( const Source_args& )  { return unsupported("prev"); }
bool Source::set_volume( unsigned )      { return unsupported("set_volume"); }

boost::optional<Source_status> Source::get_current_playback()
{
    return boost::none;
}
