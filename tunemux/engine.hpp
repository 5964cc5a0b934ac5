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
#include "common.hpp"

class Config;

/**
 * Abstract audio engine: the mechanism that actually produces sound
 * for the local source.  One track at a time.
 */
class Audio_engine {
public:
    virtual ~Audio_engine()=0;
    //
    virtual const std::string& name() const = 0;
    virtual void configure( Config& ) = 0;
    /// Begin playing track, replacing anything playing.
    /// * May throw Engine_format_error or Engine_start_error
    virtual void start( const Track_ref& ) = 0;
    /// * May throw Engine_control_error
    virtual void pause() = 0;
    /// * May throw Engine_control_error
    virtual void resume() = 0;
    /// * Will not throw
    virtual void stop() = 0;
    /// True while a track is loaded and not finished (playing or paused).
    virtual bool busy() = 0;
    virtual bool set_volume( unsigned ) = 0;
    /// Track length in seconds, or 0 if unknown.
    virtual double duration( const Track_ref& ) = 0;
    virtual bool supports( const Track_ref& ) const = 0;
};

/// Shared pointer to an Audio_engine
using spEngine = std::shared_ptr<Audio_engine>;
