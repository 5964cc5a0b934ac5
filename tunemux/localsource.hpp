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

#include <chrono>
#include "source.hpp"
#include "engine.hpp"

/**
 * The default source, always loaded, named "local".  It plays tracks
 * chosen by the core through an Audio_engine and keeps the elapsed
 * position itself so that paused time is excluded.
 *
 * The state machine drives it through start/suspend/resume/halt, which
 * throw Engine_error; the generic Source verbs wrap those and return
 * false instead.  Callers hold the orchestrator lock.
 */
class Local_source : public Source {
private:
    using Clock = std::chrono::steady_clock;
    spEngine m_engine;
    Track_ref m_track {};
    double m_duration {0.0};
    bool m_armed {false};          // started and not paused or halted
    bool m_paused {false};
    Clock::time_point m_start {};  // baseline for elapsed()
    Clock::time_point m_pause_at {};
public:
    explicit Local_source( spEngine );
    //
    Cap_set capabilities() const override;
    bool play( const Source_args& ) override;
    bool pause( const Source_args& ) override;
    bool stop( const Source_args& ) override;
    bool set_volume( unsigned ) override;
    boost::optional<Source_status> get_current_playback() override;
    void on_shutdown() override;
    //
    void start( const Track_ref& );
    void suspend();
    void resume();
    void halt();
    bool armed() const { return m_armed; }
    bool paused() const { return m_paused; }
    bool busy();
    double elapsed() const;
    double duration() const { return m_duration; }
    const Track_ref& track() const { return m_track; }
    Audio_engine& engine() { return *m_engine; }
};

using spLocal = std::shared_ptr<Local_source>;
