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

#include <string>
#include <vector>
#include <boost/filesystem.hpp>

#include "engine.hpp"
#include "childproc.hpp"

/**
 * Audio engine that runs an external decoder program (mpg123, ogg123,
 * ...) as a child process, one process per track.  Pause and resume
 * are SIGSTOP and SIGCONT; stop terminates the child.  A volume
 * change is passed to the decoder the next time a track starts.
 */
class Process_engine : public Audio_engine {
private:
    std::string m_name { "Process_engine" };
    boost::filesystem::path m_decoder { "/usr/bin/mpg123" };
    std::vector<std::string> m_decoder_args { "-q" };
    std::string m_volume_arg {};      // e.g. "-f" for mpg123; empty: none
    unsigned m_volume_scale {100};    // value passed at 100% volume
    unsigned m_volume {100};
    std::vector<std::string> m_extensions { ".mp3", ".ogg", ".flac", ".wav" };
    long m_signal_wait_us { 500'000 };
    Child_proc m_child {};
public:
    Process_engine();
    virtual ~Process_engine();
    //
    const std::string& name() const override { return m_name; }
    void configure( Config& ) override;
    void start( const Track_ref& ) override;
    void pause() override;
    void resume() override;
    void stop() override;
    bool busy() override;
    bool set_volume( unsigned ) override;
    double duration( const Track_ref& ) override { return 0.0; }
    bool supports( const Track_ref& ) const override;
};
