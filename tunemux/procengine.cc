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
#include <cctype>
#include <stdexcept>

#include "procengine.hpp"
#include "config.hpp"
#include "configutil.hpp"
#include "logging.hpp"

namespace fs = boost::filesystem;


Audio_engine::~Audio_engine()
{
}

/// ASCII lower case in place; other bytes are left alone.
///
static void lower_case( std::string &s )
{
    std::transform( s.begin(), s.end(), s.begin(),
                    [](unsigned char c){ return static_cast<char>(std::tolower(c)); } );
}

/// CTOR
///
Process_engine::Process_engine()
{
    m_child.set_binary( m_decoder );
    m_child.set_name( "decoder" );
}

/// DTOR.  Child_proc will kill any child process.
Process_engine::~Process_engine()
{
}

/// Configure from the "Local_engine" section:
///   decoder        - pathname of the decoder binary (must exist)
///   decoder_args   - arguments that precede the track path
///   volume_arg     - decoder option that takes a volume value
///   volume_scale   - value of that option at 100% volume
///   extensions     - track filename extensions the decoder accepts
///   signal_wait_ms - how long to wait for pause/resume to be confirmed
///
/// * May throw Config_path_error or Config_error
///
void Process_engine::configure( Config &cfg )
{
    constexpr const char *Section { "Local_engine" };
    cfg.get_pathname( Section, "decoder", FileCond::MustExist, m_decoder );
    m_child.set_binary( m_decoder );
    cfg.get_strings( Section, "decoder_args", m_decoder_args );
    cfg.get_string( Section, "volume_arg", m_volume_arg );
    cfg.get_unsigned( Section, "volume_scale", m_volume_scale );
    if (cfg.get_strings( Section, "extensions", m_extensions )) {
        for (auto &ext : m_extensions) {
            lower_case( ext );
            if (not ext.empty() and ext[0] != '.') ext.insert(0, ".");
        }
    }
    std::chrono::milliseconds wait { m_signal_wait_us / 1000 };
    if (cfg.get_millis( Section, "signal_wait_ms", wait )) {
        m_signal_wait_us = static_cast<long>(wait.count()) * 1000L;
    }
    LOG_INFO(Lgr) << m_name << " decoder " << m_decoder;
}

/// True if the track has an extension the decoder handles.
///
bool Process_engine::supports( const Track_ref &track ) const
{
    std::string ext = fs::path(track).extension().string();
    lower_case( ext );
    return (std::find(m_extensions.begin(), m_extensions.end(), ext)
            != m_extensions.end());
}

/// Start the decoder on track, killing any decoder already running.
///
/// * May throw Engine_format_error or Engine_start_error
///
void Process_engine::start( const Track_ref &track )
{
    if (not supports(track)) {
        LOG_ERROR(Lgr) << m_name << " unsupported track type: " << track;
        throw Engine_format_error();
    }
    try {
        verify_readable( track );
    }
    catch (std::invalid_argument &ex) {
        LOG_ERROR(Lgr) << m_name << " track unavailable: " << ex.what();
        throw Engine_format_error();
    }
    m_child.kill_child( false, m_signal_wait_us );
    m_child.clear_args();
    for (const auto &a : m_decoder_args) {
        m_child.add_arg( a );
    }
    if (not m_volume_arg.empty()) {
        m_child.add_arg( m_volume_arg );
        m_child.add_arg( static_cast<int>((m_volume * m_volume_scale) / 100) );
    }
    m_child.add_arg( track );
    try {
        m_child.start_child();
    }
    catch (CP_exception &ex) {
        LOG_ERROR(Lgr) << m_name << " could not start decoder: " << ex.what();
        throw Engine_start_error();
    }
    LOG_INFO(Lgr) << m_name << " playing " << track;
}

/// Suspend the decoder (SIGSTOP) and wait for confirmation.
///
/// * May throw Engine_control_error
///
void Process_engine::pause()
{
    try {
        m_child.stop_child( m_signal_wait_us );
        LOG_DEBUG(Lgr) << m_name << " paused";
    }
    catch (CP_exception &ex) {
        LOG_ERROR(Lgr) << m_name << " pause failed: " << ex.what();
        throw Engine_control_error();
    }
}

/// Continue a paused decoder (SIGCONT).
///
/// * May throw Engine_control_error
///
void Process_engine::resume()
{
    try {
        m_child.cont_child( m_signal_wait_us );
        LOG_DEBUG(Lgr) << m_name << " resumed";
    }
    catch (CP_exception &ex) {
        LOG_ERROR(Lgr) << m_name << " resume failed: " << ex.what();
        throw Engine_control_error();
    }
}

/// Terminate the decoder, if any.
///
/// * Will not throw
///
void Process_engine::stop()
{
    m_child.kill_child( false, m_signal_wait_us );
    LOG_DEBUG(Lgr) << m_name << " decoder ran " << m_child.uptime() << " s";
}

/// A decoder process exists (running or paused).
///
bool Process_engine::busy()
{
    m_child.refresh();
    return (m_child.last_obs_phase() == ChildPhase::running)
        or (m_child.last_obs_phase() == ChildPhase::paused);
}

/// Record the volume for the next start.  Returns false if the decoder
/// has no volume option configured.
///
bool Process_engine::set_volume( unsigned level )
{
    m_volume = std::min(level, 100u);
    if (m_volume_arg.empty()) {
        LOG_WARNING(Lgr) << m_name << " has no volume_arg; volume ignored";
        return false;
    }
    LOG_INFO(Lgr) << m_name << " volume " << m_volume
                  << " takes effect at the next track";
    return true;
}
