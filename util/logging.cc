/**
 * Boost logging setup and teardown functions.
 */


/*   Part of the tunemux package.
 *
 *   Copyright 2026 The tunemux authors
 *   Portions copyright 2020 Steven A. Harp (rsked)
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

#include "logging.hpp"

#include <boost/log/expressions.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>

#include "configutil.hpp"

namespace logging = boost::log;
namespace triv = boost::log::trivial;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;
namespace attrs = boost::log::attributes;

/// Application name to include
static const char* LogAppName="tunemux";

/// Global log source for tunemux:
tunemux_logger_t  Lgr;

/// tunemux log formatter : prints timestamp, severity and the thread
/// that produced the record (command loop, watchdog, or a bus worker).
///
static void tlog_formatter(logging::record_view const& rec,
                           logging::formatting_ostream& strm)
{
    auto date_time_formatter = expr::stream
        << expr::format_date_time< boost::posix_time::ptime >
               ("TimeStamp","%Y-%m-%d %H:%M:%S.%f");
    date_time_formatter(rec, strm);
    strm << " <" << rec[lt::severity] << "> [" << LogAppName;
    auto tid = logging::extract< attrs::current_thread_id::value_type >(
        "ThreadID", rec);
    if (tid) {
        strm << ":" << tid.get();
    }
    strm << "] " << rec[expr::smessage];
}

using sink_t = sinks::synchronous_sink< sinks::text_file_backend >;

/// Setup for logs to be collected into a directory.
///
static void
init_file_collecting(boost::shared_ptr< sink_t > sink)
{
    auto realpath = expand_home("~/logs_old");

    sink->locked_backend()->set_file_collector(sinks::file::make_collector(
        keywords::target = realpath.c_str(),
        keywords::max_size = 16 * 1024 * 1024, // 16 MB limit
        keywords::min_free_space = 100 * 1024 * 1024, // leave this many MB free
        keywords::max_files = 7
    ));
}

/// Log to files, rotating at midnight daily or if the size grows to
/// more than 5MB.  file_pattern indicates the log filename pattern.
/// autoflush this backend so we can capture errors asap
///
static void
init_file_logging( boost::shared_ptr< logging::core > core,
                   const char* file_pattern )
{
    boost::shared_ptr< sinks::text_file_backend > backend =
        boost::make_shared< sinks::text_file_backend >(
            keywords::file_name = file_pattern,
            keywords::rotation_size = (5 * 1024 * 1024),
            keywords::time_based_rotation
               = sinks::file::rotation_at_time_point(0, 0, 0)
            );
    backend->auto_flush(true);

    boost::shared_ptr< sink_t > sink(new sink_t(backend));

    // Upon restart, scan the directory for files matching file_pattern
    init_file_collecting(sink);
    sink->locked_backend()->scan_for_files();

    sink->set_formatter(&tlog_formatter);
    core->add_sink(sink);
}


/// Create a console ostream backend and attach std::clog to it
///
static void
init_console_logging( boost::shared_ptr< logging::core > core )
{
    boost::shared_ptr< sinks::text_ostream_backend > os_backend =
        boost::make_shared< sinks::text_ostream_backend >();

    os_backend->add_stream(
        boost::shared_ptr< std::ostream >(&std::clog, boost::null_deleter()));
    os_backend->auto_flush(true);

    using os_sink_t = sinks::synchronous_sink< sinks::text_ostream_backend >;
    boost::shared_ptr< os_sink_t > os_sink(new os_sink_t(os_backend));
    os_sink->set_formatter(&tlog_formatter);
    core->add_sink(os_sink);
}


/// Init the logger with console and/or text_file_backends
/// Typical file_pattern: "tunemux_%5N.log"
///
void init_logging(const char* appname, const char* file_pattern, int flags)
{
    LogAppName = appname;
    boost::shared_ptr< logging::core > core = logging::core::get();
    if (flags & LF_FILE) {
        init_file_logging(core,file_pattern);
    }
    if (flags & LF_CONSOLE) {
        init_console_logging(core);
    }
    logging::add_common_attributes();   // TimeStamp, ThreadID, ...

    // Set level filter ignore debug messages unless LF_DEBUG flag
    if (0 == (flags & LF_DEBUG)) {
        core->set_filter(triv::severity >= triv::info);
    }
}

/// Terminate the logger, flushing and detaching all sinks.
///
void finish_logging()
{
    auto core = logging::core::get();
    core->flush();
    core->remove_all_sinks();
}
