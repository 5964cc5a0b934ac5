/**
 * Methods for the configuration class Config
 * This uses a simplified JSON with a 2-level structure
 * consisting of (1) section, and (2) parameter within section.
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

#include <ctime>
#include <cstring>
#include <sstream>
#include <boost/filesystem/fstream.hpp>
#include <jsoncpp/json/json.h>

#include "logging.hpp"
#include "config.hpp"
#include "configutil.hpp"

namespace fs = boost::filesystem;


////////////////////////////////////////////////////////////////////////


/// CTOR for an empty Config; every getter will report "not found"
///
Config::Config()
{ }

/// CTOR with config path
///
Config::Config(const char* pathname)
{
    set_config_path(pathname);
}


/// Sets the configuration path.  This does *not* verify that
/// the file exists.
///
void Config::set_config_path( const std::string& p )
{
    m_config_path = expand_home(p);
}

/// Note the declared schema of the loaded document.
///
void Config::take_schema()
{
    const Json::Value &sch = m_croot["schema"];
    m_schema = (sch.isString() ? sch.asString() : "unknown");
}

/// Read configuration parameters per m_config_path.
///
/// * May throw Config_file_error
///
void Config::read_config()
{
    if (not fs::exists(m_config_path)) {
        LOG_ERROR(Lgr) << "Config no such file: " << m_config_path;
        throw Config_file_error();
    }
    Json::CharReaderBuilder builder;
    std::string errs;
    fs::ifstream sfile(m_config_path);
    if (not sfile or not Json::parseFromStream( builder, sfile, &m_croot, &errs )) {
        LOG_ERROR(Lgr) << "Config error reading from "
                       << m_config_path << ": " << errs;
        throw Config_file_error();
    }
    if (not m_croot.isObject()) {
        LOG_ERROR(Lgr) << "Config " << m_config_path << " is not a JSON object";
        throw Config_file_error();
    }
    m_loadtime = time(0);
    take_schema();
}

/// Load configuration directly from JSON text, e.g. for tests or the
/// built-in defaults.  Relative pathnames are then taken as they are.
///
/// * May throw Config_error
///
void Config::read_string( const std::string &text )
{
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream iss { text };
    if (not Json::parseFromStream( builder, iss, &m_croot, &errs )
        or not m_croot.isObject()) {
        LOG_ERROR(Lgr) << "Config error parsing text: " << errs;
        throw Config_error();
    }
    m_loadtime = time(0);
    take_schema();
}

/// Log where the configuration came from and its declared schema.
///
void Config::log_about()
{
    std::string when = std::ctime(&m_loadtime);
    when.pop_back();
    LOG_INFO(Lgr) << "Config loaded from "
                  << (m_config_path.empty() ? fs::path("<text>") : m_config_path)
                  << " at " << when << ", schema " << m_schema;
}

/// True if the document has an object named section.
///
bool Config::has_section( const char *section ) const
{
    return m_croot.isObject() and m_croot.isMember(section)
        and m_croot[section].isObject();
}

/// Locate section.param; nullptr if either is absent or null.
///
const Json::Value* Config::find( const char *section, const char *param ) const
{
    if (not has_section(section)) return nullptr;
    const Json::Value *v = m_croot[section].find( param, param+strlen(param) );
    if (v and v->isNull()) return nullptr;
    return v;
}

/// Log a parameter of the wrong JSON type and throw.
///
/// * Will throw Config_error
///
void Config::bad_type( const char *section, const char *param,
                       const char *wanted ) const
{
    LOG_ERROR(Lgr) << "Config " << section << "." << param
                   << " must be " << wanted;
    throw Config_error();
}

/// Retrieve a bool from section.param into value.
///
/// * May throw Config_error
///
bool Config::get_bool(const char *section, const char *param, bool &value)
{
    const Json::Value *v = find( section, param );
    if (not v) return false;
    if (not v->isBool()) bad_type( section, param, "true or false" );
    value = v->asBool();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "="
                  << (value ? "true" : "false");
    return true;
}

/// Retrieve a non-negative integer from section.param into value.
///
/// * May throw Config_error
///
bool Config::get_unsigned(const char *section, const char *param,
                          unsigned &value)
{
    const Json::Value *v = find( section, param );
    if (not v) return false;
    if (not v->isUInt()) bad_type( section, param, "a non-negative integer" );
    value = v->asUInt();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "=" << value;
    return true;
}

/// Retrieve a duration in milliseconds from section.param; by
/// convention such parameters are named "*_ms".
///
/// * May throw Config_error
///
bool Config::get_millis(const char *section, const char *param,
                        std::chrono::milliseconds &value)
{
    unsigned ms {0};
    if (not get_unsigned( section, param, ms )) return false;
    value = std::chrono::milliseconds( ms );
    return true;
}

/// Retrieve a string from section.param into value.
///
/// * May throw Config_error
///
bool Config::get_string(const char *section, const char *param,
                        std::string &value)
{
    const Json::Value *v = find( section, param );
    if (not v) return false;
    if (not v->isString()) bad_type( section, param, "a string" );
    value = v->asString();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "=" << value;
    return true;
}

/// Retrieve an array of strings from section.param, replacing the
/// contents of values.  A scalar string is accepted as a one element
/// array.
///
/// * May throw Config_error
///
bool Config::get_strings(const char *section, const char *param,
                         std::vector<std::string> &values)
{
    const Json::Value *v = find( section, param );
    if (not v) return false;
    std::vector<std::string> found {};
    if (v->isString()) {
        found.push_back( v->asString() );
    } else if (v->isArray()) {
        for (const Json::Value &item : *v) {
            if (not item.isString()) bad_type( section, param, "strings" );
            found.push_back( item.asString() );
        }
    } else {
        bad_type( section, param, "a string or an array of strings" );
    }
    values.swap( found );
    LOG_INFO(Lgr) << "Config " << section << "." << param << " has "
                  << values.size() << " item(s)";
    return true;
}

/// Retrieve a pathname from section.param into value, expanding a
/// leading ~.  A relative path is taken relative to the directory of
/// the config file.  The FileCond is then checked against value,
/// whether or not the parameter was present.
///
/// * May throw Config_path_error or Config_error
///
bool Config::get_pathname( const char *section, const char *param,
                           FileCond cond, boost::filesystem::path &value)
{
    std::string text {};
    bool found = get_string( section, param, text );
    if (found) {
        value = expand_home( text );
        if (value.is_relative() and not m_config_path.empty()) {
            value = m_config_path.parent_path() / value;
        }
    }
    const char *problem { nullptr };
    switch (cond) {
    case FileCond::MustExist:
        if (not fs::is_regular_file(value)) problem = "File not found";
        break;
    case FileCond::MustNotExist:
        if (fs::exists(value)) problem = "File already exists";
        break;
    case FileCond::MustExistDir:
        if (not fs::is_directory(value)) problem = "Directory not found";
        break;
    case FileCond::NA:
        break;
    }
    if (problem) {
        LOG_ERROR(Lgr) << "Config " << section << "." << param
                       << ", " << problem << ": " << value;
        throw Config_path_error();
    }
    return found;
}
