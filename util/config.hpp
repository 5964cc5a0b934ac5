#pragma once


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

#include <chrono>
#include <ctime>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <jsoncpp/json/json.h>

/// Conditions for testing pathnames
enum class FileCond { NA, MustExist, MustNotExist, MustExistDir };

/// Defects in the configuration file content
struct Config_error : std::exception {
    const char *what() const noexcept {
        return "Defective configuration file.";
    }
};

/// Error reading a config file.
///
struct Config_file_error : std::exception {
    const char *what() const noexcept {
        return "Missing or unreadable configuration file.";
    }
};

/// A pathname value did (not) exist.
///
struct Config_path_error : std::exception {
    const char *what() const noexcept {
        return "Pathname condition failed.";
    }
};

/* Configuration object.  Loads a two level JSON document (section,
 * then parameter) from a file or from text, and hands out typed
 * parameters.  One instance is created by the application and passed
 * by reference to each component's configure() method.
 *
 * Getters return true iff the parameter is present, leaving the
 * caller's default untouched otherwise.  A parameter of the wrong JSON
 * type is logged and reported as Config_error.
 */
class Config {
private:
    std::time_t m_loadtime {0};
    Json::Value m_croot {};
    std::string m_schema {};
    boost::filesystem::path m_config_path {};
    //
    const Json::Value* find( const char*, const char* ) const;
    void bad_type( const char*, const char*, const char* ) const;
    void take_schema();
public:
    bool get_bool(const char*, const char*, bool&);
    bool get_unsigned(const char*, const char*, unsigned&);
    bool get_millis(const char*, const char*, std::chrono::milliseconds&);
    bool get_string(const char*, const char*, std::string&);
    bool get_strings(const char*, const char*, std::vector<std::string>&);
    bool get_pathname( const char*, const char*,
                       FileCond,  boost::filesystem::path &);
    bool has_section( const char* ) const;
    const std::string& get_schema() const { return m_schema; }
    //
    const boost::filesystem::path& config_path() const { return m_config_path; }
    bool loaded() const { return m_loadtime > 0; }
    void log_about();
    void read_config();
    void read_string(const std::string&);
    void set_config_path( const std::string& );
    //
    Config();
    Config(const char*); // config file pathname
};
