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


#include <string>
#include <sstream>
#include <stdexcept>
#include <stdio.h>
#include "configutil.hpp"

namespace fs = boost::filesystem;
using namespace std;

////////////////////////////////////////////////////////////////////////


/// Expand a leading '~' to the home directory in the argument path,
/// and return the result.  Only "~" and "~/..." are recognized; a
/// "~user" prefix is returned unchanged.
///
/// * May throw invalid_argument if HOME is needed but not set.
///
fs::path expand_home(fs::path inpath)
{
    if (inpath.empty()) return inpath;
    string out { inpath.string() };
    if (out[0] != '~') return inpath;
    if ((out.size() > 1) and (out[1] != '/')) return inpath;
    char const* phome = getenv("HOME");
    if (nullptr == phome) {
        throw invalid_argument("HOME not set in environment.");
    }
    out.replace(0, 1, phome);
    return fs::path(out);
}

////////////////////////////////////////////////////////////////////////

/// Check by reading a byte from the named file, or verifying
/// that the directory may be enumerated and is *non-empty*.
/// Returns true if readable.
///
/// * May throw invalid_argument naming the offending path.
///
bool verify_readable( const fs::path &p )
{
    if (not fs::exists(p)) {
        throw invalid_argument(string("No such path ")+p.native());
    }
    if (fs::is_directory(p)) {
        for (fs::directory_entry& x : fs::directory_iterator(p)) {
            if (fs::is_regular_file(x.path()) and verify_readable(x.path())) {
                return true;
            }
        }
        throw invalid_argument(string("No readable files in ")+p.native());
    }
    if (fs::is_regular_file(p)) {
        FILE *sfile = fopen(p.c_str(),"r");
        if (sfile) {
            fclose(sfile);
            return true;
        }
        throw invalid_argument(string("Cannot read file ")+p.native());
    }
    throw invalid_argument("Cannot verify path "+ p.native());
}

/// Split a command line into whitespace separated words.
///
vector<string> split_words( const string &line )
{
    vector<string> words {};
    istringstream iss { line };
    string w;
    while (iss >> w) {
        words.push_back(w);
    }
    return words;
}

/// Copy of s without leading or trailing whitespace.
///
string trim_copy( const string &s )
{
    const char *ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == string::npos) return string {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e-b+1);
}
