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

#include <mutex>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include "common.hpp"

/// A playlist file could not be read.
struct Playlist_file_error : public Tunemux_exception {
    const char* what() const throw() { return "Unreadable playlist file"; }
};

/**
 * Ordered, mutable sequence of track references, safe to change while
 * another thread navigates it.  Readers get copies, never references.
 */
class Playlist {
private:
    mutable std::mutex m_mutex {};
    std::vector<Track_ref> m_tracks {};
    std::string m_name {};
public:
    void append( const Track_ref& );
    bool remove( size_t );
    void replace( const std::vector<Track_ref>&, const std::string& name="" );
    void clear();
    //
    boost::optional<Track_ref> at( size_t ) const;
    bool empty() const;
    std::string name() const;
    size_t size() const;
    std::vector<Track_ref> snapshot() const;
    //
    static std::vector<Track_ref> load_list_file( const boost::filesystem::path&,
                                                  std::string& name );
};
