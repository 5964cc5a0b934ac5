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

#include <boost/filesystem/fstream.hpp>

#include "playlist.hpp"
#include "configutil.hpp"
#include "logging.hpp"

namespace fs = boost::filesystem;


void Playlist::append( const Track_ref &t )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tracks.push_back( t );
}

bool Playlist::remove( size_t pos )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (pos >= m_tracks.size()) return false;
    m_tracks.erase( m_tracks.begin() + static_cast<long>(pos) );
    return true;
}

void Playlist::replace( const std::vector<Track_ref> &tracks,
                        const std::string &name )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tracks = tracks;
    m_name = name;
}

void Playlist::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tracks.clear();
    m_name.clear();
}

boost::optional<Track_ref> Playlist::at( size_t pos ) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (pos >= m_tracks.size()) return boost::none;
    return m_tracks[pos];
}

bool Playlist::empty() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tracks.empty();
}

std::string Playlist::name() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_name;
}

size_t Playlist::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tracks.size();
}

std::vector<Track_ref> Playlist::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tracks;
}

/// Read a list file: one track path per line, '#' starts a comment
/// line, and a "name:" line gives the playlist name.  Relative paths
/// are taken relative to the list file's directory; '~' is expanded.
///
/// * May throw Playlist_file_error
///
std::vector<Track_ref>
Playlist::load_list_file( const fs::path &listpath, std::string &name )
{
    fs::ifstream sfile( listpath );
    if (not sfile) {
        LOG_ERROR(Lgr) << "Playlist cannot read " << listpath;
        throw Playlist_file_error();
    }
    std::vector<Track_ref> tracks {};
    name = listpath.stem().string();
    const fs::path base = listpath.parent_path();
    std::string line;
    while (std::getline(sfile, line)) {
        line = trim_copy( line );
        if (line.empty() or line[0] == '#') continue;
        if ((line.size() >= 5)
            and (0 == line.compare(0, 5, "name:")
                 or 0 == line.compare(0, 5, "Name:"))) {
            name = trim_copy( line.substr(5) );
            continue;
        }
        fs::path p = expand_home( line );
        if (p.is_relative()) {
            p = base / p;
        }
        tracks.push_back( p.string() );
    }
    LOG_INFO(Lgr) << "Playlist '" << name << "' has " << tracks.size()
                  << " track(s) from " << listpath;
    return tracks;
}
