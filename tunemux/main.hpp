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

#include <csignal>
#include <string>

/// Globals defined in main.cc
extern const char *AppName;
extern std::string DefaultConfigPath;
extern volatile std::sig_atomic_t Terminate;
extern volatile std::sig_atomic_t gTermSignal;

void log_banner(bool);
