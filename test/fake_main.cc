/// Globals that tunemux/main.cc supplies to the application, for tests
/// that link the Tunemux class without its main().

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

#include "main.hpp"

const char *AppName { "tunemux" };

std::string DefaultConfigPath { "/nonexistent/tunemux.json" };

volatile std::sig_atomic_t Terminate = 0;
volatile std::sig_atomic_t gTermSignal = 0;
