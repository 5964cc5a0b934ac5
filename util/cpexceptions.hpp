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

#include <exception>

/// Thrown on problem with child processes
struct CP_exception : public std::exception {
    const char* what() const throw() { return "Child_proc exception"; }
};

/// Occurs when there is no child pid but one is required.
struct CP_nochild_exception : public CP_exception {
    const char* what() const throw() {
        return "Child_proc No child process exception";
    }
};

/// Occurs when we cannot send a signal to the child.
struct CP_signal_exception : public CP_exception {
    const char* what() const throw() {
        return "Child_proc Signal delivery exception";
    }
};

/// Occurs when we cannot start a child process.
struct CP_start_exception : public CP_exception {
    const char* what() const throw() {
        return "Child_proc failed to start child process";
    }
};

/// The child did not confirm it had stopped (paused).
struct CP_stop_exception : public CP_exception {
    const char* what() const throw() {
        return "Child_proc child did not stop";
    }
};

/// The child did not confirm it had continued.
struct CP_cont_exception : public CP_exception {
    const char* what() const throw() {
        return "Child_proc child did not continue";
    }
};

/// A command run to completion exceeded its time limit and was killed.
struct CP_timeout_exception : public CP_exception {
    const char* what() const throw() {
        return "Child_proc command timed out";
    }
};
