//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <ostream>

#include "utils/report/strip_log.hpp"

namespace photoshelf::cli {

/**
 * @brief 0 when every file was handled, kExitFileErrors when any failed
 */
auto StripExitCode(const StripReport& report) -> int;

/**
 * @brief Full stripper command: parse, validate the root, run, map the exit code
 *
 * Help goes to out, usage errors and per-file errors go to err.
 */
auto RunStripCommand(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
    -> int;

auto RunIndexCommand(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
    -> int;

}  // namespace photoshelf::cli
