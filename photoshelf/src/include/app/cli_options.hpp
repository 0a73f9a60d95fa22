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

#include <filesystem>
#include <ostream>
#include <string>

#include "app/index_service.hpp"
#include "app/strip_service.hpp"

namespace photoshelf::cli {

constexpr int kExitOk          = 0;
constexpr int kExitConfigError = 1;
// Stripper only: at least one file failed
constexpr int kExitFileErrors  = 2;

enum class CliAction { RUN, HELP, INVALID };

struct IndexCommand {
  CliAction    action_ = CliAction::RUN;
  IndexOptions options_{};
  std::string  error_{};
};

struct StripCommand {
  CliAction    action_ = CliAction::RUN;
  StripOptions options_{};
  std::string  error_{};
};

/**
 * @brief --root PATH, --recursive, --no-overwrite, --dry-run, -h/--help
 */
auto ParseIndexArgs(int argc, const char* const argv[]) -> IndexCommand;

/**
 * @brief --root PATH, --dry-run, --backup, --quality INT, -h/--help
 *
 * Both "--flag value" and "--flag=value" are accepted.
 */
auto ParseStripArgs(int argc, const char* const argv[]) -> StripCommand;

void PrintIndexUsage(std::ostream& os, const std::string& prog);
void PrintStripUsage(std::ostream& os, const std::string& prog);

/**
 * @brief Absolute, normalized form of the root given on the command line
 */
auto ResolveRoot(const std::filesystem::path& root) -> std::filesystem::path;

/**
 * @brief Report a missing or non-directory root on err
 */
auto CheckRootDirectory(const std::filesystem::path& root, std::ostream& err) -> bool;

}  // namespace photoshelf::cli
