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

#include "app/cli_runner.hpp"

#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <opencv2/core/utils/logger.hpp>
#include <string>

#include "app/cli_options.hpp"
#include "app/index_service.hpp"
#include "app/strip_service.hpp"
#include "config/scan_config.hpp"

namespace photoshelf::cli {
namespace {
auto ProgramName(int argc, const char* const argv[], const char* fallback) -> std::string {
  if (argc < 1 || argv[0] == nullptr) {
    return fallback;
  }
  return std::filesystem::path(argv[0]).filename().string();
}

void MuteLibraryLogs() {
  // Per-file problems are reported by the services, keep library chatter out of the output
  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
  cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);
}
}  // namespace

auto StripExitCode(const StripReport& report) -> int {
  return report.errors_ == 0 ? kExitOk : kExitFileErrors;
}

auto RunStripCommand(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
    -> int {
  const std::string prog    = ProgramName(argc, argv, "photoshelf_strip");

  StripCommand      command = ParseStripArgs(argc, argv);
  if (command.action_ == CliAction::HELP) {
    PrintStripUsage(out, prog);
    return kExitOk;
  }
  if (command.action_ == CliAction::INVALID) {
    err << command.error_ << "\n\n";
    PrintStripUsage(err, prog);
    return kExitConfigError;
  }

  command.options_.root_ = ResolveRoot(command.options_.root_);
  if (!CheckRootDirectory(command.options_.root_, err)) {
    return kExitConfigError;
  }

  MuteLibraryLogs();
  StripService   service(ScanConfig::Default(), command.options_, out, err);
  const StripLog log = service.Run();
  return StripExitCode(log.Report());
}

auto RunIndexCommand(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
    -> int {
  const std::string prog    = ProgramName(argc, argv, "photoshelf_index");

  IndexCommand      command = ParseIndexArgs(argc, argv);
  if (command.action_ == CliAction::HELP) {
    PrintIndexUsage(out, prog);
    return kExitOk;
  }
  if (command.action_ == CliAction::INVALID) {
    err << command.error_ << "\n\n";
    PrintIndexUsage(err, prog);
    return kExitConfigError;
  }

  command.options_.root_ = ResolveRoot(command.options_.root_);
  if (!CheckRootDirectory(command.options_.root_, err)) {
    return kExitConfigError;
  }

  // Listing write failures are reported per album and do not change the exit code
  IndexService service(ScanConfig::Default(), command.options_, out, err);
  service.Run();
  return kExitOk;
}

}  // namespace photoshelf::cli
