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

#include "app/cli_options.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "io/image/encode_policy.hpp"
#include "utils/path/path_utils.hpp"

namespace photoshelf::cli {
namespace {
/**
 * @brief Walks argv and splits "--flag=value" into name and inline value
 */
class ArgCursor {
 private:
  int                        argc_;
  const char* const*         argv_;
  int                        index_ = 1;
  std::string                name_;
  std::optional<std::string> inline_value_;

 public:
  ArgCursor(int argc, const char* const argv[]) : argc_(argc), argv_(argv) {}

  auto Next() -> bool {
    if (index_ >= argc_) {
      return false;
    }
    std::string arg = argv_[index_++];
    inline_value_.reset();
    const auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value_ = arg.substr(eq + 1);
      arg.resize(eq);
    }
    name_ = std::move(arg);
    return true;
  }

  auto Name() const -> const std::string& { return name_; }
  auto HasInlineValue() const -> bool { return inline_value_.has_value(); }

  auto TakeValue() -> std::optional<std::string> {
    if (inline_value_) {
      return inline_value_;
    }
    if (index_ >= argc_) {
      return std::nullopt;
    }
    return std::string(argv_[index_++]);
  }
};

auto ParseQuality(const std::string& text) -> std::optional<int> {
  if (text.empty()) {
    return std::nullopt;
  }
  errno         = 0;
  char*      end = nullptr;
  const long v   = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  if (v < EncodePolicy::kMinQuality || v > EncodePolicy::kMaxQuality) {
    return std::nullopt;
  }
  return static_cast<int>(v);
}
}  // namespace

auto ParseIndexArgs(int argc, const char* const argv[]) -> IndexCommand {
  IndexCommand command;
  ArgCursor    cursor(argc, argv);
  while (cursor.Next()) {
    const std::string& arg = cursor.Name();
    if (arg == "-h" || arg == "--help") {
      command.action_ = CliAction::HELP;
      return command;
    } else if (arg == "--root") {
      auto value = cursor.TakeValue();
      if (!value || value->empty()) {
        command.action_ = CliAction::INVALID;
        command.error_  = "Missing value for --root";
        return command;
      }
      command.options_.root_ = *value;
    } else if (cursor.HasInlineValue()) {
      command.action_ = CliAction::INVALID;
      command.error_  = "Option " + arg + " takes no value";
      return command;
    } else if (arg == "--recursive") {
      command.options_.recursive_ = true;
    } else if (arg == "--no-overwrite") {
      command.options_.no_overwrite_ = true;
    } else if (arg == "--dry-run") {
      command.options_.dry_run_ = true;
    } else {
      command.action_ = CliAction::INVALID;
      command.error_  = "Unknown argument: " + arg;
      return command;
    }
  }
  return command;
}

auto ParseStripArgs(int argc, const char* const argv[]) -> StripCommand {
  StripCommand command;
  ArgCursor    cursor(argc, argv);
  while (cursor.Next()) {
    const std::string& arg = cursor.Name();
    if (arg == "-h" || arg == "--help") {
      command.action_ = CliAction::HELP;
      return command;
    } else if (arg == "--root") {
      auto value = cursor.TakeValue();
      if (!value || value->empty()) {
        command.action_ = CliAction::INVALID;
        command.error_  = "Missing value for --root";
        return command;
      }
      command.options_.root_ = *value;
    } else if (arg == "--quality") {
      auto value = cursor.TakeValue();
      if (!value) {
        command.action_ = CliAction::INVALID;
        command.error_  = "Missing value for --quality";
        return command;
      }
      auto quality = ParseQuality(*value);
      if (!quality) {
        command.action_ = CliAction::INVALID;
        command.error_  = "Invalid --quality '" + *value + "': expected an integer in 1..100";
        return command;
      }
      command.options_.jpeg_quality_ = *quality;
    } else if (cursor.HasInlineValue()) {
      command.action_ = CliAction::INVALID;
      command.error_  = "Option " + arg + " takes no value";
      return command;
    } else if (arg == "--dry-run") {
      command.options_.dry_run_ = true;
    } else if (arg == "--backup") {
      command.options_.backup_ = true;
    } else {
      command.action_ = CliAction::INVALID;
      command.error_  = "Unknown argument: " + arg;
      return command;
    }
  }
  return command;
}

void PrintIndexUsage(std::ostream& os, const std::string& prog) {
  os << "Generate index.json (and an index.js fallback) for photo albums.\n"
     << "\nUsage: " << prog << " [options]\n"
     << "\nOptions:\n"
     << "  --root PATH       Root directory that contains album folders (default: photos)\n"
     << "  --recursive       Recurse into nested album folders (default: one level)\n"
     << "  --no-overwrite    Skip albums that already contain index.json\n"
     << "  --dry-run         Print actions without writing files\n"
     << "  -h, --help        Show this help\n";
}

void PrintStripUsage(std::ostream& os, const std::string& prog) {
  os << "Strip EXIF and other embedded metadata from images under a photos root.\n"
     << "Orientation is applied to the pixels and ICC profiles are kept.\n"
     << "\nUsage: " << prog << " [options]\n"
     << "\nOptions:\n"
     << "  --root PATH       Path to photos root (default: photos)\n"
     << "  --dry-run         Don't write changes; just print what would happen\n"
     << "  --backup          Save originals under a .originals/ folder in each album\n"
     << "  --quality INT     JPEG quality when re-saving, 1..100 (default: 95)\n"
     << "  -h, --help        Show this help\n";
}

auto ResolveRoot(const std::filesystem::path& root) -> std::filesystem::path {
  std::error_code ec;
  auto            absolute = std::filesystem::absolute(root, ec);
  if (ec) {
    return root.lexically_normal();
  }
  auto canonical = std::filesystem::weakly_canonical(absolute, ec);
  return ec ? absolute.lexically_normal() : canonical;
}

auto CheckRootDirectory(const std::filesystem::path& root, std::ostream& err) -> bool {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    err << "Root not found or not a directory: " << path_util::PathToUtf8(root) << std::endl;
    return false;
  }
  return true;
}

}  // namespace photoshelf::cli
