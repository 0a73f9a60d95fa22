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

#include "app/strip_service.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "image/image_record.hpp"
#include "image/metadata_inspector.hpp"
#include "image/orientation_normalizer.hpp"
#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "type/supported_file_type.hpp"
#include "utils/path/path_utils.hpp"
#include "utils/string/natural_compare.hpp"

namespace photoshelf {
StripService::StripService(const ScanConfig& config, StripOptions options, std::ostream& out,
                           std::ostream& err)
    : config_(config),
      options_(std::move(options)),
      policy_(options_.jpeg_quality_),
      backup_manager_(config),
      atomic_writer_(config),
      out_(out),
      err_(err) {}

auto StripService::CollectImages(const std::filesystem::path& root) const
    -> std::vector<image_path_t> {
  std::vector<image_path_t> images;
  std::error_code           ec;
  auto it = std::filesystem::recursive_directory_iterator(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return images;
  }

  for (const auto end = std::filesystem::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec) {
      break;
    }
    const auto&     entry = *it;
    std::error_code status_ec;
    if (entry.is_directory(status_ec)) {
      if (config_.IsExcludedDir(entry.path().filename().string())) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (entry.is_regular_file(status_ec) && IsSupportedFile(entry.path(), config_)) {
      images.push_back(entry.path());
    }
  }

  std::sort(images.begin(), images.end(), [](const image_path_t& a, const image_path_t& b) {
    return natural::Less{}(a.generic_string(), b.generic_string());
  });
  return images;
}

auto StripService::DescribeDryRun(const image_path_t& image_path) const -> std::string {
  std::string message = "[DRY] would strip metadata: " + path_util::PathToUtf8(image_path);
  if (options_.backup_ && !backup_manager_.HasBackup(image_path)) {
    message += " (backup -> " +
               path_util::PathToUtf8(backup_manager_.BackupPathFor(image_path)) + ")";
  }
  return message;
}

auto StripService::StripFile(const image_path_t& image_path) -> StripResult {
  const std::string display = path_util::PathToUtf8(image_path);
  StripResult       result;
  result.path_ = image_path;

  try {
    const byte_buffer_t bytes  = ImageLoader::LoadBytes(image_path);
    ImageRecord         record = MetadataInspector::Inspect(image_path, bytes);

    if (record.IsAlreadyClean()) {
      result.status_  = StripStatus::ALREADY_CLEAN;
      result.message_ = "Already clean (no EXIF): " + display;
      return result;
    }

    ImageLoader::LoadPixels(bytes, record);
    OrientationNormalizer::Normalize(record);
    const EncodePolicyEntry& entry = policy_.Lookup(record.format_);

    if (options_.dry_run_) {
      result.status_  = StripStatus::WOULD_STRIP;
      result.message_ = DescribeDryRun(image_path);
      return result;
    }

    const byte_buffer_t encoded = ImageWriter::Encode(record, entry);
    if (options_.backup_) {
      backup_manager_.Backup(image_path);
    }
    atomic_writer_.Write(image_path, encoded);

    result.status_  = StripStatus::STRIPPED;
    result.message_ = "Stripped metadata: " + display;
  } catch (const std::exception& e) {
    result.status_  = StripStatus::FAILED;
    result.message_ = "ERROR processing " + display + ": " + e.what();
  }
  return result;
}

auto StripService::Run() -> StripLog {
  StripLog log;
  for (const auto& image_path : CollectImages(options_.root_)) {
    StripResult result = StripFile(image_path);
    (result.Succeeded() ? out_ : err_) << result.message_ << std::endl;
    log.Add(std::move(result));
  }

  const StripReport& report = log.Report();
  out_ << "\nProcessed: " << report.processed_ << ", changed: " << report.changed_
       << ", already clean: " << report.already_clean_ << ", errors: " << report.errors_
       << std::endl;
  if (options_.dry_run_) {
    out_ << "Dry run only. No files were modified." << std::endl;
  }
  return log;
}
};  // namespace photoshelf
