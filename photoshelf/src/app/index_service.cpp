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

#include "app/index_service.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "utils/path/path_utils.hpp"

namespace photoshelf {
IndexService::IndexService(const ScanConfig& config, IndexOptions options, std::ostream& out,
                           std::ostream& err)
    : config_(config),
      options_(std::move(options)),
      scanner_(config),
      writer_(config),
      out_(out),
      err_(err) {}

auto IndexService::IndexAlbum(const album_path_t& album) const -> AlbumIndexResult {
  AlbumIndexResult result;
  result.album_                           = album;

  const std::filesystem::path listing     = writer_.ListingPath(album);
  const std::string           listing_str = path_util::PathToUtf8(listing);

  std::error_code             ec;
  if (options_.no_overwrite_ && std::filesystem::exists(listing, ec)) {
    result.status_ = AlbumIndexStatus::SKIPPED_EXISTING;
    result.messages_.push_back("Skip (exists): " + listing_str);
    return result;
  }

  result.files_ = scanner_.ListAlbumFiles(album);
  if (result.files_.empty()) {
    // Nothing to publish
    result.status_ = AlbumIndexStatus::EMPTY;
    return result;
  }

  const std::string count = std::to_string(result.files_.size());
  if (options_.dry_run_) {
    result.status_ = AlbumIndexStatus::WOULD_WRITE;
    result.messages_.push_back("[DRY] " + listing_str + ": " + count + " files");
    return result;
  }

  try {
    writer_.WriteJson(album, result.files_);
    result.messages_.push_back("Wrote " + listing_str + " (" + count + " entries)");
    writer_.WriteScript(album, result.files_);
    result.messages_.push_back("Wrote " + path_util::PathToUtf8(writer_.ScriptPath(album)) +
                               " (JS fallback)");
    result.status_ = AlbumIndexStatus::WRITTEN;
  } catch (const std::exception& e) {
    result.status_ = AlbumIndexStatus::FAILED;
    result.messages_.push_back("ERROR indexing " + path_util::PathToUtf8(album) + ": " +
                               e.what());
  }
  return result;
}

auto IndexService::Run() -> IndexReport {
  IndexReport report;
  const auto  albums   = scanner_.ListAlbums(options_.root_, options_.recursive_);
  report.albums_found_ = albums.size();
  if (albums.empty()) {
    out_ << "No album folders found." << std::endl;
    return report;
  }

  for (const auto& album : albums) {
    const AlbumIndexResult result = IndexAlbum(album);
    std::ostream& stream = (result.status_ == AlbumIndexStatus::FAILED) ? err_ : out_;
    for (const auto& message : result.messages_) {
      stream << message << std::endl;
    }

    switch (result.status_) {
      case AlbumIndexStatus::WRITTEN:
      case AlbumIndexStatus::WOULD_WRITE:
        ++report.albums_indexed_;
        report.files_listed_ += result.files_.size();
        break;
      case AlbumIndexStatus::SKIPPED_EXISTING:
        ++report.skipped_;
        break;
      case AlbumIndexStatus::FAILED:
        ++report.errors_;
        break;
      case AlbumIndexStatus::EMPTY:
        break;
    }
  }

  out_ << "\nIndexed albums: " << report.albums_indexed_
       << ", total images listed: " << report.files_listed_;
  if (report.skipped_ > 0) {
    out_ << ", skipped: " << report.skipped_;
  }
  if (report.errors_ > 0) {
    out_ << ", errors: " << report.errors_;
  }
  out_ << std::endl;
  if (options_.dry_run_) {
    out_ << "Dry run only. No files were written." << std::endl;
  }
  return report;
}
};  // namespace photoshelf
