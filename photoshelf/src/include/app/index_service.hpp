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

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "album/album_listing_writer.hpp"
#include "album/album_scanner.hpp"
#include "config/scan_config.hpp"
#include "type/type.hpp"

namespace photoshelf {
struct IndexOptions {
  std::filesystem::path root_         = "photos";
  bool                  recursive_    = false;
  bool                  no_overwrite_ = false;
  bool                  dry_run_      = false;
};

enum class AlbumIndexStatus { WRITTEN, WOULD_WRITE, SKIPPED_EXISTING, EMPTY, FAILED };

struct AlbumIndexResult {
  album_path_t             album_{};
  AlbumIndexStatus         status_ = AlbumIndexStatus::EMPTY;
  std::vector<file_name_t> files_{};
  std::vector<std::string> messages_{};
};

struct IndexReport {
  size_t albums_found_   = 0;
  size_t albums_indexed_ = 0;
  size_t files_listed_   = 0;
  size_t skipped_        = 0;
  size_t errors_         = 0;
};

/**
 * @brief Regenerates the per-album listings under a photos root
 */
class IndexService {
 private:
  const ScanConfig&  config_;
  IndexOptions       options_;
  AlbumScanner       scanner_;
  AlbumListingWriter writer_;

  std::ostream&      out_;
  std::ostream&      err_;

 public:
  IndexService() = delete;
  IndexService(const ScanConfig& config, IndexOptions options, std::ostream& out = std::cout,
               std::ostream& err = std::cerr);

  IndexService(const IndexService&)            = delete;
  IndexService& operator=(const IndexService&) = delete;

  /**
   * @brief Build (or preview, under dry-run) the listing of one album
   *
   * Never throws; write failures come back as AlbumIndexStatus::FAILED.
   */
  auto IndexAlbum(const album_path_t& album) const -> AlbumIndexResult;

  auto Run() -> IndexReport;
};
};  // namespace photoshelf
