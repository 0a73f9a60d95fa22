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
#include <string>
#include <vector>

#include "config/scan_config.hpp"
#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief Finds album directories and the images each one publishes
 */
class AlbumScanner {
 private:
  const ScanConfig& config_;

 public:
  AlbumScanner() = delete;
  explicit AlbumScanner(const ScanConfig& config) : config_(config) {}

  /**
   * @brief Album directories below root, in natural path order
   *
   * @param root
   * @param recursive false: direct children only, true: every nested directory
   */
  auto ListAlbums(const std::filesystem::path& root, bool recursive) const
      -> std::vector<album_path_t>;

  /**
   * @brief Image file names directly inside an album, naturally sorted
   *
   * The listing file itself and anything with an unrecognized extension are left out.
   */
  auto ListAlbumFiles(const album_path_t& album) const -> std::vector<file_name_t>;
};
};  // namespace photoshelf
