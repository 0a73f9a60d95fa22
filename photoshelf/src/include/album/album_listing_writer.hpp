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
 * @brief Serializes an album listing as index.json and its index.js fallback
 *
 * index.js assigns the same array to a global for pages opened from file://, where
 * fetch() of the JSON is blocked.
 */
class AlbumListingWriter {
 private:
  const ScanConfig& config_;

 public:
  AlbumListingWriter() = delete;
  explicit AlbumListingWriter(const ScanConfig& config) : config_(config) {}

  auto        ListingPath(const album_path_t& album) const -> std::filesystem::path;
  auto        ScriptPath(const album_path_t& album) const -> std::filesystem::path;

  /**
   * @brief JSON array, 2-space indent, UTF-8 kept as is, trailing newline
   * @throw std::runtime_error if a name is not valid UTF-8
   */
  static auto RenderJson(const std::vector<file_name_t>& files) -> std::string;
  auto        RenderScript(const std::vector<file_name_t>& files) const -> std::string;

  /**
   * @throw std::runtime_error if either file cannot be written
   */
  void        WriteJson(const album_path_t& album, const std::vector<file_name_t>& files) const;
  void        WriteScript(const album_path_t& album, const std::vector<file_name_t>& files) const;
};
};  // namespace photoshelf
