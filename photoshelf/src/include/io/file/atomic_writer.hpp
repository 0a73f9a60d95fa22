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

#include "config/scan_config.hpp"
#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief Replace a file so that readers see either the old or the new content
 *
 * Bytes go to a sibling temporary path first, then rename() moves them over the target.
 */
class AtomicWriter {
 private:
  std::string temp_suffix_;

 public:
  AtomicWriter() = delete;
  explicit AtomicWriter(const ScanConfig& config) : temp_suffix_(config.temp_suffix_) {}

  auto TempPathFor(const std::filesystem::path& target) const -> std::filesystem::path;

  /**
   * @brief Write, fsync and commit by rename
   *
   * On failure the target is left untouched and the temporary file is removed.
   *
   * @throw std::runtime_error
   */
  void Write(const std::filesystem::path& target, const byte_buffer_t& bytes) const;
};
};  // namespace photoshelf
