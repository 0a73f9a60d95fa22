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

#include <string>
#include <unordered_set>

namespace photoshelf {
/**
 * @brief Immutable naming and filtering rules shared by the indexer and the stripper
 *
 * Extensions are stored lower-case with the leading dot.
 */
struct ScanConfig {
  std::unordered_set<std::string> image_extensions_;
  std::unordered_set<std::string> excluded_dirs_;

  std::string                     backup_dir_name_;
  std::string                     listing_name_;
  std::string                     listing_js_name_;
  std::string                     listing_js_global_;
  std::string                     temp_suffix_;

  static auto Default() -> const ScanConfig&;

  auto        IsExcludedDir(const std::string& dir_name) const -> bool {
    return excluded_dirs_.count(dir_name) > 0;
  }
};
};  // namespace photoshelf
