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

namespace photoshelf {
enum class BackupOutcome { CREATED, ALREADY_EXISTS };

/**
 * @brief Keeps a pristine copy of each original under <album>/<backup dir>/<file name>
 *
 * The first copy wins: later runs never overwrite it.
 */
class BackupManager {
 private:
  std::string backup_dir_name_;

 public:
  BackupManager() = delete;
  explicit BackupManager(const ScanConfig& config) : backup_dir_name_(config.backup_dir_name_) {}

  auto BackupPathFor(const std::filesystem::path& original) const -> std::filesystem::path;
  auto HasBackup(const std::filesystem::path& original) const -> bool;

  /**
   * @brief Copy the original bytes unless a backup is already present
   *
   * @throw std::runtime_error when the directory or the copy cannot be created
   */
  auto Backup(const std::filesystem::path& original) const -> BackupOutcome;
};
};  // namespace photoshelf
