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

#include "io/file/backup_manager.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "utils/path/path_utils.hpp"

namespace photoshelf {
auto BackupManager::BackupPathFor(const std::filesystem::path& original) const
    -> std::filesystem::path {
  return original.parent_path() / backup_dir_name_ / original.filename();
}

auto BackupManager::HasBackup(const std::filesystem::path& original) const -> bool {
  std::error_code ec;
  return std::filesystem::exists(BackupPathFor(original), ec);
}

auto BackupManager::Backup(const std::filesystem::path& original) const -> BackupOutcome {
  const std::filesystem::path backup_path = BackupPathFor(original);
  if (HasBackup(original)) {
    return BackupOutcome::ALREADY_EXISTS;
  }
  if (!path_util::EnsureDirectoryExists(backup_path.parent_path())) {
    throw std::runtime_error("BackupManager: cannot create " +
                             path_util::PathToUtf8(backup_path.parent_path()));
  }

  std::error_code ec;
  // skip_existing keeps the first copy if another writer got there in between
  const bool      copied = std::filesystem::copy_file(
      original, backup_path, std::filesystem::copy_options::skip_existing, ec);
  if (ec) {
    throw std::runtime_error("BackupManager: cannot copy to " +
                             path_util::PathToUtf8(backup_path) + ": " + ec.message());
  }
  return copied ? BackupOutcome::CREATED : BackupOutcome::ALREADY_EXISTS;
}
};  // namespace photoshelf
