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

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include "app/album_test_fixation.hpp"
#include "config/scan_config.hpp"
#include "io/file/atomic_writer.hpp"
#include "io/file/backup_manager.hpp"
#include "utils/path/path_utils.hpp"

namespace photoshelf {
class FileIOTest : public AlbumTestFixture {
 protected:
  const ScanConfig& config_ = ScanConfig::Default();
};

TEST_F(FileIOTest, AtomicWriteReplacesContentAndCleansUp) {
  const auto          target = root_ / "album" / "a.jpg";
  const byte_buffer_t before = {1, 2, 3, 4};
  const byte_buffer_t after  = {9, 8, 7};
  test_util::WriteAll(target, before);

  AtomicWriter writer(config_);
  EXPECT_EQ(writer.TempPathFor(target).filename().string(), "a.jpg.tmp_nox");

  writer.Write(target, after);
  EXPECT_EQ(test_util::ReadAll(target), after);
  EXPECT_FALSE(std::filesystem::exists(writer.TempPathFor(target)));
}

TEST_F(FileIOTest, AtomicWriteCommitsLargePayloadDurably) {
  const auto    target = root_ / "album" / "large.tiff";
  test_util::WriteAll(target, {1});

  byte_buffer_t payload(4 * 1024 * 1024);
  for (size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<uint8_t>((i * 31u) & 0xFF);
  }

  AtomicWriter writer(config_);
  writer.Write(target, payload);
  EXPECT_EQ(std::filesystem::file_size(target), payload.size());
  EXPECT_EQ(test_util::ReadAll(target), payload);
  EXPECT_FALSE(std::filesystem::exists(writer.TempPathFor(target)));
}

TEST_F(FileIOTest, AtomicWriteRefusesEmptyContent) {
  const auto          target = root_ / "album" / "a.jpg";
  const byte_buffer_t before = {1, 2, 3, 4};
  test_util::WriteAll(target, before);

  AtomicWriter writer(config_);
  EXPECT_THROW(writer.Write(target, {}), std::runtime_error);
  EXPECT_EQ(test_util::ReadAll(target), before);
  EXPECT_FALSE(std::filesystem::exists(writer.TempPathFor(target)));
}

TEST_F(FileIOTest, AtomicWriteFailureLeavesNoTempFile) {
  const auto   target = root_ / "no_such_album" / "a.jpg";
  AtomicWriter writer(config_);
  EXPECT_THROW(writer.Write(target, {1, 2, 3}), std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(target));
  EXPECT_FALSE(std::filesystem::exists(writer.TempPathFor(target)));
}

TEST_F(FileIOTest, BackupIsCreatedOnceAndNeverOverwritten) {
  const auto          original = root_ / "album" / "a.jpg";
  const byte_buffer_t first    = {1, 1, 1};
  const byte_buffer_t second   = {2, 2, 2, 2};
  test_util::WriteAll(original, first);

  BackupManager manager(config_);
  const auto    backup_path = manager.BackupPathFor(original);
  EXPECT_EQ(backup_path, root_ / "album" / ".originals" / "a.jpg");
  EXPECT_FALSE(manager.HasBackup(original));

  EXPECT_EQ(manager.Backup(original), BackupOutcome::CREATED);
  EXPECT_TRUE(manager.HasBackup(original));
  EXPECT_EQ(test_util::ReadAll(backup_path), first);

  test_util::WriteAll(original, second);
  EXPECT_EQ(manager.Backup(original), BackupOutcome::ALREADY_EXISTS);
  EXPECT_EQ(test_util::ReadAll(backup_path), first);
}

TEST_F(FileIOTest, BackupOfMissingFileThrows) {
  BackupManager manager(config_);
  EXPECT_THROW(manager.Backup(root_ / "album" / "ghost.jpg"), std::runtime_error);
}

TEST_F(FileIOTest, PathHelpers) {
  EXPECT_EQ(path_util::LowerExtension("x/Photo.JPEG"), ".jpeg");
  EXPECT_EQ(path_util::LowerExtension("x/README"), "");
  EXPECT_EQ(path_util::AppendToFileName("x/a.png", ".tmp"), std::filesystem::path("x/a.png.tmp"));

  const auto nested = root_ / "one" / "two";
  EXPECT_TRUE(path_util::EnsureDirectoryExists(nested));
  EXPECT_TRUE(path_util::EnsureDirectoryExists(nested));
  EXPECT_TRUE(std::filesystem::is_directory(nested));

  const byte_buffer_t payload = {0, 255, 10, 13};
  test_util::WriteAll(nested / "bytes.bin", payload);
  EXPECT_EQ(path_util::ReadFileBytes(nested / "bytes.bin"), payload);
  EXPECT_THROW(path_util::ReadFileBytes(nested / "missing.bin"), std::runtime_error);
}
};  // namespace photoshelf
