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

#include "io/file/atomic_writer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "utils/path/path_utils.hpp"

namespace photoshelf {
namespace {
void WriteAll(const std::filesystem::path& path, const byte_buffer_t& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("AtomicWriter: cannot create " + path_util::PathToUtf8(path));
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    throw std::runtime_error("AtomicWriter: write failed on " + path_util::PathToUtf8(path));
  }
  out.close();
  if (out.fail()) {
    throw std::runtime_error("AtomicWriter: close failed on " + path_util::PathToUtf8(path));
  }
}

/**
 * @brief Flush the file's data to the device so the rename never exposes an empty file
 */
void SyncToDisk(const std::filesystem::path& path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    throw std::runtime_error("AtomicWriter: cannot reopen " + path_util::PathToUtf8(path) + ": " +
                             std::strerror(errno));
  }
  if (::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    throw std::runtime_error("AtomicWriter: fsync failed on " + path_util::PathToUtf8(path) +
                             ": " + std::strerror(err));
  }
  if (::close(fd) != 0) {
    throw std::runtime_error("AtomicWriter: close failed on " + path_util::PathToUtf8(path) +
                             ": " + std::strerror(errno));
  }
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}
}  // namespace

auto AtomicWriter::TempPathFor(const std::filesystem::path& target) const
    -> std::filesystem::path {
  return path_util::AppendToFileName(target, temp_suffix_);
}

void AtomicWriter::Write(const std::filesystem::path& target, const byte_buffer_t& bytes) const {
  if (bytes.empty()) {
    throw std::runtime_error("AtomicWriter: refusing to replace " +
                             path_util::PathToUtf8(target) + " with empty content");
  }

  const std::filesystem::path tmp_path = TempPathFor(target);
  try {
    WriteAll(tmp_path, bytes);
    SyncToDisk(tmp_path);
  } catch (...) {
    RemoveQuietly(tmp_path);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, target, ec);
  if (ec) {
    RemoveQuietly(tmp_path);
    throw std::runtime_error("AtomicWriter: cannot replace " + path_util::PathToUtf8(target) +
                             ": " + ec.message());
  }
}
};  // namespace photoshelf
