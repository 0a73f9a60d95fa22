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

#include "utils/path/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace photoshelf::path_util {

auto PathToUtf8(const std::filesystem::path& path) -> std::string {
  auto u8 = path.u8string();
  return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
}

auto ToLowerAscii(std::string value) -> std::string {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

auto LowerExtension(const std::filesystem::path& path) -> std::string {
  return ToLowerAscii(path.extension().string());
}

auto AppendToFileName(const std::filesystem::path& path, const std::string& suffix)
    -> std::filesystem::path {
  std::filesystem::path result = path;
  result += suffix;
  return result;
}

auto EnsureDirectoryExists(const std::filesystem::path& dir) -> bool {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return true;
  }
  std::filesystem::create_directories(dir, ec);
  return !ec && std::filesystem::is_directory(dir, ec);
}

auto ReadFileBytes(const std::filesystem::path& path) -> byte_buffer_t {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw std::runtime_error("ReadFileBytes: cannot open " + PathToUtf8(path));
  }
  const std::streamsize file_size = file.tellg();
  if (file_size < 0) {
    throw std::runtime_error("ReadFileBytes: cannot determine size of " + PathToUtf8(path));
  }
  file.seekg(0, std::ios::beg);

  byte_buffer_t buffer(static_cast<size_t>(file_size));
  if (file_size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), file_size)) {
    throw std::runtime_error("ReadFileBytes: short read on " + PathToUtf8(path));
  }
  return buffer;
}

}  // namespace photoshelf::path_util
