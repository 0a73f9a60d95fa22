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

#include "album/album_scanner.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "type/supported_file_type.hpp"
#include "utils/path/path_utils.hpp"
#include "utils/string/natural_compare.hpp"

namespace photoshelf {
auto AlbumScanner::ListAlbums(const std::filesystem::path& root, bool recursive) const
    -> std::vector<album_path_t> {
  std::vector<album_path_t> albums;
  std::error_code           ec;

  if (recursive) {
    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    for (const auto end = std::filesystem::recursive_directory_iterator(); !ec && it != end;
         it.increment(ec)) {
      std::error_code status_ec;
      if (!it->is_directory(status_ec)) {
        continue;
      }
      if (config_.IsExcludedDir(it->path().filename().string())) {
        it.disable_recursion_pending();
        continue;
      }
      albums.push_back(it->path());
    }
  } else {
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
      if (ec) {
        break;
      }
      std::error_code status_ec;
      if (entry.is_directory(status_ec) && !config_.IsExcludedDir(entry.path().filename().string())) {
        albums.push_back(entry.path());
      }
    }
  }

  std::sort(albums.begin(), albums.end(), [](const album_path_t& a, const album_path_t& b) {
    return natural::Less{}(a.generic_string(), b.generic_string());
  });
  return albums;
}

auto AlbumScanner::ListAlbumFiles(const album_path_t& album) const -> std::vector<file_name_t> {
  std::vector<file_name_t> files;
  std::error_code          ec;
  for (const auto& entry : std::filesystem::directory_iterator(album, ec)) {
    if (ec) {
      break;
    }
    std::error_code status_ec;
    if (!entry.is_regular_file(status_ec)) {
      continue;
    }
    const file_name_t name = path_util::PathToUtf8(entry.path().filename());
    if (name == config_.listing_name_) {
      continue;
    }
    if (IsSupportedFile(entry.path(), config_)) {
      files.push_back(name);
    }
  }

  std::sort(files.begin(), files.end(), natural::Less{});
  return files;
}
};  // namespace photoshelf
