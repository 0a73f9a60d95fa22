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

#include "album/album_listing_writer.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/path/path_utils.hpp"

namespace photoshelf {
namespace {
void WriteText(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("AlbumListingWriter: cannot open " + path_util::PathToUtf8(path));
  }
  out << text;
  out.close();
  if (out.fail()) {
    throw std::runtime_error("AlbumListingWriter: write failed on " +
                             path_util::PathToUtf8(path));
  }
}
/**
 * @brief Serialise the listing, refusing names that are not valid UTF-8
 */
auto DumpListing(const std::vector<file_name_t>& files, int indent) -> std::string {
  const nlohmann::json listing = files;
  try {
    return listing.dump(indent, ' ', false, nlohmann::json::error_handler_t::strict);
  } catch (const nlohmann::json::type_error& e) {
    throw std::runtime_error(std::string("AlbumListingWriter: file name is not valid UTF-8 (") +
                             e.what() + ")");
  }
}
}  // namespace

auto AlbumListingWriter::ListingPath(const album_path_t& album) const -> std::filesystem::path {
  return album / config_.listing_name_;
}

auto AlbumListingWriter::ScriptPath(const album_path_t& album) const -> std::filesystem::path {
  return album / config_.listing_js_name_;
}

auto AlbumListingWriter::RenderJson(const std::vector<file_name_t>& files) -> std::string {
  return DumpListing(files, 2) + "\n";
}

auto AlbumListingWriter::RenderScript(const std::vector<file_name_t>& files) const
    -> std::string {
  return config_.listing_js_global_ + " = " + DumpListing(files, -1) + ";\n";
}

void AlbumListingWriter::WriteJson(const album_path_t&             album,
                                   const std::vector<file_name_t>& files) const {
  WriteText(ListingPath(album), RenderJson(files));
}

void AlbumListingWriter::WriteScript(const album_path_t&             album,
                                     const std::vector<file_name_t>& files) const {
  WriteText(ScriptPath(album), RenderScript(files));
}
};  // namespace photoshelf
