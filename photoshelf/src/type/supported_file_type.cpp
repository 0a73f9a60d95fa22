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

#include "type/supported_file_type.hpp"

#include <filesystem>
#include <string>

#include "utils/path/path_utils.hpp"

namespace photoshelf {
auto FormatName(ImageFormatType format) -> const char* {
  switch (format) {
    case ImageFormatType::JPEG:
      return "JPEG";
    case ImageFormatType::PNG:
      return "PNG";
    case ImageFormatType::WEBP:
      return "WEBP";
    case ImageFormatType::TIFF:
      return "TIFF";
    case ImageFormatType::UNRECOGNIZED:
      break;
  }
  return "UNRECOGNIZED";
}

auto FormatFromExtension(const std::string& extension) -> ImageFormatType {
  std::string ext = path_util::ToLowerAscii(extension);
  if (!ext.empty() && ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }
  if (ext == ".jpg" || ext == ".jpeg") return ImageFormatType::JPEG;
  if (ext == ".png") return ImageFormatType::PNG;
  if (ext == ".webp") return ImageFormatType::WEBP;
  if (ext == ".tif" || ext == ".tiff") return ImageFormatType::TIFF;
  return ImageFormatType::UNRECOGNIZED;
}

auto IsSupportedFile(const std::filesystem::path& path, const ScanConfig& config) -> bool {
  const std::string ext = path_util::LowerExtension(path);
  if (ext.empty()) return false;
  return config.image_extensions_.count(ext) > 0;
}
};  // namespace photoshelf
