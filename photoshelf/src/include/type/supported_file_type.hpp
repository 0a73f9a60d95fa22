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
enum class ImageFormatType { JPEG, PNG, WEBP, TIFF, UNRECOGNIZED };

auto FormatName(ImageFormatType format) -> const char*;

/**
 * @brief Map a file extension (any case, with or without the leading dot) to a format
 *
 * @param extension
 * @return ImageFormatType UNRECOGNIZED for anything outside the four supported formats
 */
auto FormatFromExtension(const std::string& extension) -> ImageFormatType;

/**
 * @brief Classify a path as a candidate image by its extension
 *
 * Only the name is inspected, the file is not opened.
 */
auto IsSupportedFile(const std::filesystem::path& path, const ScanConfig& config) -> bool;
};  // namespace photoshelf
