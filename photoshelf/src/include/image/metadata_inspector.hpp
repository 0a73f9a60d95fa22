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

#include <cstddef>
#include <cstdint>

#include "image/image_record.hpp"
#include "type/type.hpp"

namespace photoshelf {
class MetadataInspector {
 public:
  /**
   * @brief Detect the format and read the embedded metadata of an image held in memory
   *
   * The returned record has no pixels; decoding is left to ImageLoader so that already
   * clean files can be skipped without paying for it.
   *
   * @param image_path used for reporting only
   * @param bytes raw file content
   * @return ImageRecord
   * @throw Exiv2::Error or std::runtime_error when the content is not a supported image
   */
  static auto Inspect(const image_path_t& image_path, const byte_buffer_t& bytes) -> ImageRecord;

  /**
   * @brief Content sniffing only, no metadata is parsed
   */
  static auto DetectFormat(const uint8_t* buffer, size_t size) -> ImageFormatType;
};
}  // namespace photoshelf
