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

#include <opencv2/core.hpp>

#include "image/image_record.hpp"
#include "type/type.hpp"

namespace photoshelf {
class ImageLoader {
 public:
  /**
   * @brief Read a file into memory in one go
   *
   * The same buffer feeds both the metadata inspection and the pixel decode.
   */
  static auto LoadBytes(const image_path_t& image_path) -> byte_buffer_t;

  /**
   * @brief Decode pixels exactly as stored
   *
   * Bit depth and alpha are kept and EXIF orientation is NOT applied here, see
   * OrientationNormalizer.
   *
   * @throw std::runtime_error if the codec cannot decode the buffer
   */
  static auto DecodePixels(const byte_buffer_t& bytes) -> cv::Mat;

  /**
   * @brief Decode into an inspected record
   */
  static void LoadPixels(const byte_buffer_t& bytes, ImageRecord& record);
};
};  // namespace photoshelf
