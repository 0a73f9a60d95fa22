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
class OrientationNormalizer {
 public:
  /**
   * @brief Bake an EXIF orientation into the pixels
   *
   * The result displays correctly with orientation 1, so the tag can be dropped.
   * Values outside 2..8 leave the image as is.
   *
   * @param src
   * @param orientation EXIF Orientation tag value
   * @return cv::Mat upright image
   */
  static auto Apply(const cv::Mat& src, orientation_t orientation) -> cv::Mat;

  /**
   * @brief Normalize a record in place and mark it upright
   */
  static void Normalize(ImageRecord& record);
};
};  // namespace photoshelf
