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

#include "image/orientation_normalizer.hpp"

#include <opencv2/core.hpp>

namespace photoshelf {
auto OrientationNormalizer::Apply(const cv::Mat& src, orientation_t orientation) -> cv::Mat {
  cv::Mat dst;
  switch (orientation) {
    case 2:
      // Mirror horizontal
      cv::flip(src, dst, 1);
      break;
    case 3:
      cv::rotate(src, dst, cv::ROTATE_180);
      break;
    case 4:
      // Mirror vertical
      cv::flip(src, dst, 0);
      break;
    case 5:
      cv::transpose(src, dst);
      break;
    case 6:
      cv::rotate(src, dst, cv::ROTATE_90_CLOCKWISE);
      break;
    case 7: {
      // Transverse: mirror across the anti-diagonal
      cv::Mat transposed;
      cv::transpose(src, transposed);
      cv::rotate(transposed, dst, cv::ROTATE_180);
      break;
    }
    case 8:
      cv::rotate(src, dst, cv::ROTATE_90_COUNTERCLOCKWISE);
      break;
    default:
      return src;
  }
  return dst;
}

void OrientationNormalizer::Normalize(ImageRecord& record) {
  if (record.pixels_.empty()) {
    return;
  }
  record.pixels_      = Apply(record.pixels_, record.orientation_);
  record.orientation_ = 1;
}
};  // namespace photoshelf
