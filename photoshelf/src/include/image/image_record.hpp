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
#include <optional>

#include "type/supported_file_type.hpp"
#include "type/type.hpp"

namespace photoshelf {
/**
 * @brief Everything the strip pipeline knows about one open image
 *
 * Lives only for the duration of a single file's pipeline.
 */
struct ImageRecord {
  image_path_t                 path_;
  ImageFormatType              format_      = ImageFormatType::UNRECOGNIZED;
  std::optional<byte_buffer_t> icc_profile_ = std::nullopt;
  bool                         has_exif_    = false;
  // EXIF orientation tag, 1 (upright) when absent or out of range
  orientation_t                orientation_ = 1;

  cv::Mat                      pixels_;

  auto                         IsAlreadyClean() const -> bool {
    // Only JPEG is short-circuited: re-encoding it is lossy, the other formats are always
    // rewritten
    return format_ == ImageFormatType::JPEG && !has_exif_;
  }
};
};  // namespace photoshelf
