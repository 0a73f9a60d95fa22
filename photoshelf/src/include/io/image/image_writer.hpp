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
#include "io/image/encode_policy.hpp"
#include "type/type.hpp"

namespace photoshelf {
class ImageWriter {
 public:
  /**
   * @brief Encode the (already upright) pixels of a record according to a policy entry
   *
   * The produced bytes carry no EXIF, XMP, IPTC or comment data. The ICC profile of the
   * record is re-attached when the entry retains it.
   *
   * @throw std::runtime_error on encoder failure
   */
  static auto Encode(const ImageRecord& record, const EncodePolicyEntry& entry) -> byte_buffer_t;

  /**
   * @brief Pixel encode only, no metadata pass
   */
  static auto EncodePixels(const cv::Mat& pixels, const EncodePolicyEntry& entry) -> byte_buffer_t;

  /**
   * @brief Rewrite the metadata of encoded bytes in memory
   *
   * @param encoded output of EncodePixels
   * @param icc_profile profile to embed, nullptr to embed none
   * @param clear_metadata drop EXIF/XMP/IPTC/comment data
   */
  static auto RewriteMetadata(const byte_buffer_t& encoded, const byte_buffer_t* icc_profile,
                              bool clear_metadata) -> byte_buffer_t;
};
};  // namespace photoshelf
