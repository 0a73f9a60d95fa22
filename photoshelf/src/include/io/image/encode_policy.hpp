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

#include <array>
#include <optional>

#include "type/supported_file_type.hpp"

namespace photoshelf {
struct EncodePolicyEntry {
  ImageFormatType    format_    = ImageFormatType::UNRECOGNIZED;
  // Extension handed to the encoder to select the codec
  const char*        codec_ext_ = "";
  std::optional<int> quality_                 = std::nullopt;
  bool               optimize_                = false;
  bool               retain_icc_profile_      = true;
  // Force a metadata rewrite that leaves EXIF/XMP/IPTC/comments empty
  bool               explicit_empty_metadata_ = false;
};

/**
 * @brief Output options for every re-encodable format
 *
 * Built once per run; only the JPEG quality is configurable.
 */
class EncodePolicy {
 public:
  static constexpr int kDefaultJpegQuality = 95;
  static constexpr int kWebpQuality        = 95;
  static constexpr int kMinQuality         = 1;
  static constexpr int kMaxQuality         = 100;

  explicit EncodePolicy(int jpeg_quality = kDefaultJpegQuality);

  /**
   * @brief Policy entry for a detected format
   *
   * @throw std::invalid_argument for ImageFormatType::UNRECOGNIZED
   */
  auto Lookup(ImageFormatType format) const -> const EncodePolicyEntry&;

  auto JpegQuality() const -> int { return jpeg_quality_; }

 private:
  int                              jpeg_quality_;
  std::array<EncodePolicyEntry, 4> entries_;
};
};  // namespace photoshelf
