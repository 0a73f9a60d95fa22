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

#include "io/image/encode_policy.hpp"

#include <stdexcept>
#include <string>

namespace photoshelf {
namespace {
auto IndexOf(ImageFormatType format) -> size_t {
  switch (format) {
    case ImageFormatType::JPEG:
      return 0;
    case ImageFormatType::PNG:
      return 1;
    case ImageFormatType::WEBP:
      return 2;
    case ImageFormatType::TIFF:
      return 3;
    case ImageFormatType::UNRECOGNIZED:
      break;
  }
  throw std::invalid_argument("EncodePolicy: no encoder for unrecognized format");
}
}  // namespace

EncodePolicy::EncodePolicy(int jpeg_quality) : jpeg_quality_(jpeg_quality) {
  if (jpeg_quality < kMinQuality || jpeg_quality > kMaxQuality) {
    throw std::invalid_argument("EncodePolicy: JPEG quality must be within 1..100, got " +
                                std::to_string(jpeg_quality));
  }

  entries_[IndexOf(ImageFormatType::JPEG)] = {
      .format_                  = ImageFormatType::JPEG,
      .codec_ext_               = ".jpg",
      .quality_                 = jpeg_quality,
      .optimize_                = true,
      .retain_icc_profile_      = true,
      .explicit_empty_metadata_ = true,
  };
  // The PNG encoder attaches no tEXt/zTXt/iTXt/eXIf chunks of its own
  entries_[IndexOf(ImageFormatType::PNG)] = {
      .format_    = ImageFormatType::PNG,
      .codec_ext_ = ".png",
  };
  entries_[IndexOf(ImageFormatType::WEBP)] = {
      .format_    = ImageFormatType::WEBP,
      .codec_ext_ = ".webp",
      .quality_   = kWebpQuality,
  };
  entries_[IndexOf(ImageFormatType::TIFF)] = {
      .format_    = ImageFormatType::TIFF,
      .codec_ext_ = ".tiff",
  };
}

auto EncodePolicy::Lookup(ImageFormatType format) const -> const EncodePolicyEntry& {
  return entries_[IndexOf(format)];
}
};  // namespace photoshelf
