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

#include "io/image/image_writer.hpp"

#include <cstddef>
#include <exiv2/exiv2.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace photoshelf {
namespace {
auto FormatSupportsAlpha(ImageFormatType fmt) -> bool {
  switch (fmt) {
    case ImageFormatType::PNG:
    case ImageFormatType::TIFF:
    case ImageFormatType::WEBP:
      return true;
    default:
      return false;
  }
}

auto FormatSupports16Bit(ImageFormatType fmt) -> bool {
  return fmt == ImageFormatType::PNG || fmt == ImageFormatType::TIFF;
}

/**
 * @brief Bring decoded pixels into a layout the target encoder accepts
 *
 * Only conversions the codec cannot do itself are applied: alpha is dropped for JPEG,
 * 16-bit data is scaled down for 8-bit-only codecs and WebP gets three channels.
 */
auto PrepareForEncoder(const cv::Mat& pixels, const EncodePolicyEntry& entry) -> cv::Mat {
  cv::Mat prepared = pixels;

  if (prepared.depth() != CV_8U && !FormatSupports16Bit(entry.format_)) {
    cv::Mat u8;
    const double scale = (prepared.depth() == CV_16U) ? 1.0 / 257.0 : 1.0;
    prepared.convertTo(u8, CV_MAKETYPE(CV_8U, prepared.channels()), scale);
    prepared = u8;
  }

  if (prepared.channels() == 4 && !FormatSupportsAlpha(entry.format_)) {
    cv::Mat bgr;
    cv::cvtColor(prepared, bgr, cv::COLOR_BGRA2BGR);
    prepared = bgr;
  }

  if (entry.format_ == ImageFormatType::WEBP && prepared.channels() == 1) {
    cv::Mat bgr;
    cv::cvtColor(prepared, bgr, cv::COLOR_GRAY2BGR);
    prepared = bgr;
  }
  return prepared;
}

/**
 * @brief Data colour space signature of an ICC header (bytes 16..19), e.g. "RGB ", "GRAY"
 */
auto IccColorSpace(const byte_buffer_t& icc) -> std::string {
  constexpr size_t kColorSpaceOffset = 16;
  constexpr size_t kSignatureSize    = 4;
  if (icc.size() < kColorSpaceOffset + kSignatureSize) {
    return {};
  }
  return std::string(icc.begin() + kColorSpaceOffset,
                     icc.begin() + kColorSpaceOffset + kSignatureSize);
}

auto IccMatchesChannels(const std::string& color_space, int channels) -> bool {
  if (color_space == "RGB ") {
    return channels == 3 || channels == 4;
  }
  if (color_space == "GRAY") {
    return channels == 1 || channels == 2;
  }
  return false;
}

auto EncoderParams(const EncodePolicyEntry& entry) -> std::vector<int> {
  std::vector<int> params;
  switch (entry.format_) {
    case ImageFormatType::JPEG:
      params = {cv::IMWRITE_JPEG_QUALITY, entry.quality_.value_or(EncodePolicy::kDefaultJpegQuality),
                cv::IMWRITE_JPEG_OPTIMIZE, entry.optimize_ ? 1 : 0};
      break;
    case ImageFormatType::WEBP:
      params = {cv::IMWRITE_WEBP_QUALITY, entry.quality_.value_or(EncodePolicy::kWebpQuality)};
      break;
    default:
      // PNG and TIFF keep the encoder defaults
      break;
  }
  return params;
}
}  // namespace

auto ImageWriter::EncodePixels(const cv::Mat& pixels, const EncodePolicyEntry& entry)
    -> byte_buffer_t {
  if (pixels.empty()) {
    throw std::runtime_error("ImageWriter: image has no pixel data");
  }
  if (entry.format_ == ImageFormatType::UNRECOGNIZED) {
    throw std::runtime_error("ImageWriter: cannot encode an unrecognized format");
  }

  const cv::Mat    prepared = PrepareForEncoder(pixels, entry);
  std::vector<int> params   = EncoderParams(entry);

  byte_buffer_t    encoded;
  try {
    if (!cv::imencode(entry.codec_ext_, prepared, encoded, params)) {
      throw std::runtime_error(std::string("ImageWriter: OpenCV: imencode returned false for ") +
                               FormatName(entry.format_));
    }
  } catch (const cv::Exception& e) {
    throw std::runtime_error(std::string("ImageWriter: OpenCV: ") + e.what());
  }
  if (encoded.empty()) {
    throw std::runtime_error("ImageWriter: encoder produced no data");
  }
  return encoded;
}

auto ImageWriter::RewriteMetadata(const byte_buffer_t& encoded, const byte_buffer_t* icc_profile,
                                  bool clear_metadata) -> byte_buffer_t {
  Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(
      reinterpret_cast<const Exiv2::byte*>(encoded.data()), encoded.size());
  if (!image) {
    throw std::runtime_error("ImageWriter: Exiv2 cannot reopen encoded data");
  }
  image->readMetadata();

  if (clear_metadata) {
    image->clearExifData();
    image->clearIptcData();
    image->clearXmpData();
    image->clearComment();
  }
  if (icc_profile && !icc_profile->empty()) {
    image->setIccProfile(Exiv2::DataBuf(icc_profile->data(), icc_profile->size()), true);
  }
  image->writeMetadata();

  Exiv2::BasicIo& io = image->io();
  if (io.open() != 0) {
    throw std::runtime_error("ImageWriter: Exiv2 cannot read back rewritten data");
  }
  io.seek(0, Exiv2::BasicIo::beg);
  Exiv2::DataBuf rewritten = io.read(io.size());
  io.close();
  if (rewritten.empty()) {
    throw std::runtime_error("ImageWriter: metadata rewrite produced no data");
  }
  return byte_buffer_t(rewritten.c_data(), rewritten.c_data() + rewritten.size());
}

auto ImageWriter::Encode(const ImageRecord& record, const EncodePolicyEntry& entry)
    -> byte_buffer_t {
  if (record.orientation_ != 1) {
    // Pixels must be upright before every trace of the orientation tag disappears
    throw std::runtime_error("ImageWriter: record is not orientation-normalized");
  }
  if (record.pixels_.empty()) {
    throw std::runtime_error("ImageWriter: image has no pixel data");
  }

  const cv::Mat        prepared = PrepareForEncoder(record.pixels_, entry);

  const byte_buffer_t* icc      = nullptr;
  if (entry.retain_icc_profile_ && record.icc_profile_.has_value()) {
    icc = &record.icc_profile_.value();
    // The decoder may have converted CMYK or gray+alpha sources to BGR(A)
    const std::string color_space = IccColorSpace(*icc);
    if (!IccMatchesChannels(color_space, prepared.channels())) {
      throw std::runtime_error("ImageWriter: ICC profile colour space '" + color_space +
                               "' does not match " + std::to_string(prepared.channels()) +
                               "-channel " + FormatName(entry.format_) + " output");
    }
  }

  byte_buffer_t encoded = EncodePixels(prepared, entry);
  if (!icc && !entry.explicit_empty_metadata_) {
    return encoded;
  }
  return RewriteMetadata(encoded, icc, entry.explicit_empty_metadata_);
}
};  // namespace photoshelf
