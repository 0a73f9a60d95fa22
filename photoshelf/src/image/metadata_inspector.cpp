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

#include "image/metadata_inspector.hpp"

#include <cstddef>
#include <cstdint>
#include <exiv2/exiv2.hpp>
#include <stdexcept>
#include <string>

#include "utils/path/path_utils.hpp"

namespace photoshelf {
namespace {
constexpr orientation_t kUprightOrientation = 1;

auto ReadOrientation(Exiv2::ExifData& exif_data) -> orientation_t {
  if (exif_data.empty()) {
    return kUprightOrientation;
  }
  auto it = exif_data.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
  if (it == exif_data.end() || it->count() == 0) {
    return kUprightOrientation;
  }
  const int64_t value = it->toInt64();
  if (value < 1 || value > 8) {
    return kUprightOrientation;
  }
  return static_cast<orientation_t>(value);
}
}  // namespace

auto MetadataInspector::DetectFormat(const uint8_t* buffer, size_t size) -> ImageFormatType {
  if (!buffer || size == 0) {
    return ImageFormatType::UNRECOGNIZED;
  }
  switch (Exiv2::ImageFactory::getType(reinterpret_cast<const Exiv2::byte*>(buffer), size)) {
    case Exiv2::ImageType::jpeg:
      return ImageFormatType::JPEG;
    case Exiv2::ImageType::png:
      return ImageFormatType::PNG;
    case Exiv2::ImageType::webp:
      return ImageFormatType::WEBP;
    case Exiv2::ImageType::tiff:
      return ImageFormatType::TIFF;
    default:
      return ImageFormatType::UNRECOGNIZED;
  }
}

auto MetadataInspector::Inspect(const image_path_t& image_path, const byte_buffer_t& bytes)
    -> ImageRecord {
  if (bytes.empty()) {
    throw std::runtime_error("MetadataInspector: empty file");
  }

  ImageRecord record;
  record.path_   = image_path;
  record.format_ = DetectFormat(bytes.data(), bytes.size());
  if (record.format_ == ImageFormatType::UNRECOGNIZED) {
    throw std::runtime_error("MetadataInspector: not a JPEG, PNG, WEBP or TIFF image");
  }

  Exiv2::Image::UniquePtr image =
      Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(bytes.data()), bytes.size());
  if (!image) {
    throw std::runtime_error("MetadataInspector: cannot open " +
                             path_util::PathToUtf8(image_path));
  }
  image->readMetadata();

  Exiv2::ExifData& exif_data = image->exifData();
  record.has_exif_           = !exif_data.empty();
  record.orientation_        = ReadOrientation(exif_data);

  if (image->iccProfileDefined()) {
    const Exiv2::DataBuf& icc = image->iccProfile();
    record.icc_profile_       = byte_buffer_t(icc.c_data(), icc.c_data() + icc.size());
  }
  return record;
}
}  // namespace photoshelf
