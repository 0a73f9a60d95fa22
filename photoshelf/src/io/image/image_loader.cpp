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

#include "io/image/image_loader.hpp"

#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <string>

#include "utils/path/path_utils.hpp"

namespace photoshelf {
auto ImageLoader::LoadBytes(const image_path_t& image_path) -> byte_buffer_t {
  return path_util::ReadFileBytes(image_path);
}

auto ImageLoader::DecodePixels(const byte_buffer_t& bytes) -> cv::Mat {
  if (bytes.empty()) {
    throw std::runtime_error("ImageLoader: empty buffer");
  }
  // imdecode does not modify the buffer, the cast only satisfies the Mat constructor
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<uint8_t*>(bytes.data()));

  cv::Mat       pixels;
  try {
    pixels = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    throw std::runtime_error(std::string("ImageLoader: OpenCV: ") + e.what());
  }
  if (pixels.empty()) {
    throw std::runtime_error("ImageLoader: failed to decode image data");
  }
  return pixels;
}

void ImageLoader::LoadPixels(const byte_buffer_t& bytes, ImageRecord& record) {
  record.pixels_ = DecodePixels(bytes);
}
};  // namespace photoshelf
