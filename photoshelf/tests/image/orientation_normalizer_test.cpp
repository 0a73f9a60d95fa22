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

#include <gtest/gtest.h>

#include <opencv2/core.hpp>
#include <vector>

#include "image/image_record.hpp"

namespace photoshelf {
namespace {
// 2 rows x 3 cols:
// 1 2 3
// 4 5 6
auto MakeGrid() -> cv::Mat { return (cv::Mat_<uint8_t>(2, 3) << 1, 2, 3, 4, 5, 6); }

auto Flatten(const cv::Mat& m) -> std::vector<uint8_t> {
  std::vector<uint8_t> values;
  for (int r = 0; r < m.rows; ++r) {
    for (int c = 0; c < m.cols; ++c) {
      values.push_back(m.at<uint8_t>(r, c));
    }
  }
  return values;
}

struct OrientationCase {
  orientation_t        orientation;
  int                  rows;
  int                  cols;
  std::vector<uint8_t> expected;
};
}  // namespace

TEST(OrientationNormalizerTest, AppliesEveryExifOrientation) {
  const std::vector<OrientationCase> cases = {
      {1, 2, 3, {1, 2, 3, 4, 5, 6}},
      {2, 2, 3, {3, 2, 1, 6, 5, 4}},
      {3, 2, 3, {6, 5, 4, 3, 2, 1}},
      {4, 2, 3, {4, 5, 6, 1, 2, 3}},
      {5, 3, 2, {1, 4, 2, 5, 3, 6}},
      {6, 3, 2, {4, 1, 5, 2, 6, 3}},
      {7, 3, 2, {6, 3, 5, 2, 4, 1}},
      {8, 3, 2, {3, 6, 2, 5, 1, 4}},
  };

  const cv::Mat grid = MakeGrid();
  for (const auto& c : cases) {
    SCOPED_TRACE(testing::Message() << "orientation " << c.orientation);
    const cv::Mat out = OrientationNormalizer::Apply(grid, c.orientation);
    EXPECT_EQ(out.rows, c.rows);
    EXPECT_EQ(out.cols, c.cols);
    EXPECT_EQ(Flatten(out), c.expected);
  }
}

TEST(OrientationNormalizerTest, OutOfRangeValuesAreIgnored) {
  const cv::Mat grid = MakeGrid();
  for (orientation_t value : {orientation_t{0}, orientation_t{9}, orientation_t{65535}}) {
    const cv::Mat out = OrientationNormalizer::Apply(grid, value);
    EXPECT_EQ(Flatten(out), Flatten(grid));
  }
}

TEST(OrientationNormalizerTest, NormalizeResetsRecordToUpright) {
  ImageRecord record;
  record.pixels_      = cv::Mat(20, 40, CV_8UC3, cv::Scalar(10, 20, 30));
  record.orientation_ = 6;

  OrientationNormalizer::Normalize(record);
  EXPECT_EQ(record.orientation_, 1);
  EXPECT_EQ(record.pixels_.cols, 20);
  EXPECT_EQ(record.pixels_.rows, 40);
  EXPECT_EQ(record.pixels_.channels(), 3);

  // A second pass changes nothing
  OrientationNormalizer::Normalize(record);
  EXPECT_EQ(record.pixels_.cols, 20);
  EXPECT_EQ(record.pixels_.rows, 40);
}
};  // namespace photoshelf
