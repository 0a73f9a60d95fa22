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

#include "utils/string/natural_compare.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace photoshelf {
TEST(NaturalCompareTest, DigitRunsCompareByValue) {
  EXPECT_LT(natural::Compare("a2", "a10"), 0);
  EXPECT_GT(natural::Compare("img100.jpg", "img20.jpg"), 0);
  EXPECT_EQ(natural::Compare("IMG_0007.jpg", "IMG_7.jpg"), 0);
  // Longer than any integer type
  EXPECT_LT(natural::Compare("x99999999999999999999998", "x99999999999999999999999"), 0);
}

TEST(NaturalCompareTest, TextIgnoresCase) {
  EXPECT_LT(natural::Compare("a.jpg", "B.jpg"), 0);
  EXPECT_GT(natural::Compare("b.jpg", "A.jpg"), 0);
  EXPECT_EQ(natural::Compare("Photo.JPG", "photo.jpg"), 0);
}

TEST(NaturalCompareTest, NonAsciiLettersIgnoreCase) {
  // "Ärger10.jpg" and "ärger2.jpg" in UTF-8
  const std::string upper = "\xC3\x84rger10.jpg";
  const std::string lower = "\xC3\xA4rger2.jpg";
  EXPECT_GT(natural::Compare(upper, lower), 0);
  EXPECT_EQ(natural::Compare("\xC3\x89T\xC3\x89.png", "\xC3\xA9t\xC3\xA9.png"), 0);

  std::vector<std::string> names = {upper, lower};
  std::sort(names.begin(), names.end(), natural::Less{});
  EXPECT_EQ(names[0], lower);
  EXPECT_EQ(names[1], upper);

  // Malformed UTF-8 still orders deterministically
  EXPECT_LT(natural::Compare("a\xFF", "b"), 0);
}

TEST(NaturalCompareTest, NumbersSortBeforeTextAndPrefixesFirst) {
  EXPECT_LT(natural::Compare("1cover.jpg", "cover.jpg"), 0);
  EXPECT_LT(natural::Compare("trip", "trip2"), 0);
  EXPECT_LT(natural::Compare("", "a"), 0);
}

TEST(NaturalCompareTest, SplitSeparatesDigitRuns) {
  const auto chunks = natural::Split("img12b003");
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0].text_, "img");
  EXPECT_FALSE(chunks[0].is_number_);
  EXPECT_EQ(chunks[1].text_, "12");
  EXPECT_TRUE(chunks[1].is_number_);
  EXPECT_EQ(chunks[2].text_, "b");
  EXPECT_EQ(chunks[3].text_, "003");
  EXPECT_TRUE(chunks[3].is_number_);
}

TEST(NaturalCompareTest, LessGivesTotalOrder) {
  std::vector<std::string> names = {"img10.jpg", "IMG_1.jpg", "img2.jpg", "Beach.png",
                                    "apple.jpg", "img1.jpg",  "IMG1.jpg"};
  std::sort(names.begin(), names.end(), natural::Less{});
  const std::vector<std::string> expected = {"apple.jpg", "Beach.png", "IMG1.jpg", "img1.jpg",
                                             "img2.jpg",  "img10.jpg", "IMG_1.jpg"};
  EXPECT_EQ(names, expected);

  // Ties between case variants still resolve deterministically
  EXPECT_TRUE(natural::Less{}("IMG1.jpg", "img1.jpg"));
  EXPECT_FALSE(natural::Less{}("img1.jpg", "IMG1.jpg"));
}
};  // namespace photoshelf
