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

#include <string>
#include <string_view>
#include <vector>

namespace photoshelf::natural {

/**
 * @brief One maximal run of either ASCII digits or non-digits
 */
struct Chunk {
  std::string_view text_;
  bool             is_number_ = false;
};

auto Split(std::string_view value) -> std::vector<Chunk>;

/**
 * @brief Three-way natural comparison
 *
 * Digit runs compare by numeric value (any length), text runs compare by their
 * lowercased Unicode code points, and a digit run orders before a text run at the
 * same position. "img2.jpg" < "img10.jpg", "a.jpg" < "B.jpg", "ärger2" < "Ärger10".
 *
 * @return negative, zero or positive
 */
auto Compare(std::string_view lhs, std::string_view rhs) -> int;

struct Less {
  auto operator()(const std::string& lhs, const std::string& rhs) const -> bool {
    const int order = Compare(lhs, rhs);
    // Keep the order strict and total for names differing only in case or zero padding
    return order != 0 ? order < 0 : lhs < rhs;
  }
};

}  // namespace photoshelf::natural
