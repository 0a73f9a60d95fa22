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

#include <unicode/uchar.h>
#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace photoshelf::natural {
namespace {
auto IsDigit(char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

/**
 * @brief Decode a UTF-8 run and lower every code point
 *
 * Malformed sequences become U+FFFD so that any byte string can be compared.
 */
auto LowerCodePoints(std::string_view text) -> std::u32string {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::u32string code_points;
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(code_points));
  for (auto& cp : code_points) {
    cp = static_cast<char32_t>(u_tolower(static_cast<UChar32>(cp)));
  }
  return code_points;
}

auto StripLeadingZeros(std::string_view digits) -> std::string_view {
  const size_t first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return {};
  }
  return digits.substr(first);
}

auto CompareNumbers(std::string_view lhs, std::string_view rhs) -> int {
  lhs = StripLeadingZeros(lhs);
  rhs = StripLeadingZeros(rhs);
  if (lhs.size() != rhs.size()) {
    return lhs.size() < rhs.size() ? -1 : 1;
  }
  const int cmp = lhs.compare(rhs);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

auto CompareText(std::string_view lhs, std::string_view rhs) -> int {
  const std::u32string a   = LowerCodePoints(lhs);
  const std::u32string b   = LowerCodePoints(rhs);
  const int            cmp = a.compare(b);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}
}  // namespace

auto Split(std::string_view value) -> std::vector<Chunk> {
  std::vector<Chunk> chunks;
  size_t             begin = 0;
  while (begin < value.size()) {
    const bool number = IsDigit(value[begin]);
    size_t     end    = begin + 1;
    while (end < value.size() && IsDigit(value[end]) == number) {
      ++end;
    }
    chunks.push_back({value.substr(begin, end - begin), number});
    begin = end;
  }
  return chunks;
}

auto Compare(std::string_view lhs, std::string_view rhs) -> int {
  const auto lhs_chunks = Split(lhs);
  const auto rhs_chunks = Split(rhs);
  const size_t common   = std::min(lhs_chunks.size(), rhs_chunks.size());

  for (size_t i = 0; i < common; ++i) {
    const Chunk& a = lhs_chunks[i];
    const Chunk& b = rhs_chunks[i];
    if (a.is_number_ != b.is_number_) {
      return a.is_number_ ? -1 : 1;
    }
    const int cmp = a.is_number_ ? CompareNumbers(a.text_, b.text_) : CompareText(a.text_, b.text_);
    if (cmp != 0) {
      return cmp;
    }
  }
  if (lhs_chunks.size() == rhs_chunks.size()) return 0;
  return lhs_chunks.size() < rhs_chunks.size() ? -1 : 1;
}

}  // namespace photoshelf::natural
