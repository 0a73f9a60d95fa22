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

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "type/type.hpp"

namespace photoshelf {
enum class StripStatus { STRIPPED, WOULD_STRIP, ALREADY_CLEAN, FAILED };

struct StripResult {
  image_path_t path_{};
  StripStatus  status_ = StripStatus::FAILED;
  std::string  message_{};

  auto         Succeeded() const -> bool { return status_ != StripStatus::FAILED; }
};

struct StripReport {
  size_t processed_     = 0;
  size_t changed_       = 0;
  size_t already_clean_ = 0;
  size_t errors_        = 0;
};

/**
 * @brief Collects the per-file outcome of one strip run
 */
class StripLog {
 public:
  void Add(StripResult result) {
    ++report_.processed_;
    switch (result.status_) {
      case StripStatus::STRIPPED:
      case StripStatus::WOULD_STRIP:
        ++report_.changed_;
        break;
      case StripStatus::ALREADY_CLEAN:
        ++report_.already_clean_;
        break;
      case StripStatus::FAILED:
        ++report_.errors_;
        failed_.push_back(result);
        break;
    }
    results_.push_back(std::move(result));
  }

  auto Report() const -> const StripReport& { return report_; }
  auto Results() const -> const std::vector<StripResult>& { return results_; }
  auto Failed() const -> const std::vector<StripResult>& { return failed_; }

 private:
  StripReport              report_{};
  std::vector<StripResult> results_{};
  std::vector<StripResult> failed_{};
};
}  // namespace photoshelf
