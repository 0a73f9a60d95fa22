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

#include <filesystem>
#include <iostream>
#include <ostream>
#include <vector>

#include "config/scan_config.hpp"
#include "io/file/atomic_writer.hpp"
#include "io/file/backup_manager.hpp"
#include "io/image/encode_policy.hpp"
#include "type/type.hpp"
#include "utils/report/strip_log.hpp"

namespace photoshelf {
struct StripOptions {
  std::filesystem::path root_         = "photos";
  bool                  dry_run_      = false;
  bool                  backup_       = false;
  int                   jpeg_quality_ = EncodePolicy::kDefaultJpegQuality;
};

/**
 * @brief Removes embedded metadata from every image under a root, in place
 *
 * One file is handled completely (read, inspect, decode, orient, encode, back up,
 * replace) before the next one starts. A failing file never stops the batch.
 */
class StripService {
 private:
  const ScanConfig& config_;
  StripOptions      options_;
  EncodePolicy      policy_;
  BackupManager     backup_manager_;
  AtomicWriter      atomic_writer_;

  std::ostream&     out_;
  std::ostream&     err_;

  auto              DescribeDryRun(const image_path_t& image_path) const -> std::string;

 public:
  StripService() = delete;
  StripService(const ScanConfig& config, StripOptions options, std::ostream& out = std::cout,
               std::ostream& err = std::cerr);

  StripService(const StripService&)            = delete;
  StripService& operator=(const StripService&) = delete;

  /**
   * @brief Candidate images below root in natural path order
   *
   * Excluded directories (backups) are not entered.
   */
  auto CollectImages(const std::filesystem::path& root) const -> std::vector<image_path_t>;

  /**
   * @brief Run the pipeline on a single file
   *
   * Never throws; failures come back as StripStatus::FAILED.
   */
  auto StripFile(const image_path_t& image_path) -> StripResult;

  /**
   * @brief Process the whole root and print one line per file plus a summary
   */
  auto Run() -> StripLog;
};
};  // namespace photoshelf
