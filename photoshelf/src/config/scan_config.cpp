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

#include "config/scan_config.hpp"

namespace photoshelf {
namespace {
auto MakeDefaultConfig() -> ScanConfig {
  ScanConfig config;
  config.image_extensions_  = {".jpg", ".jpeg", ".png", ".webp", ".tif", ".tiff"};
  config.backup_dir_name_   = ".originals";
  config.excluded_dirs_     = {config.backup_dir_name_};
  config.listing_name_      = "index.json";
  config.listing_js_name_   = "index.js";
  config.listing_js_global_ = "window.ALBUM_FILES";
  config.temp_suffix_       = ".tmp_nox";
  return config;
}
}  // namespace

auto ScanConfig::Default() -> const ScanConfig& {
  static const ScanConfig config = MakeDefaultConfig();
  return config;
}
};  // namespace photoshelf
