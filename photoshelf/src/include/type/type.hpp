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

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace photoshelf {

#define image_path_t   std::filesystem::path
#define album_path_t   std::filesystem::path
#define file_name_t    std::string

#define byte_buffer_t  std::vector<uint8_t>

#define orientation_t  uint16_t

};  // namespace photoshelf
