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
#include <string>

#include "type/type.hpp"

namespace photoshelf::path_util {

auto PathToUtf8(const std::filesystem::path& path) -> std::string;
auto ToLowerAscii(std::string value) -> std::string;

/**
 * @brief Lower-cased extension including the leading dot, empty when there is none
 */
auto LowerExtension(const std::filesystem::path& path) -> std::string;

/**
 * @brief Sibling path made by appending a suffix to the full file name
 *
 * "a/b.jpg" + ".tmp" -> "a/b.jpg.tmp"
 */
auto AppendToFileName(const std::filesystem::path& path, const std::string& suffix)
    -> std::filesystem::path;

auto EnsureDirectoryExists(const std::filesystem::path& dir) -> bool;

/**
 * @brief Read a whole file into memory
 *
 * @throw std::runtime_error if the file cannot be opened or read completely
 */
auto ReadFileBytes(const std::filesystem::path& path) -> byte_buffer_t;

}  // namespace photoshelf::path_util
