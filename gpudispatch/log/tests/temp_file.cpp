/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file temp_file.cpp
 * @brief Scratch log files for logger tests
 */

#include <chrono>     // for system_clock
#include <exception>  // for exception
#include <filesystem> // for directory_iterator, remove
#include <fstream>    // for ifstream
#include <iostream>   // for cerr
#include <sstream>    // for stringstream
#include <string>     // for string, to_string
#include <utility>    // for move

#include "temp_file.hpp"

namespace gpudispatch::log {

TempFileManager::TempFileManager(std::string prefix)
        : prefix_(std::move(prefix)), temp_dir_(std::filesystem::temp_directory_path()) {}

TempFileManager::~TempFileManager() {
    try {
        for (const auto &entry : std::filesystem::directory_iterator(temp_dir_)) {
            const std::string name = entry.path().filename().string();
            for (const auto &stem : stems_) {
                if (name.starts_with(stem)) {
                    std::filesystem::remove(entry.path());
                    break;
                }
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "Warning: failed to clean temporary log files: " << e.what() << '\n';
    }
}

std::string TempFileManager::get_temp_file(const std::string &suffix) {
    const auto stamp = std::chrono::duration_cast<std::chrono::microseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
    std::string stem = prefix_ + "_" + std::to_string(stamp) + "_" + std::to_string(++counter_);
    stems_.push_back(stem);
    return (temp_dir_ / (stem + suffix)).string();
}

std::string read_file_contents(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return "";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
bool file_contains(const std::string &filepath, const std::string &search_text) {
    return read_file_contents(filepath).find(search_text) != std::string::npos;
}

} // namespace gpudispatch::log
