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
 * @file temp_file.hpp
 * @brief Scratch log files for logger tests
 */

#ifndef GPUDISPATCH_LOG_TESTS_TEMP_FILE_HPP
#define GPUDISPATCH_LOG_TESTS_TEMP_FILE_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace gpudispatch::log {

/**
 * Hands out unique file paths in the temporary directory and removes every
 * file it handed out on destruction. quill appends a start time to file
 * names, so removal matches on the returned stem.
 */
class TempFileManager final {
public:
    explicit TempFileManager(std::string prefix = "gpudispatch_log_test");
    ~TempFileManager();

    TempFileManager(const TempFileManager &) = delete;
    TempFileManager &operator=(const TempFileManager &) = delete;
    TempFileManager(TempFileManager &&) = delete;
    TempFileManager &operator=(TempFileManager &&) = delete;

    /**
     * Reserve a new unique path
     *
     * @param[in] suffix Extension appended to the generated name
     * @return Absolute file path
     */
    [[nodiscard]] std::string get_temp_file(const std::string &suffix = "");

private:
    std::string prefix_;
    std::filesystem::path temp_dir_;
    std::vector<std::string> stems_;
    int counter_{0};
};

/**
 * Read a whole file
 *
 * @param[in] filepath File to read
 * @return Contents, empty when the file cannot be opened
 */
std::string read_file_contents(const std::string &filepath);

/**
 * Check that a file contains a piece of text
 *
 * @param[in] filepath File to search
 * @param[in] search_text Text to find
 * @return true when found
 */
bool file_contains(const std::string &filepath, const std::string &search_text);

} // namespace gpudispatch::log

#endif // GPUDISPATCH_LOG_TESTS_TEMP_FILE_HPP
