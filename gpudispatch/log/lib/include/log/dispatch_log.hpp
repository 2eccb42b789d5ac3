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
 * @file dispatch_log.hpp
 * @brief Process-wide logger for the dispatcher built on quill
 *
 * The logger is a singleton owning the quill backend thread and a single
 * sink. Components declared with DECLARE_LOG_COMPONENT filter messages
 * before they reach quill, see dispatch_log_macros.hpp.
 */

#ifndef GPUDISPATCH_LOG_DISPATCH_LOG_HPP
#define GPUDISPATCH_LOG_DISPATCH_LOG_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// Disable Quill's non-prefixed macros to avoid conflicts
#define QUILL_DISABLE_NON_PREFIXED_MACROS

#include <quill/Backend.h>
#include <quill/DeferredFormatCodec.h>
#include <quill/DirectFormatCodec.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>
#include <quill/sinks/JsonSink.h>
#include <quill/std/Vector.h>

#include <wise_enum.h>

#include "log/components.hpp"

namespace gpudispatch::log {

/**
 * Frontend options for the dispatcher
 *
 * Lifecycle transitions must not be lost, so the queue blocks instead of
 * dropping when the backend falls behind.
 */
struct DispatchFrontendOptions final {
    static constexpr quill::QueueType queue_type = // NOLINT(readability-identifier-naming)
            quill::QueueType::BoundedBlocking;     //!< Block producers when full
    static constexpr uint32_t initial_queue_capacity = // NOLINT(readability-identifier-naming)
            1024 * 1024;                               //!< 1 MB per producer thread
    static constexpr uint32_t
            blocking_queue_retry_interval_ns = // NOLINT(readability-identifier-naming)
            800;                               //!< Retry interval while blocked
    static constexpr size_t unbounded_queue_max_capacity = // NOLINT(readability-identifier-naming)
            0;                                             //!< Unused for bounded queues
    static constexpr quill::HugePagesPolicy
            huge_pages_policy =            // NOLINT(readability-identifier-naming)
            quill::HugePagesPolicy::Never; //!< No huge pages
};

using DispatchFrontend = quill::FrontendImpl<DispatchFrontendOptions>;
using DispatchLogger = quill::LoggerImpl<DispatchFrontendOptions>;

/// Output destination of the logger
enum class SinkType {
    Console,    //!< Console output
    File,       //!< Plain text file
    JsonFile,   //!< JSON lines file
    JsonConsole //!< JSON lines on the console
};

} // namespace gpudispatch::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(gpudispatch::log::SinkType, Console, File, JsonFile, JsonConsole)

namespace gpudispatch::log {

/**
 * Logger configuration
 *
 * Build with one of the static factories and refine with the with_* setters.
 */
struct LoggerConfig final {
    SinkType sink_type{SinkType::Console}; //!< Output destination
    std::string log_file;                  //!< Path for file based sinks
    LogLevel min_level{LogLevel::Info};    //!< Global threshold applied by quill
    bool enable_colors{true};              //!< Colored console output
    bool enable_file_line{true};           //!< Append file:line to each record
    bool enable_timestamps{true};          //!< Prefix records with a timestamp
    bool enable_thread_name{true};         //!< Include the producing thread name
    static constexpr int DEFAULT_BACKEND_SLEEP_US = 100; //!< Backend idle sleep
    std::chrono::microseconds backend_sleep_duration{
            std::chrono::microseconds{DEFAULT_BACKEND_SLEEP_US}}; //!< Backend idle sleep

    /**
     * Console logger configuration
     *
     * @param[in] level Global threshold
     * @param[in] colors Enable colored output
     * @return Configuration for console output
     */
    static LoggerConfig console(LogLevel level = LogLevel::Info, bool colors = true);

    /**
     * Plain text file logger configuration
     *
     * @param[in] path Log file path
     * @param[in] level Global threshold
     * @return Configuration for file output
     */
    static LoggerConfig file(std::string path, LogLevel level = LogLevel::Info);

    /**
     * JSON file logger configuration
     *
     * @param[in] path Log file path
     * @param[in] level Global threshold
     * @return Configuration for JSON file output
     */
    static LoggerConfig json_file(std::string path, LogLevel level = LogLevel::Info);

    /**
     * JSON console logger configuration
     *
     * @param[in] level Global threshold
     * @return Configuration for JSON console output
     */
    static LoggerConfig json_console(LogLevel level = LogLevel::Info);

    LoggerConfig &with_file_line(bool enable = true);
    LoggerConfig &with_timestamps(bool enable = true);
    LoggerConfig &with_thread_name(bool enable = true);
    LoggerConfig &with_colors(bool enable = true);
    LoggerConfig &with_backend_sleep_duration(std::chrono::microseconds duration);
};

namespace detail {
/**
 * Underlying quill logger used by the GPUD_LOG* macros
 *
 * @return Logger of the current configuration
 */
DispatchLogger *get_quill_logger();
} // namespace detail

/**
 * Process-wide dispatcher logger
 *
 * A console logger is created lazily on first use. configure() replaces it,
 * restarting the quill backend with the new sink.
 */
class Logger final {
public:
    /**
     * Replace the active logger
     *
     * @param[in] config New configuration
     * @throws std::invalid_argument if a file sink is requested without a path
     */
    static void configure(const LoggerConfig &config);

    /**
     * Change the global threshold
     *
     * @param[in] level New threshold
     */
    static void set_level(LogLevel level);

    /// Block until every queued record has been written
    static void flush();

    [[nodiscard]] static SinkType get_sink_type();
    [[nodiscard]] static LogLevel get_current_level();

    /**
     * File written by the active logger
     *
     * @return Path of the log file, empty for console sinks
     */
    [[nodiscard]] static std::string get_actual_log_file();

    ~Logger() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

private:
    explicit Logger(const LoggerConfig &config);

    [[nodiscard]] static std::unique_ptr<Logger> &get_instance();

    [[nodiscard]] static quill::LogLevel to_quill_level(LogLevel level);
    [[nodiscard]] static LogLevel from_quill_level(quill::LogLevel level);

    [[nodiscard]] std::shared_ptr<quill::Sink> create_sink(const LoggerConfig &config);

    SinkType sink_type_{SinkType::Console}; //!< Active sink type
    std::string actual_log_file_;           //!< File path after quill appended its suffix
    DispatchLogger *quill_logger_{nullptr}; //!< Owned by the quill frontend

    friend DispatchLogger *detail::get_quill_logger();
};

} // namespace gpudispatch::log

#endif // GPUDISPATCH_LOG_DISPATCH_LOG_HPP
