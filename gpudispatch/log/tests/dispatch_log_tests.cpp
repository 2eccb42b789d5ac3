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
 * @file dispatch_log_tests.cpp
 * @brief Unit tests for the dispatcher logger and component filtering
 */

#include <filesystem> // for exists
#include <stdexcept>  // for invalid_argument
#include <string>     // for string
#include <unordered_map>

#include <gtest/gtest.h>

#include "log/components.hpp"
#include "log/dispatch_log.hpp"
#include "log/dispatch_log_macros.hpp"
#include "temp_file.hpp"

namespace {

namespace gl = ::gpudispatch::log;

DECLARE_LOG_COMPONENT(TestComponent, Alpha, Beta, Gamma);
DECLARE_LOG_EVENT(TestEvent, Started, Stopped);

struct NodeSummary {
    std::string name;
    int slots{};
};

} // namespace

GPUD_LOGGABLE_DEFERRED_FORMAT(NodeSummary, "Node({}, slots={})", obj.name, obj.slots)

namespace {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

TEST(DispatchLog, ConsoleLoggingDoesNotThrow) {
    gl::Logger::configure(gl::LoggerConfig::console(gl::LogLevel::Debug, false));
    GPUD_LOG_DEBUG("Debug message: {}", 42);
    GPUD_LOG_INFO("Info message: {}", "test");
    GPUD_LOG_WARN("Warning message");
    gl::Logger::flush();
    EXPECT_EQ(gl::Logger::get_sink_type(), gl::SinkType::Console);
    EXPECT_TRUE(gl::Logger::get_actual_log_file().empty());
}

TEST(DispatchLog, FileSinkWritesMessages) {
    gl::TempFileManager temp_manager{"file_sink"};
    const std::string log_file = temp_manager.get_temp_file(".log");

    gl::Logger::configure(gl::LoggerConfig::file(log_file, gl::LogLevel::Debug));
    const std::string actual = gl::Logger::get_actual_log_file();

    GPUD_LOG_DEBUG("debug record {}", 7);
    GPUD_LOG_ERROR("error record {}", "x");
    gl::Logger::flush();

    EXPECT_TRUE(std::filesystem::exists(actual));
    EXPECT_TRUE(gl::file_contains(actual, "debug record 7"));
    EXPECT_TRUE(gl::file_contains(actual, "error record x"));
}

TEST(DispatchLog, FileSinkRequiresPath) {
    EXPECT_THROW(gl::Logger::configure(gl::LoggerConfig::file("")), std::invalid_argument);
    EXPECT_THROW(gl::Logger::configure(gl::LoggerConfig::json_file("")), std::invalid_argument);
    gl::Logger::configure(gl::LoggerConfig::console());
}

TEST(DispatchLog, ComponentLevelFiltersMessages) {
    gl::TempFileManager temp_manager{"component_filter"};
    const std::string log_file = temp_manager.get_temp_file(".log");
    gl::Logger::configure(gl::LoggerConfig::file(log_file, gl::LogLevel::TraceL1));

    gl::register_component<TestComponent>(gl::LogLevel::Info);
    gl::register_component<TestComponent>(
            std::unordered_map<TestComponent, gl::LogLevel>{{TestComponent::Beta, gl::LogLevel::Error}});

    GPUD_LOGC_INFO(TestComponent::Alpha, "alpha visible");
    GPUD_LOGC_DEBUG(TestComponent::Alpha, "alpha hidden");
    GPUD_LOGC_WARN(TestComponent::Beta, "beta hidden");
    GPUD_LOGC_ERROR(TestComponent::Beta, "beta visible");
    gl::Logger::flush();

    const std::string actual = gl::Logger::get_actual_log_file();
    EXPECT_TRUE(gl::file_contains(actual, "[Alpha] alpha visible"));
    EXPECT_FALSE(gl::file_contains(actual, "alpha hidden"));
    EXPECT_FALSE(gl::file_contains(actual, "beta hidden"));
    EXPECT_TRUE(gl::file_contains(actual, "[Beta] beta visible"));

    EXPECT_EQ(gl::get_component_level(TestComponent::Gamma), gl::LogLevel::Info);
    EXPECT_EQ(gl::get_component_level(TestComponent::Beta), gl::LogLevel::Error);
    gl::register_component<TestComponent>(gl::LogLevel::Info);
}

TEST(DispatchLog, EventRecordsCarryEventName) {
    gl::TempFileManager temp_manager{"event_records"};
    const std::string log_file = temp_manager.get_temp_file(".log");
    gl::Logger::configure(gl::LoggerConfig::file(log_file, gl::LogLevel::Debug));
    gl::register_component<TestComponent>(gl::LogLevel::Debug);

    GPUD_LOGEC_INFO(TestComponent::Gamma, TestEvent::Started, "node {}", NodeSummary{"n1", 4});
    gl::Logger::flush();

    const std::string actual = gl::Logger::get_actual_log_file();
    EXPECT_TRUE(gl::file_contains(actual, "[Gamma] EVENT [Started] node Node(n1, slots=4)"));
    gl::register_component<TestComponent>(gl::LogLevel::Info);
}

TEST(DispatchLog, GlobalLevelRoundTrip) {
    gl::Logger::configure(gl::LoggerConfig::console(gl::LogLevel::Info, false));
    gl::Logger::set_level(gl::LogLevel::Warn);
    EXPECT_EQ(gl::Logger::get_current_level(), gl::LogLevel::Warn);
    gl::Logger::set_level(gl::LogLevel::Info);
    EXPECT_EQ(gl::Logger::get_current_level(), gl::LogLevel::Info);
}

TEST(EnumRegistry, NamesAndValidity) {
    EXPECT_EQ(gl::format_component_name(TestComponent::Beta), "Beta");
    EXPECT_EQ(gl::format_event_name(TestEvent::Stopped), "Stopped");
    EXPECT_TRUE(gl::EnumRegistry<TestComponent>::is_valid(TestComponent::Gamma));
    EXPECT_FALSE(gl::EnumRegistry<TestComponent>::is_valid(static_cast<TestComponent>(17)));
    EXPECT_EQ(gl::format_component_name(static_cast<TestComponent>(17)), "UNKNOWN");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
