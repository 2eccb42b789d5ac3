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

#include <charconv>     // for from_chars
#include <chrono>       // for milliseconds
#include <cstdint>      // for uint32_t, int64_t
#include <format>       // for format
#include <limits>       // for numeric_limits
#include <memory>       // for make_shared
#include <stdexcept>    // for invalid_argument
#include <string>       // for string, to_string
#include <string_view>  // for string_view
#include <system_error> // for errc, error_code
#include <utility>      // for move

#include <tl/expected.hpp> // for expected, unexpected

#include "log/dispatch_log_macros.hpp"
#include "scheduler/execution_engine.hpp"
#include "scheduler/job_routines.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"

namespace gpudispatch::scheduler {

namespace {

using namespace std::chrono_literals;

/**
 * Parse a positive integer override from the job config
 *
 * @param[in] config Job configuration
 * @param[in] key Config key
 * @param[in] fallback Value used when the key is absent
 * @return Parsed value, or a message describing the malformed entry
 */
tl::expected<std::int64_t, std::string>
positive_override(const JobConfig &config, const std::string_view key, const std::int64_t fallback) {
    const auto it = config.find(std::string{key});
    if (it == config.end()) {
        return fallback;
    }
    const std::string &text = it->second;
    std::int64_t value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value <= 0 ||
        value > std::numeric_limits<std::uint32_t>::max()) {
        return tl::unexpected(
                std::format("Invalid '{}' value '{}': expected a positive integer", key, text));
    }
    return value;
}

ExecutionError cancelled(const std::uint32_t steps_completed, const std::uint32_t total_steps) {
    ExecutionError error{};
    error.code = SchedulerErrc::CancellationRequested;
    error.message = std::format("Cancelled after {} of {} steps", steps_completed, total_steps);
    error.steps_completed = steps_completed;
    error.progress = total_steps == 0 ? MIN_PROGRESS
                                      : static_cast<double>(steps_completed) /
                                                static_cast<double>(total_steps) * MAX_PROGRESS;
    return error;
}

} // namespace

StagedRoutine::StagedRoutine(StagedRoutineSpec spec, StepFunction step)
        : spec_(std::move(spec)), step_(std::move(step)) {
    if (spec_.name.empty()) {
        throw std::invalid_argument("Staged routine requires a name");
    }
    if (spec_.total_steps == 0) {
        throw std::invalid_argument("Staged routine requires at least one step");
    }
}

ExecutionResult StagedRoutine::run(const RoutineContext &context) {
    const auto steps = positive_override(context.job.config, TOTAL_STEPS_KEY, spec_.total_steps);
    if (!steps) {
        return tl::unexpected(ExecutionError{SchedulerErrc::ExecutionError, steps.error()});
    }
    const auto step_ms =
            positive_override(context.job.config, STEP_DURATION_KEY, spec_.step_duration.count());
    if (!step_ms) {
        return tl::unexpected(ExecutionError{SchedulerErrc::ExecutionError, step_ms.error()});
    }

    const auto total_steps = static_cast<std::uint32_t>(*steps);
    const std::chrono::milliseconds step_duration{*step_ms};

    GPUD_LOGC_DEBUG(
            SchedulerComponent::Engine,
            "Job '{}' running {} ({} x {} of {}ms) on '{}'",
            context.job.id,
            spec_.name,
            total_steps,
            spec_.unit,
            step_duration.count(),
            context.worker.id);

    for (std::uint32_t step = 0; step < total_steps; ++step) {
        if (context.token.is_cancelled()) {
            return tl::unexpected(cancelled(step, total_steps));
        }

        if (step_) {
            step_(context, step);
        } else if (!context.token.wait_for(step_duration)) {
            return tl::unexpected(cancelled(step, total_steps));
        }

        const double progress =
                static_cast<double>(step + 1) / static_cast<double>(total_steps) * MAX_PROGRESS;
        if (context.report_progress) {
            context.report_progress(progress);
        }
        GPUD_LOGC_TRACE_L1(
                SchedulerComponent::Engine,
                "Job '{}' {} {}/{} done ({:.1f}%)",
                context.job.id,
                spec_.unit,
                step + 1,
                total_steps,
                progress);
    }

    return JobResult{
            {"routine", spec_.name},
            {"steps", std::to_string(total_steps)},
            {"worker", context.worker.id}};
}

void register_default_routines(RoutineRegistry &registry) {
    const auto install = [&registry](StagedRoutineSpec spec) {
        std::string job_type = spec.name;
        if (const auto ec = registry.register_routine(
                    job_type, std::make_shared<StagedRoutine>(std::move(spec)));
            ec) {
            throw std::invalid_argument(
                    std::format("Cannot register routine '{}': {}", job_type, ec.message()));
        }
    };

    install({.name = "training", .unit = "step", .total_steps = 100, .step_duration = 100ms});
    install({.name = "inference", .unit = "batch", .total_steps = 50, .step_duration = 50ms});
    install({.name = "data_processing", .unit = "file", .total_steps = 20, .step_duration = 200ms});
    install({.name = "staged", .unit = "step", .total_steps = 10, .step_duration = 100ms});
}

} // namespace gpudispatch::scheduler
