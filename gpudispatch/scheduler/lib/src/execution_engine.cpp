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

#include <algorithm>    // for sort
#include <exception>    // for exception
#include <format>       // for format
#include <memory>       // for shared_ptr
#include <mutex>        // for lock_guard
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include <tl/expected.hpp> // for unexpected

#include "log/dispatch_log_macros.hpp"
#include "scheduler/execution_engine.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"

namespace gpudispatch::scheduler {

std::error_code
RoutineRegistry::register_routine(std::string job_type, std::shared_ptr<IJobRoutine> routine) {
    if (job_type.empty() || routine == nullptr) {
        return SchedulerErrc::InvalidParameter;
    }
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = routines_.try_emplace(std::move(job_type), std::move(routine));
    if (!inserted) {
        return SchedulerErrc::DuplicateId;
    }
    GPUD_LOGC_DEBUG(
            SchedulerComponent::Engine,
            "Registered routine '{}' for job type '{}'",
            it->second->name(),
            it->first);
    return SchedulerErrc::Success;
}

std::shared_ptr<IJobRoutine> RoutineRegistry::find(std::string_view job_type) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = routines_.find(std::string{job_type});
    return it == routines_.end() ? nullptr : it->second;
}

bool RoutineRegistry::contains(std::string_view job_type) const {
    return find(job_type) != nullptr;
}

std::vector<std::string> RoutineRegistry::job_types() const {
    std::vector<std::string> types;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        types.reserve(routines_.size());
        for (const auto &[job_type, routine] : routines_) {
            types.push_back(job_type);
        }
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::string unsupported_job_type_message(std::string_view job_type) {
    return std::format("Unsupported job type: {}", job_type);
}

ExecutionResult ExecutionEngine::run(
        const Job &job,
        const Worker &worker,
        const task::CancellationToken &token,
        const ProgressSink &report_progress) const {
    const auto routine = routines_.find(job.job_type);
    if (routine == nullptr) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Engine,
                SchedulerErrorEvent::ExecutionError,
                "Job '{}' has unsupported type '{}'",
                job.id,
                job.job_type);
        return tl::unexpected(ExecutionError{
                SchedulerErrc::UnknownJobType, unsupported_job_type_message(job.job_type)});
    }

    const RoutineContext context{job, worker, token, report_progress};
    try {
        auto outcome = routine->run(context);
        if (!outcome && outcome.error().code == SchedulerErrc::ExecutionError) {
            GPUD_LOGEC_WARN(
                    SchedulerComponent::Engine,
                    SchedulerErrorEvent::ExecutionError,
                    "Job '{}' routine '{}' failed: {}",
                    job.id,
                    routine->name(),
                    outcome.error().message);
        }
        return outcome;
    } catch (const std::exception &e) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Engine,
                SchedulerErrorEvent::ExecutionError,
                "Job '{}' routine '{}' threw: {}",
                job.id,
                routine->name(),
                e.what());
        return tl::unexpected(ExecutionError{SchedulerErrc::ExecutionError, e.what()});
    } catch (...) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Engine,
                SchedulerErrorEvent::ExecutionError,
                "Job '{}' routine '{}' threw a non-standard exception",
                job.id,
                routine->name());
        return tl::unexpected(
                ExecutionError{SchedulerErrc::ExecutionError, std::string{UNKNOWN_EXCEPTION_MESSAGE}});
    }
}

} // namespace gpudispatch::scheduler
