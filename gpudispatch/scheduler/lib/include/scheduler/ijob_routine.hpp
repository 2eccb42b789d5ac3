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

#ifndef GPUDISPATCH_SCHEDULER_IJOB_ROUTINE_HPP
#define GPUDISPATCH_SCHEDULER_IJOB_ROUTINE_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "scheduler/job.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/worker.hpp"
#include "task/cancellation_token.hpp"

namespace gpudispatch::scheduler {

/// Receives progress percentages while a routine runs
using ProgressSink = std::function<void(double)>;

/// Error message recorded when a routine throws something other than std::exception
inline constexpr std::string_view UNKNOWN_EXCEPTION_MESSAGE = "Unknown exception occurred";

/**
 * Failure of a job routine
 *
 * code is SchedulerErrc::CancellationRequested when the routine stopped at
 * a cancellation checkpoint. Any other code (SchedulerErrc::ExecutionError,
 * SchedulerErrc::UnknownJobType) fails the job with message as its error.
 */
struct ExecutionError final {
    SchedulerErrc code{SchedulerErrc::ExecutionError}; //!< Failure kind
    std::string message;                              //!< Reason, recorded verbatim on the job
    std::uint32_t steps_completed{0};                 //!< Steps finished before stopping
    double progress{0.0};                             //!< Last reported progress
};

/// Outcome of running a routine
using ExecutionResult = tl::expected<JobResult, ExecutionError>;

/**
 * Everything a routine may use while it runs
 */
struct RoutineContext final {
    const Job &job;                        //!< Job being executed
    const Worker &worker;                  //!< Worker the job is assigned to
    const task::CancellationToken &token;  //!< Checked between steps
    const ProgressSink &report_progress;   //!< Called after every step
};

/**
 * @class IJobRoutine
 * @brief Type specific body of a job.
 *
 * A routine runs on the job's own thread. It reports progress through the
 * context and checks the cancellation token at least once per step so a
 * cancellation requested during one step takes effect before the next one
 * completes.
 */
class IJobRoutine {
public:
    IJobRoutine() = default;
    virtual ~IJobRoutine() = default;
    IJobRoutine(IJobRoutine &&) = default;
    IJobRoutine &operator=(IJobRoutine &&) = default;
    IJobRoutine(const IJobRoutine &) = delete;
    IJobRoutine &operator=(const IJobRoutine &) = delete;

    /**
     * Execute the job.
     *
     * @param[in] context Job, worker, cancellation token and progress sink
     * @return Result payload on success, ExecutionError otherwise
     */
    [[nodiscard]] virtual ExecutionResult run(const RoutineContext &context) = 0;

    /**
     * Routine name.
     *
     * @return Name recorded in the result payload
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_IJOB_ROUTINE_HPP
