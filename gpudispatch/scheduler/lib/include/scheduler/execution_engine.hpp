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
 * @file execution_engine.hpp
 * @brief Routine lookup and guarded execution of one job
 */

#ifndef GPUDISPATCH_SCHEDULER_EXECUTION_ENGINE_HPP
#define GPUDISPATCH_SCHEDULER_EXECUTION_ENGINE_HPP

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <parallel_hashmap/phmap.h>

#include "scheduler/ijob_routine.hpp"
#include "scheduler/job.hpp"
#include "scheduler/worker.hpp"
#include "task/cancellation_token.hpp"

namespace gpudispatch::scheduler {

/**
 * Job type to routine mapping
 *
 * Filled at startup and read concurrently by job threads afterwards.
 */
class RoutineRegistry final {
public:
    /**
     * Register a routine for a job type
     *
     * @param[in] job_type Job type handled by the routine
     * @param[in] routine Routine instance, shared by every job of this type
     * @return SchedulerErrc::InvalidParameter for an empty type or null routine,
     *         SchedulerErrc::DuplicateId if the type is taken
     */
    [[nodiscard]] std::error_code
    register_routine(std::string job_type, std::shared_ptr<IJobRoutine> routine);

    /**
     * Find the routine for a job type
     *
     * @param[in] job_type Job type
     * @return Routine, or nullptr if the type is unknown
     */
    [[nodiscard]] std::shared_ptr<IJobRoutine> find(std::string_view job_type) const;

    [[nodiscard]] bool contains(std::string_view job_type) const;

    /**
     * Registered job types
     * @return Sorted job type names
     */
    [[nodiscard]] std::vector<std::string> job_types() const;

private:
    mutable std::mutex mutex_;
    phmap::flat_hash_map<std::string, std::shared_ptr<IJobRoutine>> routines_;
};

/**
 * Execution engine
 *
 * Runs the routine matching a job's type on the calling thread and turns
 * every way a run can end into a value: a result payload, an
 * ExecutionError carrying the verbatim reason, or a cancellation. The
 * engine never writes job state.
 */
class ExecutionEngine final {
public:
    /**
     * Run one job
     *
     * @param[in] job Job to run
     * @param[in] worker Worker the job is assigned to
     * @param[in] token Cancellation signal for this job
     * @param[in] report_progress Sink receiving progress percentages
     * @return Result payload, or the error that ended the run
     */
    [[nodiscard]] ExecutionResult
    run(const Job &job,
        const Worker &worker,
        const task::CancellationToken &token,
        const ProgressSink &report_progress) const;

    /**
     * Check whether a job type has a routine
     * @param[in] job_type Job type
     * @return true if run() can execute jobs of this type
     */
    [[nodiscard]] bool supports(std::string_view job_type) const {
        return routines_.contains(job_type);
    }

    [[nodiscard]] RoutineRegistry &routines() noexcept { return routines_; }
    [[nodiscard]] const RoutineRegistry &routines() const noexcept { return routines_; }

private:
    RoutineRegistry routines_;
};

/**
 * Message recorded for a job whose type has no routine
 *
 * @param[in] job_type Job type
 * @return Error message
 */
[[nodiscard]] std::string unsupported_job_type_message(std::string_view job_type);

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_EXECUTION_ENGINE_HPP
