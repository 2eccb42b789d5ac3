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
 * @file job.hpp
 * @brief Job record, lifecycle states and the partial writes applied to it
 */

#ifndef GPUDISPATCH_SCHEDULER_JOB_HPP
#define GPUDISPATCH_SCHEDULER_JOB_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <wise_enum.h>

#include "log/dispatch_log_macros.hpp"
#include "task/time.hpp"

namespace gpudispatch::scheduler {

/// Wall-clock time stored in durable records
using TimePoint = task::Time::TimePoint;

/// Job lifecycle status
enum class JobStatus {
    Pending,   //!< Persisted, waiting for a worker
    Running,   //!< Assigned to a worker and executing
    Completed, //!< Finished all steps, progress is 100
    Failed,    //!< Execution raised an error
    Cancelled  //!< Stopped on request before completing
};

} // namespace gpudispatch::scheduler

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(gpudispatch::scheduler::JobStatus, Pending, Running, Completed, Failed, Cancelled)

namespace gpudispatch::scheduler {

/// Type specific job configuration
using JobConfig = std::map<std::string, std::string>;

/// Result payload written on Completed and Cancelled
using JobResult = std::map<std::string, std::string>;

inline constexpr int MIN_PRIORITY = 1;     //!< Lowest job priority
inline constexpr int MAX_PRIORITY = 5;     //!< Highest job priority
inline constexpr int DEFAULT_PRIORITY = 1; //!< Priority when none is given
inline constexpr double MIN_PROGRESS = 0.0;
inline constexpr double MAX_PROGRESS = 100.0;

/**
 * Check if a status is terminal
 *
 * @param[in] status Status to check
 * @return true for Completed, Failed and Cancelled
 */
[[nodiscard]] constexpr bool is_terminal(const JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

/**
 * Check if a status may be reset to Pending by a retry
 *
 * @param[in] status Status to check
 * @return true for Failed and Cancelled
 */
[[nodiscard]] constexpr bool is_retryable(const JobStatus status) noexcept {
    return status == JobStatus::Failed || status == JobStatus::Cancelled;
}

/**
 * Check if a job in this status carries an assigned worker
 *
 * @param[in] status Status to check
 * @return true for Running, Completed and Failed
 */
[[nodiscard]] constexpr bool holds_worker(const JobStatus status) noexcept {
    return status == JobStatus::Running || status == JobStatus::Completed ||
           status == JobStatus::Failed;
}

/**
 * Check a forward edge of the lifecycle state machine
 *
 * Retry (Failed|Cancelled to Pending) is not a forward edge and is handled
 * separately by the reconciler.
 *
 * @param[in] from Current status
 * @param[in] to Requested status
 * @return true if the edge exists
 */
[[nodiscard]] constexpr bool is_valid_transition(const JobStatus from, const JobStatus to) noexcept {
    switch (from) {
    case JobStatus::Pending:
        return to == JobStatus::Running || to == JobStatus::Cancelled;
    case JobStatus::Running:
        return to == JobStatus::Completed || to == JobStatus::Failed ||
               to == JobStatus::Cancelled;
    default:
        return false;
    }
}

/**
 * Status name
 *
 * @param[in] status Status to name
 * @return Enumerator name
 */
[[nodiscard]] inline std::string_view to_string(const JobStatus status) {
    return ::wise_enum::to_string(status);
}

/**
 * Durable job record
 *
 * Lifecycle fields are written only through the StateReconciler. While the
 * job is not terminal both result and error_message are empty; on a
 * terminal state exactly one of them is set.
 */
struct Job final {
    std::string id;                                //!< Unique job id
    std::string user_id;                           //!< Owning user
    std::string title;                             //!< Short display title
    std::string description;                       //!< Free form description
    std::string job_type;                          //!< Selects the execution routine
    int priority{DEFAULT_PRIORITY};                //!< MIN_PRIORITY..MAX_PRIORITY
    std::optional<int> estimated_duration_minutes; //!< Owner supplied estimate
    JobConfig config;                              //!< Routine specific settings
    JobStatus status{JobStatus::Pending};          //!< Lifecycle status
    double progress{MIN_PROGRESS};                 //!< Percentage in [0, 100]
    std::optional<std::string> assigned_worker;    //!< Set iff holds_worker(status)
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> updated_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::optional<JobResult> result;          //!< Completed or Cancelled payload
    std::optional<std::string> error_message; //!< Failed reason, verbatim
    double cost{0.0};                         //!< Accumulated charge, informational
};

/**
 * Partial write applied atomically to a job record
 *
 * Unset members leave the stored value untouched.
 */
struct JobFields final {
    std::optional<JobStatus> status;
    std::optional<double> progress;
    std::optional<std::string> assigned_worker;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::optional<JobResult> result;
    std::optional<std::string> error_message;
};

/**
 * Owner editable job metadata
 */
struct JobDetailsUpdate final {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<int> priority;
    std::optional<JobConfig> config;
};

} // namespace gpudispatch::scheduler

GPUD_LOGGABLE_DEFERRED_FORMAT(
        gpudispatch::scheduler::Job,
        "Job(id={}, user={}, type={}, status={}, progress={:.1f})",
        obj.id,
        obj.user_id,
        obj.job_type,
        ::wise_enum::to_string(obj.status),
        obj.progress)

#endif // GPUDISPATCH_SCHEDULER_JOB_HPP
