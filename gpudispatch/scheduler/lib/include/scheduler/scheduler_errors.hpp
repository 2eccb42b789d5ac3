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
 * @file scheduler_errors.hpp
 * @brief Error codes for job scheduling, execution and reconciliation
 *
 * Only ExecutionError ever reaches a job owner, through the job's error
 * field. The remaining codes are returned to the calling component, which
 * either retries later, treats the call as a no-op, or reports the refusal
 * at the submission boundary.
 */

#ifndef GPUDISPATCH_SCHEDULER_SCHEDULER_ERRORS_HPP
#define GPUDISPATCH_SCHEDULER_SCHEDULER_ERRORS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <wise_enum.h>

namespace gpudispatch::scheduler {

/**
 * Scheduler error codes compatible with std::error_code
 */
// clang-format off
enum class SchedulerErrc : std::uint8_t {
    Success,                //!< Operation succeeded
    AllocationUnavailable,  //!< No active worker is both under capacity and reachable
    ExecutionError,         //!< Job routine failed or job type is unknown
    CancellationRequested,  //!< Job routine stopped at a cancellation checkpoint
    ReconciliationConflict, //!< Write would move a job out of a terminal state
    InvalidTransition,      //!< Write is not an edge of the job state machine
    JobNotFound,            //!< No job with this id (and owner)
    WorkerNotFound,         //!< No worker with this id
    DuplicateId,            //!< A record with this id already exists
    JobNotPending,          //!< Job must be Pending for this operation
    JobRunning,             //!< Operation is not allowed while the job runs
    JobNotRetryable,        //!< Only Failed or Cancelled jobs can be retried
    UserLimitExceeded,      //!< Owner already has the maximum number of running jobs
    InvalidParameter,       //!< Invalid parameter provided
    UnknownJobType,         //!< No routine registered for the job type
    ShuttingDown            //!< Supervisor no longer accepts work
};
// clang-format on

} // namespace gpudispatch::scheduler

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        gpudispatch::scheduler::SchedulerErrc,
        Success,
        AllocationUnavailable,
        ExecutionError,
        CancellationRequested,
        ReconciliationConflict,
        InvalidTransition,
        JobNotFound,
        WorkerNotFound,
        DuplicateId,
        JobNotPending,
        JobRunning,
        JobNotRetryable,
        UserLimitExceeded,
        InvalidParameter,
        UnknownJobType,
        ShuttingDown)

// Register SchedulerErrc as an error code enum to enable implicit conversion to
// std::error_code
namespace std {
template <> struct is_error_code_enum<gpudispatch::scheduler::SchedulerErrc> : true_type {};
} // namespace std

namespace gpudispatch::scheduler {

/**
 * Custom error category for scheduler errors
 */
class SchedulerErrorCategory final : public std::error_category {
private:
    // Compile-time table indexed by the enum's underlying value
    static constexpr std::array<std::string_view, 16> KMESSAGES{
            "Success: Operation completed successfully",
            "Allocation unavailable: No active worker has a free slot and answers probes",
            "Execution error: Job routine failed",
            "Cancellation requested: Job stopped at a cancellation checkpoint",
            "Reconciliation conflict: Job is in a terminal state and cannot be changed",
            "Invalid transition: Requested status change is not allowed",
            "Job not found: No job with the given id",
            "Worker not found: No worker with the given id",
            "Duplicate id: A record with the given id already exists",
            "Job not pending: Operation requires a pending job",
            "Job running: Operation is not allowed while the job is running",
            "Job not retryable: Only failed or cancelled jobs can be retried",
            "User limit exceeded: Too many running jobs for this user",
            "Invalid parameter: Parameter value is invalid or out of range",
            "Unknown job type: No routine is registered for the job type",
            "Shutting down: Supervisor no longer accepts work"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<SchedulerErrc>,
            "KMESSAGES array size must match the number of SchedulerErrc enum values");

public:
    /**
     * Get the name of this error category
     *
     * @return The category name as a C-style string
     */
    [[nodiscard]] const char *name() const noexcept override { return "gpudispatch::scheduler"; }

    /**
     * Get a descriptive message for the given error code
     *
     * @param[in] condition The error code value
     * @return A descriptive error message
     */
    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown scheduler error: {}", condition);
    }

    /**
     * Map scheduler errors to standard error conditions where applicable
     *
     * @param[in] condition The error code value
     * @return The equivalent standard error condition, or a condition of this category
     */
    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<SchedulerErrc>(condition)) {
        case SchedulerErrc::Success:
            return {};
        case SchedulerErrc::InvalidParameter:
            return std::errc::invalid_argument;
        case SchedulerErrc::JobNotFound:
        case SchedulerErrc::WorkerNotFound:
            return std::errc::no_such_file_or_directory;
        case SchedulerErrc::DuplicateId:
            return std::errc::file_exists;
        case SchedulerErrc::AllocationUnavailable:
        case SchedulerErrc::UserLimitExceeded:
            return std::errc::resource_unavailable_try_again;
        case SchedulerErrc::CancellationRequested:
            return std::errc::operation_canceled;
        case SchedulerErrc::JobRunning:
            return std::errc::device_or_resource_busy;
        case SchedulerErrc::ReconciliationConflict:
        case SchedulerErrc::InvalidTransition:
        case SchedulerErrc::JobNotRetryable:
            return std::errc::operation_not_permitted;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Get the singleton instance of the scheduler error category
 *
 * @return Reference to the scheduler error category
 */
[[nodiscard]] inline const SchedulerErrorCategory &scheduler_category() noexcept {
    static const SchedulerErrorCategory instance{};
    return instance;
}

/**
 * Create an error_code from a SchedulerErrc value
 *
 * @param[in] errc The scheduler error code
 * @return A std::error_code representing the scheduler error
 */
[[nodiscard]] inline std::error_code make_error_code(const SchedulerErrc errc) noexcept {
    return {static_cast<int>(errc), scheduler_category()};
}

/**
 * Get the name of a SchedulerErrc enum value
 *
 * @param[in] errc The error code
 * @return The enum name as a string
 */
[[nodiscard]] inline const char *get_error_name(const SchedulerErrc errc) noexcept {
    return ::wise_enum::to_string(errc).data();
}

/**
 * Get the name of a SchedulerErrc from a std::error_code
 *
 * @param[in] ec The error code
 * @return The enum name, or "unknown" if the code belongs to another category
 */
[[nodiscard]] inline const char *get_error_name(const std::error_code &ec) noexcept {
    if (ec.category() != scheduler_category()) {
        return "unknown";
    }
    return get_error_name(static_cast<SchedulerErrc>(ec.value()));
}

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_SCHEDULER_ERRORS_HPP
