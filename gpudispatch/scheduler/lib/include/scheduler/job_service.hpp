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
 * @file job_service.hpp
 * @brief Submission boundary: validation, ownership and per-user limits
 */

#ifndef GPUDISPATCH_SCHEDULER_JOB_SERVICE_HPP
#define GPUDISPATCH_SCHEDULER_JOB_SERVICE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tl/expected.hpp>

#include "scheduler/idurable_store.hpp"
#include "scheduler/job.hpp"
#include "scheduler/state_reconciler.hpp"
#include "scheduler/task_supervisor.hpp"

namespace gpudispatch::scheduler {

/**
 * Limits enforced at submission time
 */
struct ServiceLimits final {
    static constexpr std::size_t DEFAULT_MAX_RUNNING_PER_USER = 5;
    static constexpr std::size_t DEFAULT_MAX_TITLE_LENGTH = 200;
    static constexpr std::size_t DEFAULT_MAX_JOB_TYPE_LENGTH = 50;

    std::size_t max_running_per_user{DEFAULT_MAX_RUNNING_PER_USER}; //!< Running jobs per owner
    std::size_t max_title_length{DEFAULT_MAX_TITLE_LENGTH};         //!< Title length in bytes
    std::size_t max_job_type_length{DEFAULT_MAX_JOB_TYPE_LENGTH};   //!< Job type length in bytes

    /**
     * Check the limits
     * @return SchedulerErrc::InvalidParameter if any limit is zero
     */
    [[nodiscard]] std::error_code validate() const noexcept;
};

/**
 * New job as requested by its owner
 */
struct JobRequest final {
    std::string title;
    std::string description;
    std::string job_type;
    int priority{DEFAULT_PRIORITY};
    std::optional<int> estimated_duration_minutes;
    JobConfig config;
};

/// Outcome of recover()
struct RecoveryReport final {
    std::size_t resubmitted{0}; //!< Pending jobs handed to the supervisor
    std::size_t interrupted{0}; //!< Running jobs without execution, now Failed
};

/**
 * Job service
 *
 * Entry point used by an outer API layer. Every operation is scoped to the
 * owning user: a job that exists but belongs to someone else is reported
 * as SchedulerErrc::JobNotFound.
 */
class JobService final {
public:
    /**
     * Create a job service
     *
     * @param[in] store Job records
     * @param[in] reconciler Lifecycle writer
     * @param[in] supervisor Job execution owner
     * @param[in] limits Submission limits
     * @throws std::invalid_argument if the limits are invalid
     */
    JobService(
            IDurableStore &store,
            StateReconciler &reconciler,
            TaskSupervisor &supervisor,
            ServiceLimits limits = {});

    /**
     * Validate, persist as Pending and submit a new job
     *
     * @param[in] user_id Owner
     * @param[in] request Job description
     * @return The stored job, SchedulerErrc::InvalidParameter for a bad
     *         request or SchedulerErrc::UserLimitExceeded if the owner is at
     *         the running job limit
     */
    [[nodiscard]] tl::expected<Job, std::error_code>
    create_job(std::string_view user_id, const JobRequest &request);

    [[nodiscard]] tl::expected<Job, std::error_code>
    get_job(std::string_view job_id, std::string_view user_id) const;

    /**
     * Jobs of one owner in creation order
     *
     * @param[in] user_id Owner
     * @param[in] status Optional status filter
     * @return Matching jobs
     */
    [[nodiscard]] std::vector<Job>
    list_jobs(std::string_view user_id, std::optional<JobStatus> status = std::nullopt) const;

    /**
     * Cancel a Pending or Running job
     *
     * A Running job stops asynchronously, poll get_job() to observe it.
     *
     * @param[in] job_id Job id
     * @param[in] user_id Owner
     * @return SchedulerErrc::InvalidTransition for a terminal job
     */
    [[nodiscard]] std::error_code cancel_job(std::string_view job_id, std::string_view user_id);

    /**
     * Reset a Failed or Cancelled job to Pending and submit it again
     *
     * @param[in] job_id Job id
     * @param[in] user_id Owner
     * @return The reset job, or SchedulerErrc::JobNotRetryable
     */
    [[nodiscard]] tl::expected<Job, std::error_code>
    retry_job(std::string_view job_id, std::string_view user_id);

    /**
     * Edit title, description, priority or config
     *
     * @param[in] job_id Job id
     * @param[in] user_id Owner
     * @param[in] details New values
     * @return The updated job, or SchedulerErrc::JobRunning while Running or Completed
     */
    [[nodiscard]] tl::expected<Job, std::error_code> update_job(
            std::string_view job_id, std::string_view user_id, const JobDetailsUpdate &details);

    /**
     * Delete a job that is not running
     *
     * @param[in] job_id Job id
     * @param[in] user_id Owner
     * @return SchedulerErrc::JobRunning for a Running job
     */
    [[nodiscard]] std::error_code delete_job(std::string_view job_id, std::string_view user_id);

    /**
     * Bring durable state in line with this process after a restart
     *
     * Pending jobs are submitted again. Running jobs that have no active
     * execution here are failed as interrupted.
     *
     * @return Counts of handled jobs
     */
    RecoveryReport recover();

    /**
     * Stop every running job
     * @param[in] behavior Whether running jobs are cancelled or awaited
     */
    void stop_all(ShutdownBehavior behavior = ShutdownBehavior::CancelActiveJobs);

    [[nodiscard]] const ServiceLimits &limits() const noexcept { return limits_; }

private:
    [[nodiscard]] std::error_code validate_request(const JobRequest &request) const;

    IDurableStore &store_;
    StateReconciler &reconciler_;
    TaskSupervisor &supervisor_;
    ServiceLimits limits_;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_JOB_SERVICE_HPP
