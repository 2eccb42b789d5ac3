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

#ifndef GPUDISPATCH_SCHEDULER_IDURABLE_STORE_HPP
#define GPUDISPATCH_SCHEDULER_IDURABLE_STORE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "scheduler/job.hpp"
#include "scheduler/worker.hpp"

namespace gpudispatch::scheduler {

/**
 * Read-modify-write callback for a job record
 *
 * Runs while the store holds the record exclusively. Returning an error
 * leaves the stored record unchanged.
 */
using JobMutator = std::function<std::error_code(Job &)>;

/// Read-modify-write callback for a worker record
using WorkerMutator = std::function<std::error_code(Worker &)>;

/// Precondition checked before a job record is erased
using JobGuard = std::function<std::error_code(const Job &)>;

/**
 * Selection for job listings. Unset members match every job.
 */
struct JobFilter final {
    std::optional<std::string> user_id;
    std::optional<JobStatus> status;
};

/**
 * @class IDurableStore
 * @brief Keyed record store holding jobs and workers.
 *
 * Every method is safe to call concurrently. Each job update is atomic with
 * respect to other updates of the same job. Listings are snapshots.
 */
class IDurableStore {
public:
    IDurableStore() = default;
    virtual ~IDurableStore() = default;
    IDurableStore(IDurableStore &&) = default;
    IDurableStore &operator=(IDurableStore &&) = default;
    IDurableStore(const IDurableStore &) = delete;
    IDurableStore &operator=(const IDurableStore &) = delete;

    /**
     * Persist a new job.
     *
     * @param[in] job Job to insert
     * @return SchedulerErrc::DuplicateId if the id exists, success otherwise
     */
    [[nodiscard]] virtual std::error_code insert_job(const Job &job) = 0;

    [[nodiscard]] virtual std::optional<Job> find_job(std::string_view job_id) const = 0;

    /**
     * Look up a job owned by a specific user.
     *
     * @param[in] job_id Job id
     * @param[in] user_id Owner id
     * @return The job if it exists and belongs to user_id
     */
    [[nodiscard]] virtual std::optional<Job>
    find_job_for_user(std::string_view job_id, std::string_view user_id) const = 0;

    /**
     * List jobs ordered by creation.
     *
     * @param[in] filter Selection criteria
     * @return Matching jobs
     */
    [[nodiscard]] virtual std::vector<Job> list_jobs(const JobFilter &filter) const = 0;

    /**
     * Atomically update one job.
     *
     * @param[in] job_id Job id
     * @param[in] mutator Applied to a copy, the copy replaces the record on success
     * @return SchedulerErrc::JobNotFound, the mutator's error, or success
     */
    [[nodiscard]] virtual std::error_code
    update_job(std::string_view job_id, const JobMutator &mutator) = 0;

    /**
     * Erase a job if the guard allows it.
     *
     * @param[in] job_id Job id
     * @param[in] guard Checked against the current record under the store lock
     * @return SchedulerErrc::JobNotFound, the guard's error, or success
     */
    [[nodiscard]] virtual std::error_code
    erase_job(std::string_view job_id, const JobGuard &guard) = 0;

    /**
     * Number of Running jobs assigned to a worker.
     *
     * @param[in] worker_id Worker id
     * @return Running job count, computed from current records
     */
    [[nodiscard]] virtual std::size_t count_running_on_worker(std::string_view worker_id) const = 0;

    [[nodiscard]] virtual std::size_t count_running_for_user(std::string_view user_id) const = 0;

    /**
     * Create or replace a worker record.
     *
     * A new worker receives the next registration sequence number. Replacing
     * keeps the original sequence number and creation time.
     *
     * @param[in] worker Worker record
     * @return SchedulerErrc::InvalidParameter for an empty id or zero slots
     */
    [[nodiscard]] virtual std::error_code upsert_worker(const Worker &worker) = 0;

    [[nodiscard]] virtual std::optional<Worker> find_worker(std::string_view worker_id) const = 0;

    /**
     * All workers in registration order.
     *
     * @return Worker snapshot
     */
    [[nodiscard]] virtual std::vector<Worker> list_workers() const = 0;

    /**
     * Workers with the active flag set, in registration order.
     *
     * @return Worker snapshot
     */
    [[nodiscard]] virtual std::vector<Worker> list_active_workers() const = 0;

    /**
     * Write the availability fields of a worker.
     *
     * @param[in] worker_id Worker id
     * @param[in] status New status
     * @param[in] last_probed Probe time, left unchanged when unset
     * @return SchedulerErrc::WorkerNotFound or success
     */
    [[nodiscard]] virtual std::error_code update_worker_status(
            std::string_view worker_id,
            WorkerStatus status,
            std::optional<TimePoint> last_probed) = 0;

    /**
     * Atomically update one worker.
     *
     * Used where the new availability depends on the stored status, so a
     * concurrent maintenance window is not overwritten.
     *
     * @param[in] worker_id Worker id
     * @param[in] mutator Applied to a copy, the copy replaces the record on success
     * @return SchedulerErrc::WorkerNotFound, the mutator's error, or success
     */
    [[nodiscard]] virtual std::error_code
    update_worker(std::string_view worker_id, const WorkerMutator &mutator) = 0;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_IDURABLE_STORE_HPP
