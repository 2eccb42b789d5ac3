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
 * @file state_reconciler.hpp
 * @brief Single writer of job lifecycle fields
 */

#ifndef GPUDISPATCH_SCHEDULER_STATE_RECONCILER_HPP
#define GPUDISPATCH_SCHEDULER_STATE_RECONCILER_HPP

#include <string>
#include <string_view>
#include <system_error>

#include "scheduler/idurable_store.hpp"
#include "scheduler/job.hpp"

namespace gpudispatch::scheduler {

/**
 * State reconciler
 *
 * Every lifecycle write goes through write_transition(), which applies a
 * partial update as one atomic store operation and enforces the job state
 * machine:
 *
 * - Pending may become Running or Cancelled
 * - Running may become Completed, Failed or Cancelled
 * - A terminal job never changes again. Such a write is logged as a
 *   reconciliation conflict and returns SchedulerErrc::ReconciliationConflict
 *   without touching the record. Callers treat it as a no-op.
 *
 * Progress writes are accepted only while the job is Running. They are
 * clamped to [0, 100] and never lower the stored value. Entering
 * Completed forces progress to 100, entering Cancelled releases the
 * worker, and entering Failed clears the result payload.
 *
 * Retry is the only way back to Pending and is exposed separately by
 * reset_for_retry().
 */
class StateReconciler final {
public:
    /**
     * Create a reconciler
     * @param[in] store Durable store, must outlive the reconciler
     */
    explicit StateReconciler(IDurableStore &store) noexcept : store_(store) {}

    /**
     * Apply a partial lifecycle update atomically
     *
     * @param[in] job_id Job to update
     * @param[in] fields Fields to write, unset members are left untouched
     * @return SchedulerErrc::ReconciliationConflict if the job is terminal,
     *         SchedulerErrc::InvalidTransition for a write outside the state machine,
     *         SchedulerErrc::JobNotFound, or success
     */
    [[nodiscard]] std::error_code write_transition(std::string_view job_id, const JobFields &fields);

    /**
     * Pending to Running on a worker
     *
     * @param[in] job_id Job id
     * @param[in] worker_id Worker taking the job
     * @return Same as write_transition()
     */
    [[nodiscard]] std::error_code mark_running(std::string_view job_id, std::string worker_id);

    /// Progress update of a Running job
    [[nodiscard]] std::error_code report_progress(std::string_view job_id, double progress);

    /// Running to Completed with a result payload
    [[nodiscard]] std::error_code mark_completed(std::string_view job_id, JobResult result);

    /// Running to Failed with the error recorded verbatim
    [[nodiscard]] std::error_code mark_failed(std::string_view job_id, std::string error_message);

    /// Pending or Running to Cancelled with a result payload
    [[nodiscard]] std::error_code mark_cancelled(std::string_view job_id, JobResult result);

    /**
     * Cancel a job that has not started
     *
     * @param[in] job_id Job id
     * @return SchedulerErrc::JobNotPending if the job left Pending meanwhile
     */
    [[nodiscard]] std::error_code cancel_pending(std::string_view job_id);

    /**
     * Fail a Pending job that can never run
     *
     * Used when no routine exists for the job type. The job becomes Failed
     * without ever holding a worker.
     *
     * @param[in] job_id Job id
     * @param[in] error_message Reason, recorded verbatim
     * @return SchedulerErrc::JobNotPending if the job left Pending meanwhile
     */
    [[nodiscard]] std::error_code reject(std::string_view job_id, std::string error_message);

    /**
     * Reset a Failed or Cancelled job to Pending
     *
     * Clears progress, worker, timestamps except creation, result and error.
     *
     * @param[in] job_id Job id
     * @return SchedulerErrc::JobNotRetryable for any other status
     */
    [[nodiscard]] std::error_code reset_for_retry(std::string_view job_id);

    /**
     * Edit owner metadata of a job
     *
     * @param[in] job_id Job id
     * @param[in] details New values
     * @return SchedulerErrc::JobRunning if the job is Running or Completed
     */
    [[nodiscard]] std::error_code
    update_details(std::string_view job_id, const JobDetailsUpdate &details);

    /**
     * Delete a job record
     *
     * @param[in] job_id Job id
     * @return SchedulerErrc::JobRunning if the job is Running
     */
    [[nodiscard]] std::error_code remove(std::string_view job_id);

private:
    IDurableStore &store_;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_STATE_RECONCILER_HPP
