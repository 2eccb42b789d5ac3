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

#include <algorithm>    // for clamp, max
#include <cmath>        // for isnan
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move

#include <wise_enum.h> // for to_string

#include "log/dispatch_log_macros.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"
#include "scheduler/state_reconciler.hpp"
#include "task/time.hpp"

namespace gpudispatch::scheduler {

namespace {

constexpr std::string_view DEFAULT_FAILURE_MESSAGE = "Execution failed";

/**
 * Check that a write only carries fields valid for its target status
 *
 * @param[in] from Current status
 * @param[in] to Target status
 * @param[in] fields Requested write
 * @return true if every set field applies to the edge
 */
bool fields_match_edge(const JobStatus from, const JobStatus to, const JobFields &fields) {
    if (fields.progress.has_value() && from != JobStatus::Running && to != JobStatus::Running) {
        return false;
    }
    if (from == to) {
        // Same-status writes may only move progress
        return !fields.assigned_worker.has_value() && !fields.started_at.has_value() &&
               !fields.completed_at.has_value() && !fields.result.has_value() &&
               !fields.error_message.has_value();
    }
    if (fields.assigned_worker.has_value() && to != JobStatus::Running) {
        return false;
    }
    if (fields.result.has_value() && to != JobStatus::Completed && to != JobStatus::Cancelled) {
        return false;
    }
    if (fields.error_message.has_value() && to != JobStatus::Failed) {
        return false;
    }
    return true;
}

/**
 * Apply a write to a non-terminal job
 *
 * @param[in,out] job Record copy owned by the store update
 * @param[in] fields Requested write
 * @param[in] now Time of the write
 * @return Error leaving the record untouched, or success
 */
std::error_code apply_fields(Job &job, const JobFields &fields, const TimePoint now) {
    const JobStatus from = job.status;
    const JobStatus to = fields.status.value_or(from);

    if (to != from && !is_valid_transition(from, to)) {
        return SchedulerErrc::InvalidTransition;
    }
    if (!fields_match_edge(from, to, fields)) {
        return SchedulerErrc::InvalidTransition;
    }
    if (fields.progress.has_value() && std::isnan(*fields.progress)) {
        return SchedulerErrc::InvalidParameter;
    }

    if (fields.progress.has_value()) {
        const double clamped = std::clamp(*fields.progress, MIN_PROGRESS, MAX_PROGRESS);
        job.progress = std::max(job.progress, clamped);
    }

    if (to != from) {
        switch (to) {
        case JobStatus::Running: {
            auto worker = fields.assigned_worker.has_value() ? fields.assigned_worker
                                                             : job.assigned_worker;
            if (!worker.has_value() || worker->empty()) {
                return SchedulerErrc::InvalidParameter;
            }
            job.assigned_worker = std::move(worker);
            job.started_at = fields.started_at.value_or(now);
            break;
        }
        case JobStatus::Completed:
            job.progress = MAX_PROGRESS;
            job.result = fields.result.value_or(JobResult{});
            job.error_message.reset();
            job.completed_at = fields.completed_at.value_or(now);
            break;
        case JobStatus::Failed:
            job.error_message = fields.error_message.has_value() && !fields.error_message->empty()
                                        ? *fields.error_message
                                        : std::string{DEFAULT_FAILURE_MESSAGE};
            job.result.reset();
            job.completed_at = fields.completed_at.value_or(now);
            break;
        case JobStatus::Cancelled:
            job.result = fields.result.value_or(JobResult{});
            job.error_message.reset();
            job.assigned_worker.reset();
            job.completed_at = fields.completed_at.value_or(now);
            break;
        case JobStatus::Pending:
            return SchedulerErrc::InvalidTransition;
        }
        job.status = to;
    }

    job.updated_at = now;
    return SchedulerErrc::Success;
}

} // namespace

std::error_code StateReconciler::write_transition(std::string_view job_id, const JobFields &fields) {
    JobStatus observed{JobStatus::Pending};
    const auto ec = store_.update_job(job_id, [&fields, &observed](Job &job) -> std::error_code {
        observed = job.status;
        if (is_terminal(job.status)) {
            return SchedulerErrc::ReconciliationConflict;
        }
        return apply_fields(job, fields, task::Time::now());
    });

    const auto requested = fields.status.value_or(observed);
    if (ec == SchedulerErrc::ReconciliationConflict) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Reconciler,
                SchedulerErrorEvent::ReconciliationConflict,
                "Job '{}' is already {}, ignoring write to {}",
                job_id,
                ::wise_enum::to_string(observed),
                ::wise_enum::to_string(requested));
    } else if (ec == SchedulerErrc::InvalidTransition || ec == SchedulerErrc::InvalidParameter) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Reconciler,
                SchedulerErrorEvent::InvalidParam,
                "Job '{}' rejected write {} -> {}: {}",
                job_id,
                ::wise_enum::to_string(observed),
                ::wise_enum::to_string(requested),
                get_error_name(ec));
    } else if (!ec && requested != observed) {
        GPUD_LOGC_DEBUG(
                SchedulerComponent::Reconciler,
                "Job '{}' {} -> {}",
                job_id,
                ::wise_enum::to_string(observed),
                ::wise_enum::to_string(requested));
    }
    return ec;
}

std::error_code StateReconciler::mark_running(std::string_view job_id, std::string worker_id) {
    JobFields fields{};
    fields.status = JobStatus::Running;
    fields.assigned_worker = std::move(worker_id);
    return write_transition(job_id, fields);
}

std::error_code StateReconciler::report_progress(std::string_view job_id, const double progress) {
    JobFields fields{};
    fields.progress = progress;
    return write_transition(job_id, fields);
}

std::error_code StateReconciler::mark_completed(std::string_view job_id, JobResult result) {
    JobFields fields{};
    fields.status = JobStatus::Completed;
    fields.result = std::move(result);
    return write_transition(job_id, fields);
}

std::error_code StateReconciler::mark_failed(std::string_view job_id, std::string error_message) {
    JobFields fields{};
    fields.status = JobStatus::Failed;
    fields.error_message = std::move(error_message);
    return write_transition(job_id, fields);
}

std::error_code StateReconciler::mark_cancelled(std::string_view job_id, JobResult result) {
    JobFields fields{};
    fields.status = JobStatus::Cancelled;
    fields.result = std::move(result);
    return write_transition(job_id, fields);
}

std::error_code StateReconciler::cancel_pending(std::string_view job_id) {
    return store_.update_job(job_id, [](Job &job) -> std::error_code {
        if (job.status != JobStatus::Pending) {
            return SchedulerErrc::JobNotPending;
        }
        const auto now = task::Time::now();
        job.status = JobStatus::Cancelled;
        job.result = JobResult{{"reason", "cancelled before start"}};
        job.error_message.reset();
        job.assigned_worker.reset();
        job.completed_at = now;
        job.updated_at = now;
        return SchedulerErrc::Success;
    });
}

std::error_code StateReconciler::reject(std::string_view job_id, std::string error_message) {
    const auto ec = store_.update_job(job_id, [&error_message](Job &job) -> std::error_code {
        if (job.status != JobStatus::Pending) {
            return SchedulerErrc::JobNotPending;
        }
        const auto now = task::Time::now();
        job.status = JobStatus::Failed;
        job.error_message = error_message.empty() ? std::string{DEFAULT_FAILURE_MESSAGE}
                                                  : error_message;
        job.result.reset();
        job.assigned_worker.reset();
        job.completed_at = now;
        job.updated_at = now;
        return SchedulerErrc::Success;
    });
    if (!ec) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Reconciler,
                SchedulerErrorEvent::ExecutionError,
                "Job '{}' rejected: {}",
                job_id,
                error_message);
    }
    return ec;
}

std::error_code StateReconciler::reset_for_retry(std::string_view job_id) {
    return store_.update_job(job_id, [](Job &job) -> std::error_code {
        if (!is_retryable(job.status)) {
            return SchedulerErrc::JobNotRetryable;
        }
        job.status = JobStatus::Pending;
        job.progress = MIN_PROGRESS;
        job.assigned_worker.reset();
        job.started_at.reset();
        job.completed_at.reset();
        job.result.reset();
        job.error_message.reset();
        job.updated_at = task::Time::now();
        return SchedulerErrc::Success;
    });
}

std::error_code
StateReconciler::update_details(std::string_view job_id, const JobDetailsUpdate &details) {
    if (details.priority.has_value() &&
        (*details.priority < MIN_PRIORITY || *details.priority > MAX_PRIORITY)) {
        return SchedulerErrc::InvalidParameter;
    }
    return store_.update_job(job_id, [&details](Job &job) -> std::error_code {
        if (job.status == JobStatus::Running || job.status == JobStatus::Completed) {
            return SchedulerErrc::JobRunning;
        }
        if (details.title.has_value()) {
            job.title = *details.title;
        }
        if (details.description.has_value()) {
            job.description = *details.description;
        }
        if (details.priority.has_value()) {
            job.priority = *details.priority;
        }
        if (details.config.has_value()) {
            job.config = *details.config;
        }
        job.updated_at = task::Time::now();
        return SchedulerErrc::Success;
    });
}

std::error_code StateReconciler::remove(std::string_view job_id) {
    return store_.erase_job(job_id, [](const Job &job) -> std::error_code {
        if (job.status == JobStatus::Running) {
            return SchedulerErrc::JobRunning;
        }
        return SchedulerErrc::Success;
    });
}

} // namespace gpudispatch::scheduler
