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

#include <cstdint>      // for uint64_t
#include <format>       // for format
#include <mutex>        // for mutex, lock_guard
#include <optional>     // for optional
#include <random>       // for random_device, mt19937_64
#include <stdexcept>    // for invalid_argument
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <vector>       // for vector

#include <tl/expected.hpp> // for expected, unexpected

#include "log/dispatch_log_macros.hpp"
#include "scheduler/job_service.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"
#include "task/time.hpp"

namespace gpudispatch::scheduler {

namespace {

constexpr std::string_view INTERRUPTED_MESSAGE = "Interrupted: execution did not survive restart";

/**
 * Random version 4 UUID
 *
 * @return Lower case 8-4-4-4-12 hex text
 */
std::string generate_job_id() {
    static std::mutex generator_mutex;
    static std::mt19937_64 generator{std::random_device{}()};

    std::uint64_t high{};
    std::uint64_t low{};
    {
        const std::lock_guard<std::mutex> lock(generator_mutex);
        high = generator();
        low = generator();
    }
    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format(
            "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
            high >> 32U,
            (high >> 16U) & 0xFFFFU,
            high & 0xFFFFU,
            low >> 48U,
            low & 0xFFFFFFFFFFFFULL);
}

tl::expected<Job, std::error_code> reload(const IDurableStore &store, std::string_view job_id) {
    auto job = store.find_job(job_id);
    if (!job.has_value()) {
        return tl::unexpected(make_error_code(SchedulerErrc::JobNotFound));
    }
    return *job;
}

} // namespace

std::error_code ServiceLimits::validate() const noexcept {
    if (max_running_per_user == 0 || max_title_length == 0 || max_job_type_length == 0) {
        return SchedulerErrc::InvalidParameter;
    }
    return SchedulerErrc::Success;
}

JobService::JobService(
        IDurableStore &store,
        StateReconciler &reconciler,
        TaskSupervisor &supervisor,
        ServiceLimits limits)
        : store_(store), reconciler_(reconciler), supervisor_(supervisor), limits_(limits) {
    if (limits_.validate()) {
        throw std::invalid_argument("Service limits must all be positive");
    }
}

std::error_code JobService::validate_request(const JobRequest &request) const {
    if (request.title.empty() || request.title.size() > limits_.max_title_length) {
        return SchedulerErrc::InvalidParameter;
    }
    if (request.job_type.empty() || request.job_type.size() > limits_.max_job_type_length) {
        return SchedulerErrc::InvalidParameter;
    }
    if (request.priority < MIN_PRIORITY || request.priority > MAX_PRIORITY) {
        return SchedulerErrc::InvalidParameter;
    }
    if (request.estimated_duration_minutes.has_value() && *request.estimated_duration_minutes <= 0) {
        return SchedulerErrc::InvalidParameter;
    }
    return SchedulerErrc::Success;
}

tl::expected<Job, std::error_code>
JobService::create_job(std::string_view user_id, const JobRequest &request) {
    if (user_id.empty()) {
        return tl::unexpected(make_error_code(SchedulerErrc::InvalidParameter));
    }
    if (const auto ec = validate_request(request); ec) {
        GPUD_LOGEC_INFO(
                SchedulerComponent::Service,
                SchedulerErrorEvent::InvalidParam,
                "Rejected job '{}' of type '{}' for user '{}'",
                request.title,
                request.job_type,
                user_id);
        return tl::unexpected(ec);
    }

    const auto running = store_.count_running_for_user(user_id);
    if (running >= limits_.max_running_per_user) {
        GPUD_LOGEC_NOTICE(
                SchedulerComponent::Service,
                SchedulerErrorEvent::UserLimitExceeded,
                "User '{}' already runs {} jobs (limit {})",
                user_id,
                running,
                limits_.max_running_per_user);
        return tl::unexpected(make_error_code(SchedulerErrc::UserLimitExceeded));
    }

    Job job{};
    job.id = generate_job_id();
    job.user_id = std::string{user_id};
    job.title = request.title;
    job.description = request.description;
    job.job_type = request.job_type;
    job.priority = request.priority;
    job.estimated_duration_minutes = request.estimated_duration_minutes;
    job.config = request.config;
    job.status = JobStatus::Pending;
    job.progress = MIN_PROGRESS;
    const auto now = task::Time::now();
    job.created_at = now;
    job.updated_at = now;

    if (const auto ec = store_.insert_job(job); ec) {
        return tl::unexpected(ec);
    }
    GPUD_LOGC_INFO(SchedulerComponent::Service, "Created {}", job);

    if (const auto ec = supervisor_.submit(job.id); ec) {
        GPUD_LOGC_WARN(
                SchedulerComponent::Service,
                "Job '{}' stays Pending, submit failed: {}",
                job.id,
                get_error_name(ec));
    }
    return job;
}

tl::expected<Job, std::error_code>
JobService::get_job(std::string_view job_id, std::string_view user_id) const {
    auto job = store_.find_job_for_user(job_id, user_id);
    if (!job.has_value()) {
        return tl::unexpected(make_error_code(SchedulerErrc::JobNotFound));
    }
    return *job;
}

std::vector<Job>
JobService::list_jobs(std::string_view user_id, const std::optional<JobStatus> status) const {
    JobFilter filter{};
    filter.user_id = std::string{user_id};
    filter.status = status;
    return store_.list_jobs(filter);
}

std::error_code JobService::cancel_job(std::string_view job_id, std::string_view user_id) {
    const auto job = get_job(job_id, user_id);
    if (!job) {
        return job.error();
    }
    if (is_terminal(job->status)) {
        return SchedulerErrc::InvalidTransition;
    }

    if (supervisor_.cancel(job_id)) {
        return SchedulerErrc::Success;
    }

    // Not executing here: either the supervisor cancelled it while Pending,
    // or the record says Running without an execution unit.
    const auto current = reload(store_, job_id);
    if (!current) {
        return current.error();
    }
    if (current->status == JobStatus::Cancelled) {
        return SchedulerErrc::Success;
    }
    if (current->status == JobStatus::Running && !supervisor_.is_active(job_id)) {
        return reconciler_.mark_cancelled(
                job_id, JobResult{{"reason", "cancelled without active execution"}});
    }
    return is_terminal(current->status) ? make_error_code(SchedulerErrc::InvalidTransition)
                                        : make_error_code(SchedulerErrc::Success);
}

tl::expected<Job, std::error_code>
JobService::retry_job(std::string_view job_id, std::string_view user_id) {
    const auto job = get_job(job_id, user_id);
    if (!job) {
        return tl::unexpected(job.error());
    }
    if (const auto ec = reconciler_.reset_for_retry(job_id); ec) {
        return tl::unexpected(ec);
    }
    GPUD_LOGEC_INFO(
            SchedulerComponent::Service,
            JobEvent::Retried,
            "Job '{}' reset to Pending from {}",
            job_id,
            to_string(job->status));

    if (const auto ec = supervisor_.submit(job_id); ec) {
        GPUD_LOGC_WARN(
                SchedulerComponent::Service,
                "Retried job '{}' stays Pending, submit failed: {}",
                job_id,
                get_error_name(ec));
    }
    return reload(store_, job_id);
}

tl::expected<Job, std::error_code> JobService::update_job(
        std::string_view job_id, std::string_view user_id, const JobDetailsUpdate &details) {
    if (const auto job = get_job(job_id, user_id); !job) {
        return tl::unexpected(job.error());
    }
    if (details.title.has_value() &&
        (details.title->empty() || details.title->size() > limits_.max_title_length)) {
        return tl::unexpected(make_error_code(SchedulerErrc::InvalidParameter));
    }
    if (const auto ec = reconciler_.update_details(job_id, details); ec) {
        return tl::unexpected(ec);
    }
    return reload(store_, job_id);
}

std::error_code JobService::delete_job(std::string_view job_id, std::string_view user_id) {
    if (const auto job = get_job(job_id, user_id); !job) {
        return job.error();
    }
    const auto ec = reconciler_.remove(job_id);
    if (!ec) {
        GPUD_LOGEC_INFO(SchedulerComponent::Service, JobEvent::Deleted, "Job '{}' deleted", job_id);
    }
    return ec;
}

RecoveryReport JobService::recover() {
    RecoveryReport report{};
    for (const auto &job : store_.list_jobs(JobFilter{})) {
        if (job.status == JobStatus::Running && !supervisor_.is_active(job.id)) {
            if (!reconciler_.mark_failed(job.id, std::string{INTERRUPTED_MESSAGE})) {
                ++report.interrupted;
            }
        } else if (job.status == JobStatus::Pending) {
            if (const auto ec = supervisor_.submit(job.id); !ec) {
                ++report.resubmitted;
            } else {
                GPUD_LOGC_WARN(
                        SchedulerComponent::Service,
                        "Cannot resubmit job '{}': {}",
                        job.id,
                        get_error_name(ec));
            }
        }
    }
    GPUD_LOGEC_INFO(
            SchedulerComponent::Service,
            JobEvent::Recovered,
            "Recovery resubmitted {} Pending jobs and failed {} interrupted jobs",
            report.resubmitted,
            report.interrupted);
    return report;
}

void JobService::stop_all(const ShutdownBehavior behavior) { supervisor_.shutdown(behavior); }

} // namespace gpudispatch::scheduler
