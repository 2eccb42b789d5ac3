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

#include <pthread.h> // for pthread_setname_np, pthread_self

#include <algorithm>    // for find_if, upper_bound, erase_if
#include <chrono>       // for milliseconds
#include <exception>    // for exception
#include <format>       // for format
#include <memory>       // for make_shared, make_unique
#include <mutex>        // for lock_guard, unique_lock
#include <optional>     // for optional
#include <set>          // for set
#include <stdexcept>    // for invalid_argument
#include <string>       // for string, to_string
#include <string_view>  // for string_view
#include <system_error> // for error_code, system_error
#include <thread>       // for thread
#include <tuple>        // for ignore
#include <utility>      // for move
#include <vector>       // for vector

#include <gsl-lite/gsl-lite.hpp> // for finally

#include <wise_enum.h> // for to_string

#include "log/dispatch_log_macros.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"
#include "scheduler/task_supervisor.hpp"

namespace gpudispatch::scheduler {

namespace {

constexpr std::size_t MAX_THREAD_NAME_LENGTH = 15;

void set_thread_name(const std::string &name) {
    const std::string thread_name = name.substr(0, MAX_THREAD_NAME_LENGTH);
    pthread_setname_np(pthread_self(), thread_name.c_str());
}

/**
 * Payload recorded on a job stopped by cancellation
 *
 * @param[in] error Cancellation reported by the routine
 * @return Result payload
 */
JobResult cancellation_result(const ExecutionError &error) {
    return JobResult{
            {"reason", "cancelled while running"},
            {"steps_completed", std::to_string(error.steps_completed)},
            {"progress", std::format("{:.1f}", error.progress)}};
}

} // namespace

std::error_code SupervisorConfig::validate() const noexcept {
    if (backlog_retry_interval < MIN_BACKLOG_RETRY_INTERVAL) {
        return SchedulerErrc::InvalidParameter;
    }
    return SchedulerErrc::Success;
}

TaskSupervisor::TaskSupervisor(
        IDurableStore &store,
        StateReconciler &reconciler,
        Allocator &allocator,
        const ExecutionEngine &engine,
        SupervisorConfig config)
        : store_(store), reconciler_(reconciler), allocator_(allocator), engine_(engine),
          config_(config) {
    if (config_.validate()) {
        throw std::invalid_argument(std::format(
                "Backlog retry interval must be at least {}ms, got {}ms",
                SupervisorConfig::MIN_BACKLOG_RETRY_INTERVAL.count(),
                config_.backlog_retry_interval.count()));
    }
    dispatcher_ = std::thread([this] { dispatcher_loop(); });
}

TaskSupervisor::~TaskSupervisor() {
    try {
        shutdown(ShutdownBehavior::CancelActiveJobs);
    } catch (const std::exception &e) {
        GPUD_LOGC_ERROR(SchedulerComponent::Supervisor, "Shutdown in destructor failed: {}", e.what());
    } catch (...) {
        GPUD_LOGC_ERROR(
                SchedulerComponent::Supervisor, "Shutdown in destructor failed: unknown exception");
    }
}

std::error_code TaskSupervisor::submit(std::string_view job_id) {
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return SchedulerErrc::ShuttingDown;
        }
        if (in_backlog(job_id)) {
            return SchedulerErrc::Success;
        }
    }

    const auto job = store_.find_job(job_id);
    if (!job.has_value()) {
        return SchedulerErrc::JobNotFound;
    }

    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return SchedulerErrc::ShuttingDown;
        }
        if (in_backlog(job->id)) {
            return SchedulerErrc::Success;
        }
        if (const auto it = active_.find(job->id); it != active_.end()) {
            // The previous run still holds the handle; queue again once it is released
            if (job->status == JobStatus::Pending) {
                it->second->resubmit = true;
                GPUD_LOGC_DEBUG(
                        SchedulerComponent::Supervisor,
                        "Job '{}' queued after its previous run is released",
                        job->id);
            }
            return SchedulerErrc::Success;
        }
        if (job->status != JobStatus::Pending) {
            return SchedulerErrc::JobNotPending;
        }
        enqueue(*job);
    }
    dispatch_cv_.notify_one();

    GPUD_LOGEC_INFO(
            SchedulerComponent::Supervisor,
            JobEvent::Submitted,
            "Job '{}' queued (type={}, priority={})",
            job->id,
            job->job_type,
            job->priority);
    return SchedulerErrc::Success;
}

bool TaskSupervisor::cancel(std::string_view job_id) {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = active_.find(std::string{job_id});
    if (it != active_.end() && it->second->resubmit) {
        // Only the retried record is live; the previous run is already ending
        it->second->resubmit = false;
    } else if (it != active_.end()) {
        it->second->token->cancel();
        GPUD_LOGEC_INFO(
                SchedulerComponent::Supervisor,
                SchedulerErrorEvent::CancellationRequested,
                "Cancellation requested for job '{}' on worker '{}'",
                job_id,
                it->second->worker_id);
        return true;
    }

    erase_from_backlog(job_id);
    if (const auto ec = reconciler_.cancel_pending(job_id); !ec) {
        GPUD_LOGEC_INFO(
                SchedulerComponent::Supervisor,
                JobEvent::Cancelled,
                "Job '{}' cancelled before start",
                job_id);
    }
    idle_cv_.notify_all();
    return false;
}

void TaskSupervisor::shutdown(const ShutdownBehavior behavior) {
    const std::lock_guard<std::mutex> shutdown_lock(shutdown_mutex_);
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_) {
            GPUD_LOGC_INFO(
                    SchedulerComponent::Supervisor,
                    "Shutting down ({}): {} running, {} queued",
                    ::wise_enum::to_string(behavior),
                    active_.size(),
                    backlog_.size());
        }
        stopping_ = true;
        backlog_.clear();
        if (behavior == ShutdownBehavior::CancelActiveJobs) {
            for (const auto &[job_id, handle] : active_) {
                handle->token->cancel();
            }
        }
    }
    dispatch_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return active_.empty(); });
    }
    join_finished();
}

void TaskSupervisor::notify_capacity_changed() {
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        wake_ = true;
    }
    dispatch_cv_.notify_one();
}

bool TaskSupervisor::wait_until_idle(const std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(
            lock, timeout, [this] { return active_.empty() && backlog_.empty(); });
}

std::set<std::string> TaskSupervisor::active_job_ids() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> ids;
    for (const auto &[job_id, handle] : active_) {
        ids.insert(job_id);
    }
    return ids;
}

bool TaskSupervisor::is_active(std::string_view job_id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return active_.contains(std::string{job_id});
}

std::size_t TaskSupervisor::active_count() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::size_t TaskSupervisor::backlog_size() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return backlog_.size();
}

void TaskSupervisor::dispatcher_loop() {
    set_thread_name("JobDispatcher");
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            dispatch_cv_.wait_for(
                    lock, config_.backlog_retry_interval, [this] { return stopping_ || wake_; });
            if (stopping_) {
                break;
            }
            wake_ = false;
        }
        join_finished();
        dispatch_backlog();
    }
    GPUD_LOGC_DEBUG(SchedulerComponent::Supervisor, "Dispatcher stopped");
}

void TaskSupervisor::dispatch_backlog() {
    std::vector<std::string> queued;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        queued.reserve(backlog_.size());
        for (const auto &entry : backlog_) {
            queued.push_back(entry.job_id);
        }
    }

    for (const auto &job_id : queued) {
        const auto outcome = try_start(job_id);
        if (outcome == DispatchOutcome::NoCapacity || outcome == DispatchOutcome::Stopping) {
            break;
        }
    }
    idle_cv_.notify_all();
}

TaskSupervisor::DispatchOutcome TaskSupervisor::try_start(const std::string &job_id) {
    auto job = store_.find_job(job_id);
    if (!job.has_value() || job->status != JobStatus::Pending) {
        GPUD_LOGC_DEBUG(
                SchedulerComponent::Supervisor, "Dropping job '{}' from backlog: not Pending", job_id);
        const std::lock_guard<std::mutex> lock(mutex_);
        erase_from_backlog(job_id);
        return DispatchOutcome::Dropped;
    }

    if (!engine_.supports(job->job_type)) {
        const std::lock_guard<std::mutex> lock(mutex_);
        erase_from_backlog(job_id);
        if (const auto ec = reconciler_.reject(job_id, unsupported_job_type_message(job->job_type));
            !ec) {
            GPUD_LOGEC_WARN(
                    SchedulerComponent::Supervisor,
                    JobEvent::Failed,
                    "Job '{}' failed: unsupported type '{}'",
                    job_id,
                    job->job_type);
        }
        return DispatchOutcome::Dropped;
    }

    auto worker = allocator_.select_worker();
    if (!worker.has_value()) {
        GPUD_LOGEC_DEBUG(
                SchedulerComponent::Supervisor,
                SchedulerErrorEvent::AllocationUnavailable,
                "Job '{}' waits for capacity",
                job_id);
        return DispatchOutcome::NoCapacity;
    }

    const std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return DispatchOutcome::Stopping;
    }
    erase_from_backlog(job_id);
    if (const auto it = active_.find(job_id); it != active_.end()) {
        it->second->resubmit = true;
        return DispatchOutcome::Dropped;
    }

    if (const auto ec = reconciler_.mark_running(job_id, worker->id); ec) {
        GPUD_LOGC_DEBUG(
                SchedulerComponent::Supervisor,
                "Job '{}' not claimed: {}",
                job_id,
                get_error_name(ec));
        return DispatchOutcome::Dropped;
    }
    job->status = JobStatus::Running;
    job->assigned_worker = worker->id;

    auto handle = std::make_unique<ActiveJobHandle>();
    handle->job_id = job_id;
    handle->worker_id = worker->id;
    handle->token = std::make_shared<task::CancellationToken>();
    try {
        handle->thread = std::thread(
                [this, record = *job, selected = *worker, token = handle->token]() mutable {
                    run_job(std::move(record), std::move(selected), std::move(token));
                });
    } catch (const std::system_error &e) {
        GPUD_LOGEC_ERROR(
                SchedulerComponent::Supervisor,
                SchedulerErrorEvent::ExecutionError,
                "Cannot start thread for job '{}': {}",
                job_id,
                e.what());
        std::ignore = reconciler_.mark_failed(job_id, std::format("Cannot start job: {}", e.what()));
        return DispatchOutcome::Dropped;
    }
    active_.emplace(job_id, std::move(handle));

    GPUD_LOGEC_INFO(
            SchedulerComponent::Supervisor,
            JobEvent::Scheduled,
            "Job '{}' started on worker '{}'",
            job_id,
            worker->id);
    return DispatchOutcome::Started;
}

void TaskSupervisor::run_job(
        Job job, Worker worker, std::shared_ptr<task::CancellationToken> token) {
    set_thread_name("Job-" + job.id);
    // The handle is released on every exit path so shutdown() cannot hang
    const auto release_handle = gsl_lite::finally([this, &job] { finish_job(job.id); });

    const ProgressSink report_progress = [this, &job](const double progress) {
        const auto ec = reconciler_.report_progress(job.id, progress);
        if (ec) {
            GPUD_LOGC_DEBUG(
                    SchedulerComponent::Supervisor,
                    "Progress {:.1f} for job '{}' not recorded: {}",
                    progress,
                    job.id,
                    get_error_name(ec));
            return;
        }
        GPUD_LOGEC_TRACE_L1(
                SchedulerComponent::Supervisor,
                JobEvent::Progress,
                "Job '{}' at {:.1f}%",
                job.id,
                progress);
    };

    const auto outcome = engine_.run(job, worker, *token, report_progress);

    std::error_code ec;
    if (outcome.has_value()) {
        ec = reconciler_.mark_completed(job.id, *outcome);
        if (!ec) {
            GPUD_LOGEC_INFO(
                    SchedulerComponent::Supervisor,
                    JobEvent::Completed,
                    "Job '{}' completed on worker '{}'",
                    job.id,
                    worker.id);
        }
    } else if (outcome.error().code == SchedulerErrc::CancellationRequested) {
        ec = reconciler_.mark_cancelled(job.id, cancellation_result(outcome.error()));
        if (!ec) {
            GPUD_LOGEC_INFO(
                    SchedulerComponent::Supervisor,
                    JobEvent::Cancelled,
                    "Job '{}' cancelled: {}",
                    job.id,
                    outcome.error().message);
        }
    } else {
        ec = reconciler_.mark_failed(job.id, outcome.error().message);
        if (!ec) {
            GPUD_LOGEC_WARN(
                    SchedulerComponent::Supervisor,
                    JobEvent::Failed,
                    "Job '{}' failed: {}",
                    job.id,
                    outcome.error().message);
        }
    }
    if (ec && ec != SchedulerErrc::ReconciliationConflict) {
        GPUD_LOGC_ERROR(
                SchedulerComponent::Supervisor,
                "Final state of job '{}' not recorded: {}",
                job.id,
                get_error_name(ec));
    }
}

void TaskSupervisor::finish_job(const std::string &job_id) {
    std::optional<Job> pending;
    bool loaded = false;
    bool requeued = false;
    for (;;) {
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            const auto it = active_.find(job_id);
            const bool resubmit = it != active_.end() && it->second->resubmit;
            // The record is read outside the lock, so a retry seen first costs one more pass
            if (!resubmit || loaded) {
                if (it != active_.end()) {
                    finished_.push_back(std::move(it->second->thread));
                    active_.erase(it);
                }
                if (resubmit && pending.has_value() && pending->status == JobStatus::Pending &&
                    !stopping_ && !in_backlog(job_id)) {
                    enqueue(*pending);
                    requeued = true;
                }
                wake_ = true;
                break;
            }
        }
        pending = store_.find_job(job_id);
        loaded = true;
    }
    dispatch_cv_.notify_one();
    idle_cv_.notify_all();

    if (requeued) {
        GPUD_LOGEC_INFO(
                SchedulerComponent::Supervisor,
                JobEvent::Submitted,
                "Job '{}' queued again after its previous run ended",
                job_id);
    }
}

void TaskSupervisor::join_finished() {
    std::vector<std::thread> threads;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(finished_);
    }
    for (auto &thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool TaskSupervisor::in_backlog(std::string_view job_id) const {
    return std::find_if(backlog_.begin(), backlog_.end(), [job_id](const BacklogEntry &entry) {
               return entry.job_id == job_id;
           }) != backlog_.end();
}

void TaskSupervisor::enqueue(const Job &job) {
    BacklogEntry entry{job.id, job.priority, next_sequence_++};
    // Highest priority first, submission order within a priority
    const auto position = std::upper_bound(
            backlog_.begin(),
            backlog_.end(),
            entry,
            [](const BacklogEntry &lhs, const BacklogEntry &rhs) {
                if (lhs.priority != rhs.priority) {
                    return lhs.priority > rhs.priority;
                }
                return lhs.sequence < rhs.sequence;
            });
    backlog_.insert(position, std::move(entry));
    wake_ = true;
}

void TaskSupervisor::erase_from_backlog(std::string_view job_id) {
    std::erase_if(backlog_, [job_id](const BacklogEntry &entry) { return entry.job_id == job_id; });
}

} // namespace gpudispatch::scheduler
