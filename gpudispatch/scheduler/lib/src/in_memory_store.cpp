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

#include <algorithm>    // for erase, count_if
#include <cstddef>      // for size_t
#include <mutex>        // for lock_guard
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include "scheduler/in_memory_store.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "task/time.hpp"

namespace gpudispatch::scheduler {

std::error_code InMemoryStore::insert_job(const Job &job) {
    if (job.id.empty()) {
        return SchedulerErrc::InvalidParameter;
    }
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = jobs_.try_emplace(job.id, job);
    if (!inserted) {
        return SchedulerErrc::DuplicateId;
    }
    job_order_.push_back(job.id);
    return SchedulerErrc::Success;
}

std::optional<Job> InMemoryStore::find_job(std::string_view job_id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(std::string{job_id});
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Job>
InMemoryStore::find_job_for_user(std::string_view job_id, std::string_view user_id) const {
    auto job = find_job(job_id);
    if (!job.has_value() || job->user_id != user_id) {
        return std::nullopt;
    }
    return job;
}

std::vector<Job> InMemoryStore::list_jobs(const JobFilter &filter) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> result;
    for (const auto &id : job_order_) {
        const auto &job = jobs_.at(id);
        if (filter.user_id.has_value() && job.user_id != *filter.user_id) {
            continue;
        }
        if (filter.status.has_value() && job.status != *filter.status) {
            continue;
        }
        result.push_back(job);
    }
    return result;
}

std::error_code InMemoryStore::update_job(std::string_view job_id, const JobMutator &mutator) {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(std::string{job_id});
    if (it == jobs_.end()) {
        return SchedulerErrc::JobNotFound;
    }
    Job updated = it->second;
    if (const auto errc = mutator(updated); errc) {
        return errc;
    }
    it->second = std::move(updated);
    return SchedulerErrc::Success;
}

std::error_code InMemoryStore::erase_job(std::string_view job_id, const JobGuard &guard) {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(std::string{job_id});
    if (it == jobs_.end()) {
        return SchedulerErrc::JobNotFound;
    }
    if (const auto errc = guard(it->second); errc) {
        return errc;
    }
    jobs_.erase(it);
    std::erase(job_order_, std::string{job_id});
    return SchedulerErrc::Success;
}

std::size_t InMemoryStore::count_running_on_worker(std::string_view worker_id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(jobs_.begin(), jobs_.end(), [&](const auto &entry) {
        const Job &job = entry.second;
        return job.status == JobStatus::Running && job.assigned_worker == worker_id;
    }));
}

std::size_t InMemoryStore::count_running_for_user(std::string_view user_id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(jobs_.begin(), jobs_.end(), [&](const auto &entry) {
        const Job &job = entry.second;
        return job.status == JobStatus::Running && job.user_id == user_id;
    }));
}

std::error_code InMemoryStore::upsert_worker(const Worker &worker) {
    if (worker.id.empty() || worker.slot_count == 0) {
        return SchedulerErrc::InvalidParameter;
    }
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = workers_.find(worker.id);
    if (it != workers_.end()) {
        Worker replacement = worker;
        replacement.registration_seq = it->second.registration_seq;
        replacement.created_at = it->second.created_at;
        it->second = std::move(replacement);
        return SchedulerErrc::Success;
    }

    Worker inserted = worker;
    inserted.registration_seq = next_registration_seq_++;
    if (!inserted.created_at.has_value()) {
        inserted.created_at = task::Time::now();
    }
    workers_.emplace(inserted.id, std::move(inserted));
    worker_order_.push_back(worker.id);
    return SchedulerErrc::Success;
}

std::optional<Worker> InMemoryStore::find_worker(std::string_view worker_id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = workers_.find(std::string{worker_id});
    if (it == workers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Worker> InMemoryStore::list_workers() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Worker> result;
    result.reserve(worker_order_.size());
    for (const auto &id : worker_order_) {
        result.push_back(workers_.at(id));
    }
    return result;
}

std::vector<Worker> InMemoryStore::list_active_workers() const {
    auto workers = list_workers();
    std::erase_if(workers, [](const Worker &worker) { return !worker.active; });
    return workers;
}

std::error_code InMemoryStore::update_worker_status(
        std::string_view worker_id,
        const WorkerStatus status,
        const std::optional<TimePoint> last_probed) {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = workers_.find(std::string{worker_id});
    if (it == workers_.end()) {
        return SchedulerErrc::WorkerNotFound;
    }
    it->second.status = status;
    if (last_probed.has_value()) {
        it->second.last_probed = last_probed;
    }
    return SchedulerErrc::Success;
}

std::error_code
InMemoryStore::update_worker(std::string_view worker_id, const WorkerMutator &mutator) {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = workers_.find(std::string{worker_id});
    if (it == workers_.end()) {
        return SchedulerErrc::WorkerNotFound;
    }
    Worker updated = it->second;
    if (const auto errc = mutator(updated); errc) {
        return errc;
    }
    it->second = std::move(updated);
    return SchedulerErrc::Success;
}

std::error_code InMemoryStore::erase_worker(std::string_view worker_id) {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (workers_.erase(std::string{worker_id}) == 0) {
        return SchedulerErrc::WorkerNotFound;
    }
    std::erase(worker_order_, std::string{worker_id});
    return SchedulerErrc::Success;
}

} // namespace gpudispatch::scheduler
