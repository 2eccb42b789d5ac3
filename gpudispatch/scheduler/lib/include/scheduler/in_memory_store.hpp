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
 * @file in_memory_store.hpp
 * @brief Process local IDurableStore
 */

#ifndef GPUDISPATCH_SCHEDULER_IN_MEMORY_STORE_HPP
#define GPUDISPATCH_SCHEDULER_IN_MEMORY_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <parallel_hashmap/phmap.h>

#include "scheduler/idurable_store.hpp"
#include "scheduler/job.hpp"
#include "scheduler/worker.hpp"

namespace gpudispatch::scheduler {

/**
 * IDurableStore kept in process memory
 *
 * A single mutex serializes every operation, which makes each job update
 * atomic and every listing a consistent snapshot. Insertion order is kept
 * separately from the hash maps so listings are deterministic.
 */
class InMemoryStore final : public IDurableStore {
public:
    InMemoryStore() = default;
    ~InMemoryStore() override = default;
    InMemoryStore(InMemoryStore &&) = delete;
    InMemoryStore &operator=(InMemoryStore &&) = delete;
    InMemoryStore(const InMemoryStore &) = delete;
    InMemoryStore &operator=(const InMemoryStore &) = delete;

    [[nodiscard]] std::error_code insert_job(const Job &job) override;
    [[nodiscard]] std::optional<Job> find_job(std::string_view job_id) const override;
    [[nodiscard]] std::optional<Job>
    find_job_for_user(std::string_view job_id, std::string_view user_id) const override;
    [[nodiscard]] std::vector<Job> list_jobs(const JobFilter &filter) const override;
    [[nodiscard]] std::error_code
    update_job(std::string_view job_id, const JobMutator &mutator) override;
    [[nodiscard]] std::error_code erase_job(std::string_view job_id, const JobGuard &guard) override;
    [[nodiscard]] std::size_t count_running_on_worker(std::string_view worker_id) const override;
    [[nodiscard]] std::size_t count_running_for_user(std::string_view user_id) const override;

    [[nodiscard]] std::error_code upsert_worker(const Worker &worker) override;
    [[nodiscard]] std::optional<Worker> find_worker(std::string_view worker_id) const override;
    [[nodiscard]] std::vector<Worker> list_workers() const override;
    [[nodiscard]] std::vector<Worker> list_active_workers() const override;
    [[nodiscard]] std::error_code update_worker_status(
            std::string_view worker_id,
            WorkerStatus status,
            std::optional<TimePoint> last_probed) override;
    [[nodiscard]] std::error_code
    update_worker(std::string_view worker_id, const WorkerMutator &mutator) override;

    /**
     * Remove a worker record
     *
     * Worker administration is external to the scheduler; this exists for
     * tests and tools that play that role.
     *
     * @param[in] worker_id Worker id
     * @return SchedulerErrc::WorkerNotFound or success
     */
    [[nodiscard]] std::error_code erase_worker(std::string_view worker_id);

private:
    mutable std::mutex mutex_;
    phmap::flat_hash_map<std::string, Job> jobs_;
    std::vector<std::string> job_order_;
    phmap::flat_hash_map<std::string, Worker> workers_;
    std::vector<std::string> worker_order_;
    std::uint64_t next_registration_seq_{1};
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_IN_MEMORY_STORE_HPP
