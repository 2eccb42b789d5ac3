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
 * @file task_supervisor.hpp
 * @brief Owns running jobs: dispatch, cancellation and completion
 */

#ifndef GPUDISPATCH_SCHEDULER_TASK_SUPERVISOR_HPP
#define GPUDISPATCH_SCHEDULER_TASK_SUPERVISOR_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <parallel_hashmap/phmap.h>
#include <wise_enum.h>

#include "scheduler/allocator.hpp"
#include "scheduler/execution_engine.hpp"
#include "scheduler/idurable_store.hpp"
#include "scheduler/state_reconciler.hpp"
#include "task/cancellation_token.hpp"

namespace gpudispatch::scheduler {

/// What shutdown() does with jobs that are still running
enum class ShutdownBehavior {
    CancelActiveJobs, //!< Signal every running job and wait for it to stop
    WaitForActiveJobs //!< Let running jobs finish normally
};

} // namespace gpudispatch::scheduler

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(gpudispatch::scheduler::ShutdownBehavior, CancelActiveJobs, WaitForActiveJobs)

namespace gpudispatch::scheduler {

/**
 * Supervisor configuration
 */
struct SupervisorConfig final {
    static constexpr std::chrono::milliseconds DEFAULT_BACKLOG_RETRY_INTERVAL{2000};
    static constexpr std::chrono::milliseconds MIN_BACKLOG_RETRY_INTERVAL{10};

    /// Period at which jobs waiting for capacity are offered to the allocator again
    std::chrono::milliseconds backlog_retry_interval{DEFAULT_BACKLOG_RETRY_INTERVAL};

    /**
     * Check the configuration
     * @return SchedulerErrc::InvalidParameter if the retry interval is below
     *         MIN_BACKLOG_RETRY_INTERVAL, success otherwise
     */
    [[nodiscard]] std::error_code validate() const noexcept;
};

/**
 * Task supervisor
 *
 * Accepts Pending jobs, places them on a worker and runs each one on its
 * own thread through the execution engine. Jobs that find no capacity wait
 * in a backlog ordered by priority (highest first) and then by submission
 * order. The backlog is retried when a job ends and on every retry
 * interval.
 *
 * The supervisor keeps at most one active handle per job id. Claiming a
 * job (the Pending to Running write) and cancelling it are serialized, so
 * a cancellation either catches the job while Pending or reaches its
 * running thread.
 *
 * The destructor performs shutdown(ShutdownBehavior::CancelActiveJobs).
 */
class TaskSupervisor final {
public:
    /**
     * Create a supervisor and start its dispatcher thread
     *
     * @param[in] store Job records
     * @param[in] reconciler Lifecycle writer
     * @param[in] allocator Worker selection
     * @param[in] engine Routine execution
     * @param[in] config Supervisor configuration
     * @throws std::invalid_argument if the configuration is invalid
     */
    TaskSupervisor(
            IDurableStore &store,
            StateReconciler &reconciler,
            Allocator &allocator,
            const ExecutionEngine &engine,
            SupervisorConfig config = {});

    ~TaskSupervisor();

    TaskSupervisor(const TaskSupervisor &) = delete;
    TaskSupervisor &operator=(const TaskSupervisor &) = delete;
    TaskSupervisor(TaskSupervisor &&) = delete;
    TaskSupervisor &operator=(TaskSupervisor &&) = delete;

    /**
     * Queue a Pending job for execution
     *
     * Returns immediately. Submitting a job that is already queued or
     * running is a no-op.
     *
     * @param[in] job_id Job id
     * @return SchedulerErrc::JobNotFound, SchedulerErrc::JobNotPending,
     *         SchedulerErrc::ShuttingDown, or success
     */
    [[nodiscard]] std::error_code submit(std::string_view job_id);

    /**
     * Request cancellation of a job
     *
     * A running job is signalled and stops at its next step boundary;
     * cancel() does not wait for it. A job that is still Pending is written
     * as Cancelled directly. A terminal or unknown job is left alone.
     *
     * @param[in] job_id Job id
     * @return true only if a running job was signalled
     */
    bool cancel(std::string_view job_id);

    /**
     * Stop dispatching and wind down running jobs
     *
     * Queued jobs stay Pending in the store. Safe to call more than once.
     *
     * @param[in] behavior Whether running jobs are cancelled or awaited
     */
    void shutdown(ShutdownBehavior behavior = ShutdownBehavior::CancelActiveJobs);

    /// Wake the dispatcher so the backlog is retried now
    void notify_capacity_changed();

    /**
     * Wait until nothing is running and the backlog is empty
     *
     * @param[in] timeout Maximum time to wait
     * @return true if the supervisor became idle
     */
    [[nodiscard]] bool wait_until_idle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] std::set<std::string> active_job_ids() const;
    [[nodiscard]] bool is_active(std::string_view job_id) const;
    [[nodiscard]] std::size_t active_count() const;
    [[nodiscard]] std::size_t backlog_size() const;

private:
    struct BacklogEntry final {
        std::string job_id;
        int priority{};
        std::uint64_t sequence{};
    };

    struct ActiveJobHandle final {
        std::string job_id;
        std::string worker_id;
        std::shared_ptr<task::CancellationToken> token;
        std::thread thread;
        /// Set when the job was reset to Pending while this run was still active
        bool resubmit{false};
    };

    enum class DispatchOutcome { Started, Dropped, NoCapacity, Stopping };

    void dispatcher_loop();
    void dispatch_backlog();
    [[nodiscard]] DispatchOutcome try_start(const std::string &job_id);
    void run_job(Job job, Worker worker, std::shared_ptr<task::CancellationToken> token);
    void finish_job(const std::string &job_id);
    void join_finished();
    [[nodiscard]] bool in_backlog(std::string_view job_id) const;
    void enqueue(const Job &job);
    void erase_from_backlog(std::string_view job_id);

    IDurableStore &store_;
    StateReconciler &reconciler_;
    Allocator &allocator_;
    const ExecutionEngine &engine_;
    SupervisorConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    mutable std::condition_variable idle_cv_;
    std::vector<BacklogEntry> backlog_;
    std::uint64_t next_sequence_{0};
    phmap::flat_hash_map<std::string, std::unique_ptr<ActiveJobHandle>> active_;
    std::vector<std::thread> finished_;
    bool stopping_{false};
    bool wake_{false};

    std::mutex shutdown_mutex_;
    std::thread dispatcher_;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_TASK_SUPERVISOR_HPP
