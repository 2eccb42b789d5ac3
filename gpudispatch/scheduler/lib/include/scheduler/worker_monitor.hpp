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
 * @file worker_monitor.hpp
 * @brief Periodic worker health sweep and maintenance windows
 */

#ifndef GPUDISPATCH_SCHEDULER_WORKER_MONITOR_HPP
#define GPUDISPATCH_SCHEDULER_WORKER_MONITOR_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <parallel_hashmap/phmap.h>
#include <tl/expected.hpp>

#include "scheduler/iavailability_prober.hpp"
#include "scheduler/idurable_store.hpp"
#include "scheduler/job.hpp"
#include "task/periodic_trigger.hpp"

namespace gpudispatch::scheduler {

/**
 * Worker monitor configuration
 */
struct MonitorConfig final {
    static constexpr std::chrono::milliseconds DEFAULT_SWEEP_INTERVAL{std::chrono::seconds{60}};
    static constexpr std::chrono::seconds DEFAULT_MAINTENANCE_WINDOW{3600};

    std::chrono::milliseconds sweep_interval{DEFAULT_SWEEP_INTERVAL};
    std::chrono::seconds default_maintenance_window{DEFAULT_MAINTENANCE_WINDOW};

    /**
     * Check the configuration
     * @return SchedulerErrc::InvalidParameter for a non-positive interval or window
     */
    [[nodiscard]] std::error_code validate() const noexcept;
};

/**
 * Worker monitor
 *
 * Keeps worker status fresh outside of allocation. A sweep first ends
 * expired maintenance windows, then probes every active worker that is not
 * in maintenance and persists Online or Offline with the probe time.
 * start() runs the sweep periodically on its own thread.
 */
class WorkerMonitor final {
public:
    /// Called after a sweep or maintenance change that may have freed capacity
    using CapacityListener = std::function<void()>;

    /**
     * Create a monitor
     *
     * @param[in] store Worker records
     * @param[in] prober Reachability check
     * @param[in] config Monitor configuration
     * @throws std::invalid_argument if the configuration is invalid
     */
    WorkerMonitor(IDurableStore &store, IAvailabilityProber &prober, MonitorConfig config = {});

    ~WorkerMonitor();

    WorkerMonitor(const WorkerMonitor &) = delete;
    WorkerMonitor &operator=(const WorkerMonitor &) = delete;
    WorkerMonitor(WorkerMonitor &&) = delete;
    WorkerMonitor &operator=(WorkerMonitor &&) = delete;

    /**
     * Probe one worker and persist the outcome
     *
     * A worker in maintenance keeps its status, only last_probed changes.
     *
     * @param[in] worker_id Worker id
     * @return Probe result, or SchedulerErrc::WorkerNotFound
     */
    [[nodiscard]] tl::expected<bool, std::error_code> ping_worker(std::string_view worker_id);

    /**
     * Run one sweep
     *
     * @return Number of workers found online
     */
    std::size_t sweep();

    /**
     * Put a worker into maintenance
     *
     * @param[in] worker_id Worker id
     * @param[in] window Duration, the configured default when unset
     * @return SchedulerErrc::WorkerNotFound, SchedulerErrc::InvalidParameter
     *         for a non-positive window, or success
     */
    [[nodiscard]] std::error_code schedule_maintenance(
            std::string_view worker_id, std::optional<std::chrono::seconds> window = std::nullopt);

    /**
     * End maintenance windows that expired before a time
     *
     * @param[in] now Reference time
     * @return Number of workers restored to Online
     */
    std::size_t end_expired_maintenance(TimePoint now);

    /**
     * Scheduled end of a worker's maintenance window
     * @param[in] worker_id Worker id
     * @return End time, or std::nullopt if the worker is not in maintenance
     */
    [[nodiscard]] std::optional<TimePoint> maintenance_until(std::string_view worker_id) const;

    void set_capacity_listener(CapacityListener listener);

    /**
     * Start periodic sweeps
     * @return task::TaskErrc::AlreadyRunning if already started
     */
    [[nodiscard]] std::error_code start();

    /// Stop periodic sweeps. Safe to call repeatedly.
    void stop();

    [[nodiscard]] bool is_running() const;

private:
    void notify_capacity() const;

    IDurableStore &store_;
    IAvailabilityProber &prober_;
    MonitorConfig config_;

    mutable std::mutex mutex_;
    phmap::flat_hash_map<std::string, TimePoint> maintenance_until_;
    CapacityListener capacity_listener_;
    std::unique_ptr<task::PeriodicTrigger> trigger_;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_WORKER_MONITOR_HPP
