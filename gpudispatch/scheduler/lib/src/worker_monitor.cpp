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

#include <chrono>       // for seconds
#include <cstddef>      // for size_t
#include <exception>    // for exception
#include <memory>       // for make_unique, unique_ptr
#include <mutex>        // for lock_guard
#include <optional>     // for optional, nullopt
#include <stdexcept>    // for invalid_argument
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include <tl/expected.hpp> // for expected, unexpected

#include "log/dispatch_log_macros.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"
#include "scheduler/worker_monitor.hpp"
#include "task/task_errors.hpp"
#include "task/time.hpp"

namespace gpudispatch::scheduler {

namespace {

/**
 * Store a probe result without ending a maintenance window
 *
 * @param[in] store Worker store
 * @param[in] worker_id Worker id
 * @param[in] reachable Probe result
 * @return Status now stored for the worker
 */
tl::expected<WorkerStatus, std::error_code>
record_availability(IDurableStore &store, std::string_view worker_id, const bool reachable) {
    const auto probed_at = task::Time::now();
    auto recorded = WorkerStatus::Offline;
    const auto ec = store.update_worker(
            worker_id, [reachable, probed_at, &recorded](Worker &stored) -> std::error_code {
                if (stored.status != WorkerStatus::Maintenance) {
                    stored.status = reachable ? WorkerStatus::Online : WorkerStatus::Offline;
                }
                stored.last_probed = probed_at;
                recorded = stored.status;
                return SchedulerErrc::Success;
            });
    if (ec) {
        return tl::unexpected(ec);
    }
    return recorded;
}

} // namespace

std::error_code MonitorConfig::validate() const noexcept {
    if (sweep_interval.count() <= 0 || default_maintenance_window.count() <= 0) {
        return SchedulerErrc::InvalidParameter;
    }
    return SchedulerErrc::Success;
}

WorkerMonitor::WorkerMonitor(
        IDurableStore &store, IAvailabilityProber &prober, MonitorConfig config)
        : store_(store), prober_(prober), config_(config) {
    if (config_.validate()) {
        throw std::invalid_argument("Monitor sweep interval and maintenance window must be positive");
    }
}

WorkerMonitor::~WorkerMonitor() { stop(); }

tl::expected<bool, std::error_code> WorkerMonitor::ping_worker(std::string_view worker_id) {
    const auto worker = store_.find_worker(worker_id);
    if (!worker.has_value()) {
        return tl::unexpected(make_error_code(SchedulerErrc::WorkerNotFound));
    }

    const bool reachable = prober_.probe(*worker);
    if (const auto recorded = record_availability(store_, worker->id, reachable); !recorded) {
        return tl::unexpected(recorded.error());
    }
    GPUD_LOGC_DEBUG(
            SchedulerComponent::Monitor,
            "Pinged worker '{}': {}",
            worker->id,
            reachable ? "reachable" : "unreachable");
    return reachable;
}

std::size_t WorkerMonitor::sweep() {
    end_expired_maintenance(task::Time::now());

    std::size_t online = 0;
    std::size_t probed = 0;
    for (const auto &worker : store_.list_active_workers()) {
        if (worker.status == WorkerStatus::Maintenance) {
            continue;
        }
        ++probed;
        const bool reachable = prober_.probe(worker);
        const auto recorded = record_availability(store_, worker.id, reachable);
        if (!recorded) {
            GPUD_LOGC_WARN(
                    SchedulerComponent::Monitor,
                    "Cannot record sweep result for worker '{}': {}",
                    worker.id,
                    recorded.error().message());
            continue;
        }
        if (*recorded == WorkerStatus::Maintenance) {
            GPUD_LOGC_DEBUG(
                    SchedulerComponent::Monitor,
                    "Worker '{}' entered maintenance during the sweep",
                    worker.id);
            continue;
        }
        if (reachable) {
            ++online;
        } else if (worker.status == WorkerStatus::Online) {
            GPUD_LOGEC_WARN(
                    SchedulerComponent::Monitor,
                    SchedulerErrorEvent::ProbeFailed,
                    "Worker '{}' went offline",
                    worker.id);
        }
    }

    GPUD_LOGC_DEBUG(
            SchedulerComponent::Monitor, "Sweep: {} of {} probed workers online", online, probed);
    if (online > 0) {
        notify_capacity();
    }
    return online;
}

std::error_code WorkerMonitor::schedule_maintenance(
        std::string_view worker_id, const std::optional<std::chrono::seconds> window) {
    const auto duration = window.value_or(config_.default_maintenance_window);
    if (duration.count() <= 0) {
        return SchedulerErrc::InvalidParameter;
    }
    if (const auto ec = store_.update_worker_status(worker_id, WorkerStatus::Maintenance, std::nullopt);
        ec) {
        return ec;
    }

    const auto until = task::Time::now() + duration;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        maintenance_until_.insert_or_assign(std::string{worker_id}, until);
    }
    GPUD_LOGC_INFO(
            SchedulerComponent::Monitor,
            "Worker '{}' in maintenance until {}",
            worker_id,
            task::Time::to_iso8601(until));
    return SchedulerErrc::Success;
}

std::size_t WorkerMonitor::end_expired_maintenance(const TimePoint now) {
    std::vector<std::string> expired;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[worker_id, until] : maintenance_until_) {
            if (until <= now) {
                expired.push_back(worker_id);
            }
        }
        for (const auto &worker_id : expired) {
            maintenance_until_.erase(worker_id);
        }
    }

    std::size_t restored = 0;
    for (const auto &worker_id : expired) {
        const auto worker = store_.find_worker(worker_id);
        if (!worker.has_value() || worker->status != WorkerStatus::Maintenance) {
            continue;
        }
        if (const auto ec = store_.update_worker_status(worker_id, WorkerStatus::Online, std::nullopt);
            ec) {
            GPUD_LOGC_WARN(
                    SchedulerComponent::Monitor,
                    "Cannot end maintenance of worker '{}': {}",
                    worker_id,
                    ec.message());
            continue;
        }
        ++restored;
        GPUD_LOGC_INFO(SchedulerComponent::Monitor, "Worker '{}' left maintenance", worker_id);
    }
    if (restored > 0) {
        notify_capacity();
    }
    return restored;
}

std::optional<TimePoint> WorkerMonitor::maintenance_until(std::string_view worker_id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = maintenance_until_.find(std::string{worker_id});
    if (it == maintenance_until_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void WorkerMonitor::set_capacity_listener(CapacityListener listener) {
    const std::lock_guard<std::mutex> lock(mutex_);
    capacity_listener_ = std::move(listener);
}

std::error_code WorkerMonitor::start() {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (trigger_ != nullptr && trigger_->is_running()) {
        return task::make_error_code(task::TaskErrc::AlreadyRunning);
    }
    trigger_ = std::make_unique<task::PeriodicTrigger>(
            task::PeriodicTrigger::create([this] { sweep(); }, config_.sweep_interval)
                    .name("WorkerMonitor")
                    .fire_on_start()
                    .build());
    return trigger_->start();
}

void WorkerMonitor::stop() {
    std::unique_ptr<task::PeriodicTrigger> trigger;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        trigger = std::move(trigger_);
    }
    if (trigger != nullptr) {
        trigger->stop();
    }
}

bool WorkerMonitor::is_running() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return trigger_ != nullptr && trigger_->is_running();
}

void WorkerMonitor::notify_capacity() const {
    CapacityListener listener;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        listener = capacity_listener_;
    }
    if (!listener) {
        return;
    }
    try {
        listener();
    } catch (const std::exception &e) {
        GPUD_LOGC_ERROR(SchedulerComponent::Monitor, "Capacity listener threw: {}", e.what());
    } catch (...) {
        GPUD_LOGC_ERROR(SchedulerComponent::Monitor, "Capacity listener threw a non-standard exception");
    }
}

} // namespace gpudispatch::scheduler
