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

#include <optional>     // for optional, nullopt
#include <system_error> // for error_code

#include "log/dispatch_log_macros.hpp"
#include "scheduler/allocator.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"
#include "task/time.hpp"

namespace gpudispatch::scheduler {

std::optional<Worker> Allocator::select_worker() {
    const auto workers = registry_.list_active_workers();
    for (auto worker : workers) {
        if (worker.status == WorkerStatus::Maintenance) {
            GPUD_LOGC_DEBUG(
                    SchedulerComponent::Allocator, "Skipping worker '{}': maintenance", worker.id);
            continue;
        }

        const auto occupied = registry_.occupancy(worker.id);
        if (occupied >= worker.slot_count) {
            GPUD_LOGC_DEBUG(
                    SchedulerComponent::Allocator,
                    "Skipping worker '{}': {}/{} slots busy",
                    worker.id,
                    occupied,
                    worker.slot_count);
            continue;
        }

        const bool reachable = prober_.probe(worker);
        record_probe(worker, reachable);
        if (worker.status == WorkerStatus::Maintenance) {
            GPUD_LOGC_DEBUG(
                    SchedulerComponent::Allocator,
                    "Skipping worker '{}': entered maintenance while probed",
                    worker.id);
            continue;
        }
        if (reachable) {
            GPUD_LOGC_DEBUG(
                    SchedulerComponent::Allocator,
                    "Selected worker '{}' ({}/{} slots busy)",
                    worker.id,
                    occupied,
                    worker.slot_count);
            return worker;
        }
    }

    GPUD_LOGEC_DEBUG(
            SchedulerComponent::Allocator,
            SchedulerErrorEvent::AllocationUnavailable,
            "No available worker among {} active",
            workers.size());
    return std::nullopt;
}

void Allocator::record_probe(Worker &worker, const bool reachable) {
    const auto probed_at = task::Time::now();
    auto recorded = worker.status;
    // A maintenance window opened during the probe wins over its result
    const std::error_code ec = store_.update_worker(
            worker.id, [reachable, probed_at, &recorded](Worker &stored) -> std::error_code {
                if (stored.status != WorkerStatus::Maintenance) {
                    stored.status = reachable ? WorkerStatus::Online : WorkerStatus::Offline;
                }
                stored.last_probed = probed_at;
                recorded = stored.status;
                return SchedulerErrc::Success;
            });
    if (ec) {
        GPUD_LOGC_WARN(
                SchedulerComponent::Allocator,
                "Cannot record probe of worker '{}' ({}): {}",
                worker.id,
                reachable ? "reachable" : "unreachable",
                ec.message());
        return;
    }
    worker.status = recorded;
    worker.last_probed = probed_at;
}

} // namespace gpudispatch::scheduler
