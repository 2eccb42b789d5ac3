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
 * @file worker.hpp
 * @brief Worker node record
 */

#ifndef GPUDISPATCH_SCHEDULER_WORKER_HPP
#define GPUDISPATCH_SCHEDULER_WORKER_HPP

#include <cstdint>
#include <format>
#include <optional>
#include <string>

#include <wise_enum.h>

#include "log/dispatch_log_macros.hpp"
#include "scheduler/job.hpp"

namespace gpudispatch::scheduler {

/// Worker availability status
enum class WorkerStatus {
    Online,     //!< Last probe succeeded
    Offline,    //!< Last probe failed or never probed
    Busy,       //!< Administratively marked as saturated
    Maintenance //!< Inside a maintenance window, never allocated
};

} // namespace gpudispatch::scheduler

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(gpudispatch::scheduler::WorkerStatus, Online, Offline, Busy, Maintenance)

namespace gpudispatch::scheduler {

inline constexpr std::uint16_t DEFAULT_WORKER_PORT = 22; //!< Remote shell port

/**
 * Durable worker record
 *
 * Identity and capacity are owned by worker administration. The scheduler
 * only writes status and last_probed.
 */
struct Worker final {
    std::string id;                          //!< Unique worker id
    std::string name;                        //!< Display name
    std::string host;                        //!< Host name or address
    std::uint16_t port{DEFAULT_WORKER_PORT}; //!< Port used for reachability checks
    std::string username;                    //!< Remote account, informational
    std::uint32_t slot_count{1};             //!< GPU slots, at least 1
    WorkerStatus status{WorkerStatus::Offline};
    bool active{true};                       //!< Administrative enable flag
    std::uint64_t registration_seq{0};       //!< Assigned by the store on first insert
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> last_probed;

    /**
     * Network address used by probes
     * @return host:port
     */
    [[nodiscard]] std::string address() const { return std::format("{}:{}", host, port); }
};

} // namespace gpudispatch::scheduler

GPUD_LOGGABLE_DEFERRED_FORMAT(
        gpudispatch::scheduler::Worker,
        "Worker(id={}, address={}:{}, slots={}, status={})",
        obj.id,
        obj.host,
        obj.port,
        obj.slot_count,
        ::wise_enum::to_string(obj.status))

#endif // GPUDISPATCH_SCHEDULER_WORKER_HPP
