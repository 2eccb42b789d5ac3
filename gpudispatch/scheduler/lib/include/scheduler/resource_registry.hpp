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
 * @file resource_registry.hpp
 * @brief Read-only view of worker capacity and occupancy
 */

#ifndef GPUDISPATCH_SCHEDULER_RESOURCE_REGISTRY_HPP
#define GPUDISPATCH_SCHEDULER_RESOURCE_REGISTRY_HPP

#include <cstddef>
#include <string_view>
#include <vector>

#include "scheduler/idurable_store.hpp"
#include "scheduler/worker.hpp"

namespace gpudispatch::scheduler {

/**
 * Resource registry
 *
 * Answers which workers exist and how loaded they are. Occupancy is always
 * recomputed from Running job records in the store and never cached, so
 * two allocation attempts see the latest committed state. The registry
 * never writes.
 */
class ResourceRegistry final {
public:
    /**
     * Create a registry over a store
     * @param[in] store Durable store, must outlive the registry
     */
    explicit ResourceRegistry(const IDurableStore &store) noexcept : store_(store) {}

    /**
     * Workers with the active flag set
     *
     * @return Workers ordered by creation time, ties broken by registration order
     */
    [[nodiscard]] std::vector<Worker> list_active_workers() const;

    /**
     * Running jobs assigned to a worker
     *
     * @param[in] worker_id Worker id
     * @return Number of Running jobs whose assigned worker is worker_id
     */
    [[nodiscard]] std::size_t occupancy(std::string_view worker_id) const;

    /**
     * Check if a worker has at least one free slot
     *
     * @param[in] worker Worker to check
     * @return true if occupancy is below the slot count
     */
    [[nodiscard]] bool has_free_slot(const Worker &worker) const;

private:
    const IDurableStore &store_;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_RESOURCE_REGISTRY_HPP
