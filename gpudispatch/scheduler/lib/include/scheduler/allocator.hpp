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
 * @file allocator.hpp
 * @brief First-fit worker selection
 */

#ifndef GPUDISPATCH_SCHEDULER_ALLOCATOR_HPP
#define GPUDISPATCH_SCHEDULER_ALLOCATOR_HPP

#include <optional>

#include "scheduler/iavailability_prober.hpp"
#include "scheduler/idurable_store.hpp"
#include "scheduler/resource_registry.hpp"
#include "scheduler/worker.hpp"

namespace gpudispatch::scheduler {

/**
 * Allocator
 *
 * Picks the first active worker, in registration order, that is not in
 * maintenance, has a free slot and answers a probe. Capacity is checked
 * before probing so a full worker costs no network round trip. Every probe
 * outcome is persisted as Online or Offline together with the probe time.
 *
 * Selection does not reserve a slot. The slot is claimed when the
 * supervisor writes the job as Running on the returned worker.
 */
class Allocator final {
public:
    /**
     * Create an allocator
     *
     * @param[in] store Store receiving probe outcomes
     * @param[in] registry Worker listing and occupancy
     * @param[in] prober Reachability check
     */
    Allocator(IDurableStore &store, const ResourceRegistry &registry, IAvailabilityProber &prober)
            : store_(store), registry_(registry), prober_(prober) {}

    /**
     * Select a worker for one job
     *
     * @return The selected worker with its refreshed status, or std::nullopt
     *         when no worker is available
     */
    [[nodiscard]] std::optional<Worker> select_worker();

private:
    void record_probe(Worker &worker, bool reachable);

    IDurableStore &store_;
    const ResourceRegistry &registry_;
    IAvailabilityProber &prober_;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_ALLOCATOR_HPP
