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

#include <algorithm>   // for stable_sort
#include <cstddef>     // for size_t
#include <string_view> // for string_view
#include <vector>      // for vector

#include "scheduler/resource_registry.hpp"

namespace gpudispatch::scheduler {

std::vector<Worker> ResourceRegistry::list_active_workers() const {
    auto workers = store_.list_active_workers();
    std::stable_sort(workers.begin(), workers.end(), [](const Worker &lhs, const Worker &rhs) {
        const auto lhs_created = lhs.created_at.value_or(TimePoint::min());
        const auto rhs_created = rhs.created_at.value_or(TimePoint::min());
        if (lhs_created != rhs_created) {
            return lhs_created < rhs_created;
        }
        return lhs.registration_seq < rhs.registration_seq;
    });
    return workers;
}

std::size_t ResourceRegistry::occupancy(std::string_view worker_id) const {
    return store_.count_running_on_worker(worker_id);
}

bool ResourceRegistry::has_free_slot(const Worker &worker) const {
    return occupancy(worker.id) < worker.slot_count;
}

} // namespace gpudispatch::scheduler
