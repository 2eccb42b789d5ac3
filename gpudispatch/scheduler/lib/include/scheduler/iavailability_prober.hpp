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

#ifndef GPUDISPATCH_SCHEDULER_IAVAILABILITY_PROBER_HPP
#define GPUDISPATCH_SCHEDULER_IAVAILABILITY_PROBER_HPP

#include <chrono>
#include <system_error>

#include "scheduler/worker.hpp"

namespace gpudispatch::scheduler {

/// Probe timeout used when none is configured
inline constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{std::chrono::seconds{10}};

/**
 * Prober configuration
 */
struct ProberConfig final {
    std::chrono::milliseconds timeout{DEFAULT_PROBE_TIMEOUT}; //!< Bound on one probe

    /**
     * Check the configuration
     * @return SchedulerErrc::InvalidParameter for a non-positive timeout
     */
    [[nodiscard]] std::error_code validate() const noexcept;
};

/**
 * @class IAvailabilityProber
 * @brief Reachability predicate for a worker.
 *
 * A probe answers whether the worker can take work right now. It never
 * writes worker status; the caller persists the outcome. Implementations
 * must return within their timeout and report every failure, including
 * timeouts and resolution errors, as false.
 */
class IAvailabilityProber {
public:
    IAvailabilityProber() = default;
    virtual ~IAvailabilityProber() = default;
    IAvailabilityProber(IAvailabilityProber &&) = default;
    IAvailabilityProber &operator=(IAvailabilityProber &&) = default;
    IAvailabilityProber(const IAvailabilityProber &) = delete;
    IAvailabilityProber &operator=(const IAvailabilityProber &) = delete;

    /**
     * Check whether a worker is reachable.
     *
     * @param[in] worker Worker to probe
     * @return true if the worker answered within the timeout
     */
    [[nodiscard]] virtual bool probe(const Worker &worker) noexcept = 0;

    /**
     * Upper bound on the duration of one probe.
     *
     * @return Probe timeout
     */
    [[nodiscard]] virtual std::chrono::milliseconds timeout() const noexcept = 0;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_IAVAILABILITY_PROBER_HPP
