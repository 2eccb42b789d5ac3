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
 * @file availability_prober.hpp
 * @brief Concrete availability probers
 *
 * TcpConnectProber opens and closes a TCP connection to the worker's
 * address. CallbackProber adapts any callable, which is how tests and
 * deployments with a custom health check plug in.
 */

#ifndef GPUDISPATCH_SCHEDULER_AVAILABILITY_PROBER_HPP
#define GPUDISPATCH_SCHEDULER_AVAILABILITY_PROBER_HPP

#include <chrono>
#include <functional>
#include <string>
#include <utility>

#include <netdb.h>

#include "scheduler/iavailability_prober.hpp"
#include "scheduler/worker.hpp"

namespace gpudispatch::scheduler {

/**
 * Probe by TCP connect to host:port
 *
 * Every resolved address is tried in order until one accepts or the
 * timeout budget is spent. Numeric hosts are parsed in place. Host names
 * are looked up on a helper thread and count against the same budget; a
 * lookup still running at the deadline is abandoned and the worker is
 * reported unreachable.
 */
class TcpConnectProber final : public IAvailabilityProber {
public:
    /// Name lookup with getaddrinfo() semantics
    using NameResolver = std::function<int(
            const std::string &host, const std::string &port, const addrinfo &hints, addrinfo **result)>;

    /**
     * Create a TCP prober
     * @param[in] timeout Total budget per probe, name lookup included
     * @param[in] resolver Lookup used for non-numeric hosts
     */
    explicit TcpConnectProber(
            std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT,
            NameResolver resolver = system_resolver())
            : timeout_(timeout), resolver_(std::move(resolver)) {}

    [[nodiscard]] bool probe(const Worker &worker) noexcept override;
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept override { return timeout_; }

    /// Resolver backed by ::getaddrinfo
    [[nodiscard]] static NameResolver system_resolver();

private:
    std::chrono::milliseconds timeout_;
    NameResolver resolver_;
};

/**
 * Probe through a user supplied function
 *
 * The function receives the worker and the timeout it is expected to
 * honor. An exception thrown by the function counts as an unreachable
 * worker.
 */
class CallbackProber final : public IAvailabilityProber {
public:
    /// Check signature: worker and timeout budget
    using ProbeFunction = std::function<bool(const Worker &, std::chrono::milliseconds)>;

    /**
     * Create a callback prober
     * @param[in] function Reachability check
     * @param[in] timeout Budget passed to the function
     */
    explicit CallbackProber(
            ProbeFunction function, std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT)
            : function_(std::move(function)), timeout_(timeout) {}

    [[nodiscard]] bool probe(const Worker &worker) noexcept override;
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept override { return timeout_; }

private:
    ProbeFunction function_;
    std::chrono::milliseconds timeout_;
};

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_AVAILABILITY_PROBER_HPP
