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

#include <chrono>       // for milliseconds, duration_cast
#include <exception>    // for exception
#include <future>       // for promise, future, future_status
#include <memory>       // for unique_ptr
#include <optional>     // for optional
#include <string>       // for string, to_string
#include <system_error> // for error_code
#include <thread>       // for thread
#include <utility>      // for move

#include <netdb.h>      // for addrinfo, getaddrinfo, freeaddrinfo, gai_strerror, EAI_*
#include <poll.h>       // for poll, pollfd, POLLOUT
#include <sys/socket.h> // for socket, connect, getsockopt
#include <unistd.h>     // for close

#include <cerrno> // for errno, EINPROGRESS, EINTR

#include "log/dispatch_log_macros.hpp"
#include "scheduler/availability_prober.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/scheduler_log.hpp"
#include "task/time.hpp"

namespace gpudispatch::scheduler {

namespace {

/// Socket descriptor closed on scope exit
class ScopedFd final {
public:
    explicit ScopedFd(const int fd) noexcept : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;
    ScopedFd(ScopedFd &&) = delete;
    ScopedFd &operator=(ScopedFd &&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

/// Address list released with freeaddrinfo
using AddressList = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

/// Result of one name lookup
struct Lookup final {
    int rc{EAI_FAIL};
    AddressList addresses{nullptr, &::freeaddrinfo};
};

addrinfo stream_hints(const int flags) noexcept {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = flags;
    return hints;
}

/**
 * Run a name lookup on a helper thread and wait at most until the deadline
 *
 * The helper thread owns the lookup state, so an abandoned lookup finishes
 * and frees its result on its own.
 *
 * @param[in] resolver Lookup function
 * @param[in] host Host name
 * @param[in] port Numeric port
 * @param[in] budget Time allowed for the lookup
 * @return Lookup result, or std::nullopt if the budget ran out first
 */
std::optional<Lookup> resolve_within(
        const TcpConnectProber::NameResolver &resolver,
        const std::string &host,
        const std::string &port,
        const std::chrono::milliseconds budget) {
    std::promise<Lookup> promise;
    auto pending = promise.get_future();
    std::thread([resolver, host, port, promise = std::move(promise)]() mutable {
        const auto hints = stream_hints(AI_NUMERICSERV);
        addrinfo *raw_addresses = nullptr;
        Lookup lookup{};
        try {
            lookup.rc = resolver(host, port, hints, &raw_addresses);
        } catch (const std::exception &e) {
            GPUD_LOGC_WARN(SchedulerComponent::Prober, "Resolver for host '{}' threw: {}", host, e.what());
            lookup.rc = EAI_FAIL;
        } catch (...) {
            GPUD_LOGC_WARN(SchedulerComponent::Prober, "Resolver for host '{}' threw", host);
            lookup.rc = EAI_FAIL;
        }
        if (lookup.rc == 0) {
            lookup.addresses.reset(raw_addresses);
        }
        promise.set_value(std::move(lookup));
    }).detach();

    if (pending.wait_for(budget) != std::future_status::ready) {
        return std::nullopt;
    }
    return pending.get();
}

/**
 * Connect to one resolved address within a time budget
 *
 * @param[in] address Resolved address
 * @param[in] budget Remaining time
 * @return true if the connection was established
 */
bool try_connect(const addrinfo &address, const std::chrono::milliseconds budget) {
    const ScopedFd socket_fd{::socket(
            address.ai_family,
            address.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
            address.ai_protocol)};
    if (!socket_fd.valid()) {
        return false;
    }

    if (::connect(socket_fd.get(), address.ai_addr, address.ai_addrlen) == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    pollfd pfd{};
    pfd.fd = socket_fd.get();
    pfd.events = POLLOUT;
    int ready = 0;
    do {
        ready = ::poll(&pfd, 1, static_cast<int>(budget.count()));
    } while (ready < 0 && errno == EINTR);
    if (ready <= 0) {
        return false;
    }

    int socket_error = 0;
    socklen_t length = sizeof(socket_error);
    if (::getsockopt(socket_fd.get(), SOL_SOCKET, SO_ERROR, &socket_error, &length) != 0) {
        return false;
    }
    return socket_error == 0;
}

} // namespace

std::error_code ProberConfig::validate() const noexcept {
    if (timeout.count() <= 0) {
        return SchedulerErrc::InvalidParameter;
    }
    return SchedulerErrc::Success;
}

TcpConnectProber::NameResolver TcpConnectProber::system_resolver() {
    return [](const std::string &host,
              const std::string &port,
              const addrinfo &hints,
              addrinfo **result) { return ::getaddrinfo(host.c_str(), port.c_str(), &hints, result); };
}

bool TcpConnectProber::probe(const Worker &worker) noexcept {
    try {
        const auto deadline = task::Time::steady_now() + timeout_;
        const std::string port = std::to_string(worker.port);

        Lookup lookup{};
        {
            const auto hints = stream_hints(AI_NUMERICSERV | AI_NUMERICHOST);
            addrinfo *raw_addresses = nullptr;
            lookup.rc = ::getaddrinfo(worker.host.c_str(), port.c_str(), &hints, &raw_addresses);
            if (lookup.rc == 0) {
                lookup.addresses.reset(raw_addresses);
            }
        }
        if (lookup.rc == EAI_NONAME && resolver_) {
            const auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - task::Time::steady_now());
            auto resolved = resolve_within(resolver_, worker.host, port, budget);
            if (!resolved.has_value()) {
                GPUD_LOGEC_WARN(
                        SchedulerComponent::Prober,
                        SchedulerErrorEvent::ProbeFailed,
                        "Resolving worker '{}' host '{}' took longer than {}ms",
                        worker.id,
                        worker.host,
                        timeout_.count());
                return false;
            }
            lookup = std::move(*resolved);
        }
        if (lookup.rc != 0) {
            GPUD_LOGEC_WARN(
                    SchedulerComponent::Prober,
                    SchedulerErrorEvent::ProbeFailed,
                    "Cannot resolve worker '{}' host '{}': {}",
                    worker.id,
                    worker.host,
                    ::gai_strerror(lookup.rc));
            return false;
        }

        for (const addrinfo *address = lookup.addresses.get(); address != nullptr;
             address = address->ai_next) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - task::Time::steady_now());
            if (remaining.count() <= 0) {
                break;
            }
            if (try_connect(*address, remaining)) {
                GPUD_LOGC_DEBUG(
                        SchedulerComponent::Prober, "Worker '{}' reachable", worker.address());
                return true;
            }
        }

        GPUD_LOGEC_INFO(
                SchedulerComponent::Prober,
                SchedulerErrorEvent::ProbeFailed,
                "Worker '{}' at {} unreachable within {}ms",
                worker.id,
                worker.address(),
                timeout_.count());
        return false;
    } catch (const std::exception &e) {
        GPUD_LOGEC_ERROR(
                SchedulerComponent::Prober,
                SchedulerErrorEvent::ProbeFailed,
                "Probe of worker '{}' failed: {}",
                worker.id,
                e.what());
        return false;
    } catch (...) {
        GPUD_LOGEC_ERROR(
                SchedulerComponent::Prober,
                SchedulerErrorEvent::ProbeFailed,
                "Probe of worker '{}' failed: unknown exception",
                worker.id);
        return false;
    }
}

bool CallbackProber::probe(const Worker &worker) noexcept {
    if (!function_) {
        return false;
    }
    try {
        return function_(worker, timeout_);
    } catch (const std::exception &e) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Prober,
                SchedulerErrorEvent::ProbeFailed,
                "Probe callback for worker '{}' threw: {}",
                worker.id,
                e.what());
        return false;
    } catch (...) {
        GPUD_LOGEC_WARN(
                SchedulerComponent::Prober,
                SchedulerErrorEvent::ProbeFailed,
                "Probe callback for worker '{}' threw a non-standard exception",
                worker.id);
        return false;
    }
}

} // namespace gpudispatch::scheduler
