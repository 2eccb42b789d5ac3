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
 * @file dispatch_sample.cpp
 * @brief Job dispatch demonstration application
 *
 * Registers a set of workers, submits jobs through the job service and
 * reports the final state of every job.
 */

#include <charconv>     // for from_chars
#include <chrono>       // for milliseconds
#include <cstdint>      // for uint16_t, uint32_t
#include <cstdlib>      // for EXIT_SUCCESS, EXIT_FAILURE
#include <exception>    // for exception
#include <format>       // for format
#include <iostream>     // for cerr
#include <memory>       // for unique_ptr, make_unique
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for errc
#include <thread>       // for this_thread::sleep_for
#include <vector>       // for vector

#include <tl/expected.hpp> // for expected, unexpected

#include <CLI/CLI.hpp> // for App, Range, ParseError

#include <wise_enum.h> // for from_string

#include "internal_use_only/config.hpp"      // for project_name, project_version
#include "log/components.hpp"                // for register_component
#include "log/dispatch_log.hpp"              // for Logger, LogLevel
#include "log/dispatch_log_macros.hpp"       // for GPUD_LOG_INFO, GPUD_LOG_ERROR
#include "scheduler/allocator.hpp"           // for Allocator
#include "scheduler/availability_prober.hpp" // for TcpConnectProber, CallbackProber
#include "scheduler/execution_engine.hpp"    // for ExecutionEngine
#include "scheduler/in_memory_store.hpp"     // for InMemoryStore
#include "scheduler/job_routines.hpp"        // for register_default_routines
#include "scheduler/job_service.hpp"         // for JobService
#include "scheduler/resource_registry.hpp"   // for ResourceRegistry
#include "scheduler/scheduler_log.hpp"       // for SchedulerComponent
#include "scheduler/state_reconciler.hpp"    // for StateReconciler
#include "scheduler/task_supervisor.hpp"     // for TaskSupervisor
#include "scheduler/worker_monitor.hpp"      // for WorkerMonitor
#include "task/task_log.hpp"                 // for TaskLog

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

namespace {
namespace gs = gpudispatch::scheduler;
namespace gl = gpudispatch::log;

struct AppConfig {
    std::vector<std::string> workers{"gpu-a@127.0.0.1:22/2", "gpu-b@127.0.0.1:22/1"};
    std::vector<std::string> jobs{"training:20", "inference:10", "data_processing:5", "staged"};
    std::string user{"demo"};
    std::string log_level{"Info"};
    int probe_timeout_ms{500};
    int retry_interval_ms{200};
    int monitor_interval_ms{1000};
    int step_ms{20};
    int wait_s{60};
    bool tcp_probe{false};
};

/**
 * Setup logging
 *
 * @param[in] level Global and component threshold
 */
void setup_logging(const gl::LogLevel level) {
    gl::Logger::set_level(level);
    gl::register_component<gs::SchedulerComponent>(level);
    gl::register_component<gpudispatch::task::TaskLog>(level);
}

tl::expected<int, std::string> parse_int(std::string_view text, std::string_view what) {
    int value{};
    const auto *const end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value <= 0) {
        return tl::unexpected(std::format("Invalid {} '{}'", what, text));
    }
    return value;
}

/**
 * Parse a worker description
 *
 * @param[in] text id@host:port[/slots]
 * @return Worker record or error message
 */
tl::expected<gs::Worker, std::string> parse_worker(std::string_view text) {
    const auto at = text.find('@');
    const auto colon = text.rfind(':');
    if (at == std::string_view::npos || at == 0 || colon == std::string_view::npos || colon < at) {
        return tl::unexpected(std::format("Worker '{}' must look like id@host:port[/slots]", text));
    }

    gs::Worker worker{};
    worker.id = std::string{text.substr(0, at)};
    worker.name = worker.id;
    worker.host = std::string{text.substr(at + 1, colon - at - 1)};

    auto port_text = text.substr(colon + 1);
    const auto slash = port_text.find('/');
    if (slash != std::string_view::npos) {
        const auto slots = parse_int(port_text.substr(slash + 1), "slot count");
        if (!slots) {
            return tl::unexpected(slots.error());
        }
        worker.slot_count = static_cast<std::uint32_t>(*slots);
        port_text = port_text.substr(0, slash);
    }
    const auto port = parse_int(port_text, "port");
    if (!port || *port > 65535) {
        return tl::unexpected(std::format("Invalid port in worker '{}'", text));
    }
    worker.port = static_cast<std::uint16_t>(*port);
    return worker;
}

/**
 * Parse a job description
 *
 * @param[in] text type[:steps]
 * @param[in] step_ms Step duration applied to every job
 * @return Job request or error message
 */
tl::expected<gs::JobRequest, std::string> parse_job(std::string_view text, const int step_ms) {
    gs::JobRequest request{};
    const auto colon = text.find(':');
    request.job_type = std::string{text.substr(0, colon)};
    request.title = std::format("{} demo", request.job_type);
    if (colon != std::string_view::npos) {
        const auto steps = parse_int(text.substr(colon + 1), "step count");
        if (!steps) {
            return tl::unexpected(steps.error());
        }
        request.config[std::string{gs::TOTAL_STEPS_KEY}] = std::to_string(*steps);
    }
    request.config[std::string{gs::STEP_DURATION_KEY}] = std::to_string(step_ms);
    return request;
}

/**
 * Parse command line arguments
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return Parsed configuration on success, empty string if --help or --version shown, error message
 * on failure
 */
tl::expected<AppConfig, std::string> parse_arguments(const int argc, const char **argv) {
    CLI::App app{std::format(
            "GPU Job Dispatch Demo - {} version {}",
            gpudispatch::cmake::project_name,
            gpudispatch::cmake::project_version)};

    AppConfig config{};
    app.add_option("-w,--worker", config.workers, "Worker as id@host:port[/slots]")
            ->capture_default_str();
    app.add_option("-j,--job", config.jobs, "Job as type[:steps]")->capture_default_str();
    app.add_option("-u,--user", config.user, "Owner of the submitted jobs");
    app.add_option("-l,--log-level", config.log_level, "TraceL1, Debug, Info, Notice, Warn, Error");
    app.add_option("--probe-timeout-ms", config.probe_timeout_ms, "Reachability timeout")
            ->check(CLI::Range(1, 60000));
    app.add_option("--retry-ms", config.retry_interval_ms, "Backlog retry interval")
            ->check(CLI::Range(10, 60000));
    app.add_option("--monitor-ms", config.monitor_interval_ms, "Worker sweep interval")
            ->check(CLI::Range(10, 3600000));
    app.add_option("--step-ms", config.step_ms, "Duration of one routine step")
            ->check(CLI::Range(1, 10000));
    app.add_option("--wait-s", config.wait_s, "Maximum time to wait for all jobs")
            ->check(CLI::Range(1, 3600));
    app.add_flag("--tcp-probe", config.tcp_probe, "Probe workers with TCP connects");
    app.set_config("--config", "", "Read options from an INI or TOML file");

    app.set_version_flag(
            "--version",
            std::string{gpudispatch::cmake::project_version},
            "Show version information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        const int exit_code = app.exit(e);
        if (exit_code == 0) {
            return tl::unexpected("");
        }
        return tl::unexpected(std::format("Argument parsing failed: {}", e.what()));
    }
    return config;
}

/**
 * Run the dispatch demo
 *
 * @param[in] config Parsed configuration
 * @return EXIT_SUCCESS when every job reached a terminal state
 */
int run(const AppConfig &config) {
    using namespace std::chrono_literals;

    gs::InMemoryStore store;
    for (const auto &text : config.workers) {
        const auto worker = parse_worker(text);
        if (!worker) {
            GPUD_LOG_ERROR("{}", worker.error());
            return EXIT_FAILURE;
        }
        if (const auto ec = store.upsert_worker(*worker); ec) {
            GPUD_LOG_ERROR("Cannot register worker '{}': {}", worker->id, ec.message());
            return EXIT_FAILURE;
        }
    }

    const gs::ProberConfig prober_config{.timeout = std::chrono::milliseconds{config.probe_timeout_ms}};
    if (const auto ec = prober_config.validate(); ec) {
        GPUD_LOG_ERROR("Invalid probe timeout: {}", ec.message());
        return EXIT_FAILURE;
    }
    std::unique_ptr<gs::IAvailabilityProber> prober;
    if (config.tcp_probe) {
        prober = std::make_unique<gs::TcpConnectProber>(prober_config.timeout);
    } else {
        // Simulated cluster: every worker answers
        prober = std::make_unique<gs::CallbackProber>(
                [](const gs::Worker &, std::chrono::milliseconds) { return true; },
                prober_config.timeout);
    }

    gs::ResourceRegistry registry{store};
    gs::Allocator allocator{store, registry, *prober};
    gs::ExecutionEngine engine;
    gs::register_default_routines(engine.routines());
    gs::StateReconciler reconciler{store};
    gs::TaskSupervisor supervisor{
            store,
            reconciler,
            allocator,
            engine,
            gs::SupervisorConfig{
                    .backlog_retry_interval = std::chrono::milliseconds{config.retry_interval_ms}}};
    gs::JobService service{store, reconciler, supervisor};
    gs::WorkerMonitor monitor{
            store,
            *prober,
            gs::MonitorConfig{.sweep_interval = std::chrono::milliseconds{config.monitor_interval_ms}}};
    monitor.set_capacity_listener([&supervisor] { supervisor.notify_capacity_changed(); });
    if (const auto ec = monitor.start(); ec) {
        GPUD_LOG_ERROR("Failed to start worker monitor: {}", ec.message());
        return EXIT_FAILURE;
    }

    std::vector<std::string> job_ids;
    for (const auto &text : config.jobs) {
        const auto request = parse_job(text, config.step_ms);
        if (!request) {
            GPUD_LOG_ERROR("{}", request.error());
            continue;
        }
        const auto job = service.create_job(config.user, *request);
        if (!job) {
            GPUD_LOG_ERROR("Job '{}' rejected: {}", text, job.error().message());
            continue;
        }
        job_ids.push_back(job->id);
    }

    const auto all_terminal = [&] {
        for (const auto &id : job_ids) {
            const auto job = service.get_job(id, config.user);
            if (job && !gs::is_terminal(job->status)) {
                return false;
            }
        }
        return true;
    };
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{config.wait_s};
    while (!all_terminal() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
    }
    const bool finished = all_terminal();

    monitor.stop();
    service.stop_all(gs::ShutdownBehavior::CancelActiveJobs);

    for (const auto &job : service.list_jobs(config.user)) {
        GPUD_LOG_INFO("{}", job);
        if (job.error_message.has_value()) {
            GPUD_LOG_INFO("  error: {}", *job.error_message);
        }
    }
    if (!finished) {
        GPUD_LOG_ERROR("Jobs still running after {}s, cancelled", config.wait_s);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace

/**
 * Main application entry point
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return EXIT_SUCCESS on successful completion, EXIT_FAILURE on error
 */
int main(int argc, const char **argv) {
    try {
        const auto config = parse_arguments(argc, argv);
        if (!config.has_value()) {
            if (!config.error().empty()) {
                std::cerr << config.error() << '\n';
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        const auto level = ::wise_enum::from_string<gl::LogLevel>(config->log_level);
        if (!level) {
            std::cerr << std::format("Unknown log level '{}'\n", config->log_level);
            return EXIT_FAILURE;
        }
        setup_logging(*level);

        GPUD_LOG_INFO(
                "Dispatch demo: {} workers, {} jobs, user '{}'",
                config->workers.size(),
                config->jobs.size(),
                config->user);
        const int status = run(*config);
        gl::Logger::flush();
        return status;
    } catch (const std::exception &e) {
        std::cerr << std::format("Unhandled exception: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (...) {
        std::cerr << "Unknown exception occurred\n";
        return EXIT_FAILURE;
    }
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
