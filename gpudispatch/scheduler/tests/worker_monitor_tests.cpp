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

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include "scheduler/availability_prober.hpp"
#include "scheduler/in_memory_store.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/worker_monitor.hpp"
#include "scheduler_test_utils.hpp"
#include "task/task_errors.hpp"
#include "task/time.hpp"

namespace {
namespace gs = gpudispatch::scheduler;
namespace gst = gpudispatch::scheduler::test;
namespace gt = gpudispatch::task;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

class WorkerMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(store.upsert_worker(gst::make_worker("w1")));
        ASSERT_FALSE(store.upsert_worker(gst::make_worker("w2")));
    }

    [[nodiscard]] gs::WorkerStatus status(const std::string &id) const {
        return store.find_worker(id)->status;
    }

    gs::InMemoryStore store;
    gst::ScriptedProber prober{true};
    gs::WorkerMonitor monitor{store, prober, gs::MonitorConfig{.sweep_interval = 10ms}};
};

TEST_F(WorkerMonitorTest, PingRecordsStatusAndProbeTime) {
    prober.set_answer("w2", false);

    const auto up = monitor.ping_worker("w1");
    ASSERT_TRUE(up.has_value());
    EXPECT_TRUE(*up);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Online);
    EXPECT_TRUE(store.find_worker("w1")->last_probed.has_value());

    const auto down = monitor.ping_worker("w2");
    ASSERT_TRUE(down.has_value());
    EXPECT_FALSE(*down);
    EXPECT_EQ(status("w2"), gs::WorkerStatus::Offline);

    const auto missing = monitor.ping_worker("w9");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), gs::SchedulerErrc::WorkerNotFound);
}

TEST_F(WorkerMonitorTest, PingKeepsMaintenanceStatus) {
    ASSERT_FALSE(monitor.schedule_maintenance("w1"));
    const auto reachable = monitor.ping_worker("w1");
    ASSERT_TRUE(reachable.has_value());
    EXPECT_TRUE(*reachable);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Maintenance);
    EXPECT_TRUE(store.find_worker("w1")->last_probed.has_value());
}

TEST_F(WorkerMonitorTest, SweepProbesActiveWorkersOutsideMaintenance) {
    auto retired = gst::make_worker("w3");
    retired.active = false;
    ASSERT_FALSE(store.upsert_worker(retired));
    ASSERT_FALSE(monitor.schedule_maintenance("w2"));
    prober.set_answer("w1", false);

    EXPECT_EQ(monitor.sweep(), 0U);
    EXPECT_EQ(prober.probed(), std::vector<std::string>{"w1"});
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Offline);
    EXPECT_EQ(status("w2"), gs::WorkerStatus::Maintenance);

    prober.set_answer("w1", true);
    EXPECT_EQ(monitor.sweep(), 1U);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Online);
}

TEST_F(WorkerMonitorTest, MaintenanceWindowExpires) {
    ASSERT_FALSE(monitor.schedule_maintenance("w1", std::chrono::seconds{30}));
    const auto until = monitor.maintenance_until("w1");
    ASSERT_TRUE(until.has_value());
    EXPECT_FALSE(monitor.maintenance_until("w2").has_value());

    EXPECT_EQ(monitor.end_expired_maintenance(gt::Time::now()), 0U);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Maintenance);

    EXPECT_EQ(monitor.end_expired_maintenance(*until + 1s), 1U);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Online);
    EXPECT_FALSE(monitor.maintenance_until("w1").has_value());
}

TEST_F(WorkerMonitorTest, ManualStatusChangeWinsOverExpiry) {
    ASSERT_FALSE(monitor.schedule_maintenance("w1", std::chrono::seconds{1}));
    ASSERT_FALSE(store.update_worker_status("w1", gs::WorkerStatus::Offline, std::nullopt));
    const auto until = monitor.maintenance_until("w1");
    ASSERT_TRUE(until.has_value());

    EXPECT_EQ(monitor.end_expired_maintenance(*until + 1s), 0U);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Offline);
}

TEST_F(WorkerMonitorTest, MaintenanceRejectsBadInput) {
    EXPECT_EQ(monitor.schedule_maintenance("w9"), gs::SchedulerErrc::WorkerNotFound);
    EXPECT_EQ(
            monitor.schedule_maintenance("w1", std::chrono::seconds{0}),
            gs::SchedulerErrc::InvalidParameter);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Online);
}

TEST_F(WorkerMonitorTest, CapacityListenerFiresWhenWorkersAreOnline) {
    std::atomic<int> notifications{0};
    monitor.set_capacity_listener([&notifications]() { ++notifications; });

    prober.set_answer("w1", false);
    prober.set_answer("w2", false);
    std::ignore = monitor.sweep();
    EXPECT_EQ(notifications.load(), 0);

    prober.set_answer("w2", true);
    std::ignore = monitor.sweep();
    EXPECT_EQ(notifications.load(), 1);

    ASSERT_FALSE(monitor.schedule_maintenance("w1", std::chrono::seconds{5}));
    std::ignore = monitor.end_expired_maintenance(gt::Time::now() + 10s);
    EXPECT_EQ(notifications.load(), 2);
    monitor.set_capacity_listener({});
}

TEST_F(WorkerMonitorTest, ThrowingListenerDoesNotBreakSweep) {
    monitor.set_capacity_listener([]() { throw std::runtime_error("listener failed"); });
    EXPECT_EQ(monitor.sweep(), 2U);
    EXPECT_EQ(status("w1"), gs::WorkerStatus::Online);
}

TEST_F(WorkerMonitorTest, PeriodicSweepsRunUntilStopped) {
    EXPECT_FALSE(monitor.is_running());
    ASSERT_FALSE(monitor.start());
    EXPECT_TRUE(monitor.is_running());
    EXPECT_EQ(monitor.start(), gt::TaskErrc::AlreadyRunning);

    EXPECT_TRUE(gst::wait_until([this]() { return prober.probe_count("w1") >= 3; }));

    monitor.stop();
    EXPECT_FALSE(monitor.is_running());
    const auto count = prober.probe_count("w1");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(prober.probe_count("w1"), count);

    monitor.stop();
    ASSERT_FALSE(monitor.start());
    monitor.stop();
}

TEST(WorkerMonitorMaintenance, WindowOpenedWhileCheckingIsKept) {
    gs::InMemoryStore store;
    ASSERT_FALSE(store.upsert_worker(gst::make_worker("w1")));
    ASSERT_FALSE(store.upsert_worker(gst::make_worker("w2")));
    // Operator takes w1 down for maintenance while it is being checked
    gs::CallbackProber prober{[&store](const gs::Worker &worker, std::chrono::milliseconds) {
        if (worker.id == "w1") {
            EXPECT_FALSE(store.update_worker_status(
                    worker.id, gs::WorkerStatus::Maintenance, std::nullopt));
        }
        return true;
    }};
    gs::WorkerMonitor monitor{store, prober};

    EXPECT_EQ(monitor.sweep(), 1U);
    const auto w1 = store.find_worker("w1");
    ASSERT_TRUE(w1.has_value());
    EXPECT_EQ(w1->status, gs::WorkerStatus::Maintenance);
    EXPECT_TRUE(w1->last_probed.has_value());
    EXPECT_EQ(store.find_worker("w2")->status, gs::WorkerStatus::Online);

    ASSERT_FALSE(store.update_worker_status("w1", gs::WorkerStatus::Online, std::nullopt));
    const auto reachable = monitor.ping_worker("w1");
    ASSERT_TRUE(reachable.has_value());
    EXPECT_TRUE(*reachable);
    EXPECT_EQ(store.find_worker("w1")->status, gs::WorkerStatus::Maintenance);
}

TEST(WorkerMonitorConfig, RejectsNonPositiveValues) {
    gs::InMemoryStore store;
    gst::ScriptedProber prober;
    EXPECT_FALSE(gs::MonitorConfig{}.validate());
    EXPECT_EQ(
            gs::MonitorConfig{.sweep_interval = 0ms}.validate(), gs::SchedulerErrc::InvalidParameter);
    EXPECT_THROW(
            gs::WorkerMonitor(store, prober, gs::MonitorConfig{.default_maintenance_window = 0s}),
            std::invalid_argument);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
