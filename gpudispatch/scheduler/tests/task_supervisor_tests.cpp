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
 * @file task_supervisor_tests.cpp
 * @brief Scheduling, cancellation and shutdown tests for TaskSupervisor
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "scheduler/allocator.hpp"
#include "scheduler/execution_engine.hpp"
#include "scheduler/idurable_store.hpp"
#include "scheduler/in_memory_store.hpp"
#include "scheduler/job.hpp"
#include "scheduler/job_routines.hpp"
#include "scheduler/resource_registry.hpp"
#include "scheduler/scheduler_errors.hpp"
#include "scheduler/state_reconciler.hpp"
#include "scheduler/task_supervisor.hpp"
#include "scheduler_test_utils.hpp"

namespace {
namespace gs = gpudispatch::scheduler;
namespace gst = gpudispatch::scheduler::test;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

/// Store wrapper that can stall the writer right after a job reaches a final state
class TerminalWriteHold final : public gs::IDurableStore {
public:
    explicit TerminalWriteHold(gs::IDurableStore &inner) noexcept : inner_(inner) {}

    void arm() noexcept { armed_.store(true); }
    void release() noexcept { released_.store(true); }
    [[nodiscard]] bool holding() const noexcept { return holding_.load(); }

    [[nodiscard]] std::error_code insert_job(const gs::Job &job) override {
        return inner_.insert_job(job);
    }

    [[nodiscard]] std::optional<gs::Job> find_job(std::string_view job_id) const override {
        return inner_.find_job(job_id);
    }

    [[nodiscard]] std::optional<gs::Job>
    find_job_for_user(std::string_view job_id, std::string_view user_id) const override {
        return inner_.find_job_for_user(job_id, user_id);
    }

    [[nodiscard]] std::vector<gs::Job> list_jobs(const gs::JobFilter &filter) const override {
        return inner_.list_jobs(filter);
    }

    [[nodiscard]] std::error_code
    update_job(std::string_view job_id, const gs::JobMutator &mutator) override {
        const auto ec = inner_.update_job(job_id, mutator);
        if (ec || !armed_.load()) {
            return ec;
        }
        const auto job = inner_.find_job(job_id);
        if (job.has_value() && gs::is_terminal(job->status) && armed_.exchange(false)) {
            holding_.store(true);
            while (!released_.load()) {
                std::this_thread::sleep_for(1ms);
            }
            holding_.store(false);
        }
        return ec;
    }

    [[nodiscard]] std::error_code
    erase_job(std::string_view job_id, const gs::JobGuard &guard) override {
        return inner_.erase_job(job_id, guard);
    }

    [[nodiscard]] std::size_t count_running_on_worker(std::string_view worker_id) const override {
        return inner_.count_running_on_worker(worker_id);
    }

    [[nodiscard]] std::size_t count_running_for_user(std::string_view user_id) const override {
        return inner_.count_running_for_user(user_id);
    }

    [[nodiscard]] std::error_code upsert_worker(const gs::Worker &worker) override {
        return inner_.upsert_worker(worker);
    }

    [[nodiscard]] std::optional<gs::Worker> find_worker(std::string_view worker_id) const override {
        return inner_.find_worker(worker_id);
    }

    [[nodiscard]] std::vector<gs::Worker> list_workers() const override {
        return inner_.list_workers();
    }

    [[nodiscard]] std::vector<gs::Worker> list_active_workers() const override {
        return inner_.list_active_workers();
    }

    [[nodiscard]] std::error_code update_worker_status(
            std::string_view worker_id,
            const gs::WorkerStatus status,
            const std::optional<gs::TimePoint> last_probed) override {
        return inner_.update_worker_status(worker_id, status, last_probed);
    }

    [[nodiscard]] std::error_code
    update_worker(std::string_view worker_id, const gs::WorkerMutator &mutator) override {
        return inner_.update_worker(worker_id, mutator);
    }

private:
    gs::IDurableStore &inner_;
    std::atomic<bool> armed_{false};
    std::atomic<bool> released_{false};
    std::atomic<bool> holding_{false};
};

class TaskSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        gs::register_default_routines(engine.routines());
        // Ten steps, step 1 blocks on the gate
        ASSERT_FALSE(engine.routines().register_routine(
                "gated",
                std::make_shared<gs::StagedRoutine>(
                        gs::StagedRoutineSpec{.name = "gated", .total_steps = 10},
                        [this](const gs::RoutineContext &context, const std::uint32_t step) {
                            if (step == 1) {
                                gate.wait(context.token);
                            }
                        })));
        ASSERT_FALSE(engine.routines().register_routine(
                "recorder",
                std::make_shared<gs::StagedRoutine>(
                        gs::StagedRoutineSpec{.name = "recorder", .total_steps = 2},
                        [this](const gs::RoutineContext &context, const std::uint32_t step) {
                            if (step == 0) {
                                const std::lock_guard<std::mutex> lock(order_mutex);
                                started_order.push_back(context.job.id);
                            }
                        })));
        ASSERT_FALSE(store.upsert_worker(gst::make_worker("w1")));
        supervisor = std::make_unique<gs::TaskSupervisor>(
                store,
                reconciler,
                allocator,
                engine,
                gs::SupervisorConfig{.backlog_retry_interval = 20ms});
    }

    void TearDown() override {
        write_hold.release();
        gate.open();
        supervisor.reset();
    }

    void add_job(const gs::Job &job) { ASSERT_FALSE(store.insert_job(job)); }

    [[nodiscard]] gs::Job job(const std::string &id) const { return *store.find_job(id); }

    [[nodiscard]] bool wait_for_status(
            const std::string &id, const gs::JobStatus status, const std::chrono::milliseconds timeout = 5s) const {
        return gst::wait_until([&]() { return job(id).status == status; }, timeout);
    }

    gst::Gate gate;
    std::mutex order_mutex;
    std::vector<std::string> started_order;

    gs::InMemoryStore store;
    gs::ResourceRegistry registry{store};
    gst::ScriptedProber prober{true};
    gs::Allocator allocator{store, registry, prober};
    gs::ExecutionEngine engine;
    TerminalWriteHold write_hold{store};
    gs::StateReconciler reconciler{write_hold};
    std::unique_ptr<gs::TaskSupervisor> supervisor;
};

TEST_F(TaskSupervisorTest, SingleSlotJobRunsToCompletion) {
    add_job(gst::make_job("J1", "gated"));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Pending);
    ASSERT_FALSE(supervisor->submit("J1"));

    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));
    EXPECT_EQ(job("J1").assigned_worker, "w1");
    EXPECT_EQ(supervisor->active_job_ids(), std::set<std::string>{"J1"});

    gate.open();
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Completed));
    const auto done = job("J1");
    EXPECT_DOUBLE_EQ(done.progress, 100.0);
    EXPECT_EQ(done.assigned_worker, "w1");
    EXPECT_FALSE(done.error_message.has_value());
    ASSERT_TRUE(done.result.has_value());
    EXPECT_EQ(done.result->at("routine"), "gated");

    EXPECT_TRUE(supervisor->wait_until_idle(2s));
    EXPECT_TRUE(supervisor->active_job_ids().empty());
}

TEST_F(TaskSupervisorTest, SecondJobWaitsForFreeSlot) {
    add_job(gst::make_job("J1", "gated"));
    add_job(gst::make_job("J2", "staged", 5, 1));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));

    ASSERT_FALSE(supervisor->submit("J2"));
    // Several retry intervals pass without capacity
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(job("J2").status, gs::JobStatus::Pending);
    EXPECT_FALSE(job("J2").assigned_worker.has_value());
    EXPECT_EQ(supervisor->backlog_size(), 1U);

    gate.open();
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Completed));
    ASSERT_TRUE(wait_for_status("J2", gs::JobStatus::Completed));
    EXPECT_EQ(job("J2").assigned_worker, "w1");
    EXPECT_EQ(supervisor->backlog_size(), 0U);
}

TEST_F(TaskSupervisorTest, UnknownTypeFailsWithoutClaimingWorker) {
    add_job(gst::make_job("J3", "quantum_annealing"));
    ASSERT_FALSE(supervisor->submit("J3"));

    ASSERT_TRUE(wait_for_status("J3", gs::JobStatus::Failed));
    const auto failed = job("J3");
    ASSERT_TRUE(failed.error_message.has_value());
    EXPECT_FALSE(failed.error_message->empty());
    EXPECT_DOUBLE_EQ(failed.progress, 0.0);
    EXPECT_FALSE(failed.assigned_worker.has_value());
    EXPECT_TRUE(prober.probed().empty());
}

TEST_F(TaskSupervisorTest, CancelRunningJobAfterFirstStep) {
    add_job(gst::make_job("J4", "gated"));
    ASSERT_FALSE(supervisor->submit("J4"));
    ASSERT_TRUE(gst::wait_until([this]() { return job("J4").progress >= 10.0; }));

    EXPECT_TRUE(supervisor->cancel("J4"));
    ASSERT_TRUE(wait_for_status("J4", gs::JobStatus::Cancelled));

    const auto cancelled = job("J4");
    EXPECT_FALSE(cancelled.error_message.has_value());
    EXPECT_LT(cancelled.progress, 100.0);
    EXPECT_FALSE(cancelled.assigned_worker.has_value());
    ASSERT_TRUE(cancelled.result.has_value());
    EXPECT_EQ(cancelled.result->at("steps_completed"), "2");
    EXPECT_TRUE(supervisor->wait_until_idle(2s));
}

TEST_F(TaskSupervisorTest, CancelPendingJobIsImmediate) {
    prober.set_answer("w1", false);
    add_job(gst::make_job("J1"));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(gst::wait_until([this]() { return prober.probe_count("w1") > 0; }));

    EXPECT_FALSE(supervisor->cancel("J1"));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Cancelled);
    EXPECT_FALSE(job("J1").error_message.has_value());
    EXPECT_EQ(supervisor->backlog_size(), 0U);
}

TEST_F(TaskSupervisorTest, CancelTerminalJobHasNoEffect) {
    add_job(gst::make_job("J1", "staged", 2, 1));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Completed));

    EXPECT_FALSE(supervisor->cancel("J1"));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Completed);
    EXPECT_FALSE(supervisor->cancel("missing"));
}

TEST_F(TaskSupervisorTest, DuplicateSubmitKeepsSingleHandle) {
    add_job(gst::make_job("J1", "gated"));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));

    for (int i = 0; i < 5; ++i) {
        const auto ec = supervisor->submit("J1");
        EXPECT_TRUE(!ec || ec == gs::SchedulerErrc::JobNotPending);
        EXPECT_EQ(supervisor->active_job_ids().size(), 1U);
    }
    EXPECT_EQ(supervisor->backlog_size(), 0U);
}

TEST_F(TaskSupervisorTest, SubmitValidatesJob) {
    EXPECT_EQ(supervisor->submit("missing"), gs::SchedulerErrc::JobNotFound);

    add_job(gst::make_job("J1", "staged", 1, 1));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Completed));
    EXPECT_EQ(supervisor->submit("J1"), gs::SchedulerErrc::JobNotPending);
}

TEST_F(TaskSupervisorTest, HigherPriorityStartsFirst) {
    add_job(gst::make_job("blocker", "gated"));
    ASSERT_FALSE(supervisor->submit("blocker"));
    ASSERT_TRUE(wait_for_status("blocker", gs::JobStatus::Running));

    auto low = gst::make_job("low", "recorder");
    low.priority = 1;
    auto low_later = gst::make_job("low_later", "recorder");
    low_later.priority = 1;
    auto high = gst::make_job("high", "recorder");
    high.priority = 5;
    add_job(low);
    add_job(low_later);
    add_job(high);
    ASSERT_FALSE(supervisor->submit("low"));
    ASSERT_FALSE(supervisor->submit("low_later"));
    ASSERT_FALSE(supervisor->submit("high"));
    EXPECT_EQ(supervisor->backlog_size(), 3U);

    gate.open();
    ASSERT_TRUE(supervisor->wait_until_idle(5s));

    const std::lock_guard<std::mutex> lock(order_mutex);
    const std::vector<std::string> expected{"high", "low", "low_later"};
    EXPECT_EQ(started_order, expected);
}

TEST_F(TaskSupervisorTest, BacklogRetriedWhenWorkerComesBack) {
    prober.set_answer("w1", false);
    add_job(gst::make_job("J1", "staged", 2, 1));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(gst::wait_until([this]() { return prober.probe_count("w1") >= 2; }));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Pending);
    EXPECT_EQ(store.find_worker("w1")->status, gs::WorkerStatus::Offline);

    prober.set_answer("w1", true);
    supervisor->notify_capacity_changed();
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Completed));
    EXPECT_EQ(store.find_worker("w1")->status, gs::WorkerStatus::Online);
}

TEST_F(TaskSupervisorTest, FailingRoutineDoesNotStopOtherJobs) {
    ASSERT_FALSE(engine.routines().register_routine(
            "broken",
            std::make_shared<gs::StagedRoutine>(
                    gs::StagedRoutineSpec{.name = "broken", .total_steps = 3},
                    [](const gs::RoutineContext &, const std::uint32_t step) {
                        if (step == 1) {
                            throw std::runtime_error("driver mismatch");
                        }
                    })));
    add_job(gst::make_job("bad", "broken", 3));
    add_job(gst::make_job("good", "staged", 3, 1));
    ASSERT_FALSE(supervisor->submit("bad"));
    ASSERT_FALSE(supervisor->submit("good"));

    ASSERT_TRUE(wait_for_status("bad", gs::JobStatus::Failed));
    ASSERT_TRUE(wait_for_status("good", gs::JobStatus::Completed));
    EXPECT_EQ(job("bad").error_message, "driver mismatch");
    EXPECT_FALSE(job("bad").result.has_value());
    EXPECT_EQ(job("bad").assigned_worker, "w1");
}

TEST_F(TaskSupervisorTest, RetriedJobRunsAgain) {
    add_job(gst::make_job("J1", "gated"));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));
    EXPECT_TRUE(supervisor->cancel("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Cancelled));
    ASSERT_TRUE(supervisor->wait_until_idle(2s));

    ASSERT_FALSE(reconciler.reset_for_retry("J1"));
    gate.open();
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Completed));
    EXPECT_DOUBLE_EQ(job("J1").progress, 100.0);
}

TEST_F(TaskSupervisorTest, RetryBeforeRunIsReleasedQueuesJobAgain) {
    add_job(gst::make_job("J1", "gated"));
    write_hold.arm();
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));
    EXPECT_TRUE(supervisor->cancel("J1"));

    // Final state is written but the run still holds its handle
    ASSERT_TRUE(gst::wait_until([this]() { return write_hold.holding(); }));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Cancelled);
    EXPECT_EQ(supervisor->active_job_ids(), std::set<std::string>{"J1"});

    ASSERT_FALSE(reconciler.reset_for_retry("J1"));
    gate.open();
    ASSERT_FALSE(supervisor->submit("J1"));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Pending);

    write_hold.release();
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Completed));
    EXPECT_DOUBLE_EQ(job("J1").progress, 100.0);
    EXPECT_TRUE(supervisor->wait_until_idle(2s));
    EXPECT_EQ(supervisor->backlog_size(), 0U);
}

TEST_F(TaskSupervisorTest, CancelRetriedJobBeforeRunIsReleased) {
    add_job(gst::make_job("J1", "gated"));
    write_hold.arm();
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));
    EXPECT_TRUE(supervisor->cancel("J1"));
    ASSERT_TRUE(gst::wait_until([this]() { return write_hold.holding(); }));

    ASSERT_FALSE(reconciler.reset_for_retry("J1"));
    ASSERT_FALSE(supervisor->submit("J1"));
    EXPECT_FALSE(supervisor->cancel("J1"));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Cancelled);

    write_hold.release();
    EXPECT_TRUE(supervisor->wait_until_idle(2s));
    EXPECT_EQ(job("J1").status, gs::JobStatus::Cancelled);
    EXPECT_EQ(supervisor->backlog_size(), 0U);
}

TEST_F(TaskSupervisorTest, ShutdownCancelsActiveJobs) {
    add_job(gst::make_job("J1", "gated"));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));

    supervisor->shutdown();
    EXPECT_TRUE(supervisor->active_job_ids().empty());
    EXPECT_EQ(job("J1").status, gs::JobStatus::Cancelled);

    add_job(gst::make_job("J2"));
    EXPECT_EQ(supervisor->submit("J2"), gs::SchedulerErrc::ShuttingDown);
    EXPECT_EQ(job("J2").status, gs::JobStatus::Pending);
    supervisor->shutdown();
}

TEST_F(TaskSupervisorTest, ShutdownCanWaitForActiveJobs) {
    add_job(gst::make_job("J1", "staged", 10, 5));
    ASSERT_FALSE(supervisor->submit("J1"));
    ASSERT_TRUE(wait_for_status("J1", gs::JobStatus::Running));

    supervisor->shutdown(gs::ShutdownBehavior::WaitForActiveJobs);
    EXPECT_EQ(job("J1").status, gs::JobStatus::Completed);
    EXPECT_TRUE(supervisor->active_job_ids().empty());
}

TEST_F(TaskSupervisorTest, ShutdownLeavesQueuedJobsPending) {
    prober.set_answer("w1", false);
    add_job(gst::make_job("J1"));
    ASSERT_FALSE(supervisor->submit("J1"));

    supervisor->shutdown();
    EXPECT_EQ(supervisor->backlog_size(), 0U);
    EXPECT_EQ(job("J1").status, gs::JobStatus::Pending);
}

TEST(TaskSupervisorConfig, RejectsTooShortRetryInterval) {
    gs::InMemoryStore store;
    gs::ResourceRegistry registry{store};
    gst::ScriptedProber prober;
    gs::Allocator allocator{store, registry, prober};
    gs::ExecutionEngine engine;
    gs::StateReconciler reconciler{store};

    EXPECT_EQ(
            gs::SupervisorConfig{.backlog_retry_interval = 1ms}.validate(),
            gs::SchedulerErrc::InvalidParameter);
    EXPECT_FALSE(gs::SupervisorConfig{}.validate());
    EXPECT_THROW(
            gs::TaskSupervisor(
                    store,
                    reconciler,
                    allocator,
                    engine,
                    gs::SupervisorConfig{.backlog_retry_interval = 1ms}),
            std::invalid_argument);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
