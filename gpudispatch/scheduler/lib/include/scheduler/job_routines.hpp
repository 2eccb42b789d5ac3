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
 * @file job_routines.hpp
 * @brief Step based routines shipped with the dispatcher
 */

#ifndef GPUDISPATCH_SCHEDULER_JOB_ROUTINES_HPP
#define GPUDISPATCH_SCHEDULER_JOB_ROUTINES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "scheduler/ijob_routine.hpp"

namespace gpudispatch::scheduler {

class RoutineRegistry;

inline constexpr std::string_view TOTAL_STEPS_KEY = "total_steps";
inline constexpr std::string_view STEP_DURATION_KEY = "step_duration_ms";

/// Default shape of a staged routine
struct StagedRoutineSpec final {
    std::string name;                       //!< Routine name
    std::string unit{"step"};               //!< What one step represents, used in logs
    std::uint32_t total_steps{1};           //!< Number of steps
    std::chrono::milliseconds step_duration{}; //!< Time spent per step
};

/**
 * Routine made of equal steps
 *
 * Each step sleeps for the step duration (or runs the step function when
 * one is given) and then reports (step + 1) / total * 100 percent. The
 * cancellation token is checked before every step and interrupts the
 * sleep. The job config may override the shape with the keys total_steps
 * and step_duration_ms. A malformed override fails the run.
 */
class StagedRoutine final : public IJobRoutine {
public:
    /// Work done for one step; exceptions fail the run
    using StepFunction = std::function<void(const RoutineContext &, std::uint32_t)>;

    /**
     * Create a staged routine
     *
     * @param[in] spec Default step count and duration
     * @param[in] step Optional step body replacing the sleep
     * @throws std::invalid_argument if the spec has no name or zero steps
     */
    explicit StagedRoutine(StagedRoutineSpec spec, StepFunction step = {});

    [[nodiscard]] ExecutionResult run(const RoutineContext &context) override;
    [[nodiscard]] std::string_view name() const noexcept override { return spec_.name; }

    [[nodiscard]] const StagedRoutineSpec &spec() const noexcept { return spec_; }

private:
    StagedRoutineSpec spec_;
    StepFunction step_;
};

/**
 * Install the built-in routines
 *
 * training (100 steps of 100ms), inference (50 of 50ms),
 * data_processing (20 of 200ms) and staged (10 of 100ms).
 *
 * @param[in,out] registry Registry receiving the routines
 * @throws std::invalid_argument if one of the job types is already registered
 */
void register_default_routines(RoutineRegistry &registry);

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_JOB_ROUTINES_HPP
