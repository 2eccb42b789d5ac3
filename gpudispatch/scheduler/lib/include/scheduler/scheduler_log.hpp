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

#ifndef GPUDISPATCH_SCHEDULER_SCHEDULER_LOG_HPP
#define GPUDISPATCH_SCHEDULER_SCHEDULER_LOG_HPP

#include "log/components.hpp"

namespace gpudispatch::scheduler {

/**
 * Scheduler logging components
 */
DECLARE_LOG_COMPONENT(
        SchedulerComponent,
        Store,
        Registry,
        Prober,
        Allocator,
        Supervisor,
        Engine,
        Reconciler,
        Service,
        Monitor);

/**
 * Job lifecycle event logging identifiers
 */
DECLARE_LOG_EVENT(
        JobEvent,
        Submitted,
        Scheduled,
        Progress,
        Completed,
        Failed,
        Cancelled,
        Retried,
        Recovered,
        Deleted);

/**
 * Scheduler error event logging identifiers
 */
DECLARE_LOG_EVENT(
        SchedulerErrorEvent,
        AllocationUnavailable,
        ExecutionError,
        CancellationRequested,
        ReconciliationConflict,
        ProbeFailed,
        UserLimitExceeded,
        InvalidParam);

} // namespace gpudispatch::scheduler

#endif // GPUDISPATCH_SCHEDULER_SCHEDULER_LOG_HPP
