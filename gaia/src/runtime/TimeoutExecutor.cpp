// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-GAIA-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of GAIA (Adaptive Test Scheduler).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael

#include "runtime/TimeoutExecutor.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include <future>
#include <stdexcept>
#include <thread>

namespace GAIA {

TimeoutExecutor::WorkerState::~WorkerState() {
    joinAbandoned();
}

void TimeoutExecutor::WorkerState::joinAbandoned() {
    if (abandoned.joinable()) {
        abandoned.join();
    }
}

TimeoutExecutor::TimeoutExecutor(ExecutorCallback executor, std::chrono::milliseconds timeout)
    : state_(std::make_shared<WorkerState>(std::move(executor))), timeout_(timeout) {
    if (!state_->executor) {
        throw std::invalid_argument("TimeoutExecutor requires a valid executor");
    }
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("TimeoutExecutor requires a positive timeout");
    }
}

ExecutionResult TimeoutExecutor::operator()(const TestItem &item) const {
    std::lock_guard<std::mutex> lock(state_->callMutex);

    if (state_->abandoned.joinable()) {
        LOG_DEBUG("TimeoutExecutor: Waiting for the previous timed-out call before running '{}'",
                  Log::sanitize(item.id));
        state_->joinAbandoned();
    }

    // The worker must not own the state: its destructor joins the worker
    const ExecutorCallback *executor = &state_->executor;
    auto task = std::make_shared<std::packaged_task<ExecutionResult()>>(
        [executor, itemCopy = item]() { return (*executor)(itemCopy); });
    std::future<ExecutionResult> future = task->get_future();

    std::thread worker([task]() { (*task)(); });

    if (future.wait_for(timeout_) == std::future_status::timeout) {
        state_->abandoned = std::move(worker);
        LOG_WARN("TimeoutExecutor: Item '{}' exceeded {}ms, reporting retryable failure", Log::sanitize(item.id),
                 timeout_.count());

        ExecutionResult result = ExecutionResult::failure(
            "executor timed out after " + std::to_string(timeout_.count()) + " ms", false);
        result.extra["timed_out"] = true;
        return result;
    }

    worker.join();
    return future.get();  // rethrows the executor's exception, if any
}

}  // namespace GAIA
