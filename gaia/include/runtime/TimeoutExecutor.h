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

#pragma once

#include "model/ExecutionResult.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace GAIA {

/**
 * @brief Executor adapter that bounds the time spent in the backend call
 *
 * Usable anywhere an ExecutorCallback is expected. The wrapped executor runs
 * on a worker thread; if it does not finish within the timeout the call
 * returns a retryable failure ({status: failed, fatal: false}) and the
 * abandoned worker is kept, its eventual result discarded. Exceptions thrown
 * by the wrapped executor within the timeout are rethrown to the caller.
 *
 * Calls never overlap: the next call first waits for an abandoned worker to
 * finish, and destroying the last copy of the wrapper joins it. Anything the
 * wrapped executor captures by reference therefore only has to outlive the
 * wrapper.
 */
class TimeoutExecutor {
public:
    /**
     * @throws std::invalid_argument if executor is empty or timeout is not positive
     */
    TimeoutExecutor(ExecutorCallback executor, std::chrono::milliseconds timeout);

    ExecutionResult operator()(const TestItem &item) const;

    std::chrono::milliseconds timeout() const {
        return timeout_;
    }

private:
    // Shared by every copy of the wrapper (std::function copies its target)
    struct WorkerState {
        explicit WorkerState(ExecutorCallback callback) : executor(std::move(callback)) {}
        ~WorkerState();

        WorkerState(const WorkerState &) = delete;
        WorkerState &operator=(const WorkerState &) = delete;

        void joinAbandoned();

        ExecutorCallback executor;
        std::mutex callMutex;
        std::thread abandoned;
    };

    std::shared_ptr<WorkerState> state_;
    std::chrono::milliseconds timeout_;
};

}  // namespace GAIA
