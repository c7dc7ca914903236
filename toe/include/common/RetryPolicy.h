// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of TOE (Test Orchestration Engine).
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

#include <chrono>
#include <functional>
#include <string>

namespace TOE {

/**
 * @brief Exponential backoff parameters
 *
 * Delay before attempt n+1 is min(baseDelay * factor^(n-1), maxDelay).
 */
struct RetryPolicy {
    int maxAttempts = 1;
    std::chrono::milliseconds baseDelay{0};
    double factor = 2.0;
    std::chrono::milliseconds maxDelay{0};

    std::chrono::milliseconds delayAfter(int attempt) const;

    /**
     * @brief File deletion: 10 attempts, 1s base (2s where locks linger), x2, 10s cap
     */
    static RetryPolicy forFileDeletion();

    /**
     * @brief Directory deletion: 8 attempts (15 where locks linger), 1.5s base (3s), x1.5, 15s cap
     */
    static RetryPolicy forDirectoryDeletion();

    /**
     * @brief Port release after a kill: 5 short checks
     */
    static RetryPolicy forPortRelease();
};

struct RetryOutcome {
    bool succeeded = false;
    int attempts = 0;
    std::string lastError;
};

using RetrySleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Run an operation under a RetryPolicy
 *
 * The operation returns true on success and may describe its failure in
 * the error out-parameter. When a probe is supplied it is consulted before
 * every retry; a false probe (resource still busy) consumes the attempt
 * without running the operation. No exception escapes from the retry loop:
 * an operation that throws std::exception counts as a failed attempt.
 *
 * @param sleeper Injected wait used between attempts (defaults to sleep_for)
 */
class Retry {
public:
    static RetryOutcome run(const RetryPolicy &policy, const std::function<bool(std::string &error)> &operation,
                            const std::function<bool()> &probe = {}, const RetrySleeper &sleeper = {});

    static void defaultSleep(std::chrono::milliseconds delay);
};

}  // namespace TOE
