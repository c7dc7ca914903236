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

#include "common/RetryPolicy.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <exception>
#include <thread>

namespace TOE {

namespace {

#ifdef _WIN32
constexpr bool LINGERING_FILE_LOCKS = true;
#else
constexpr bool LINGERING_FILE_LOCKS = false;
#endif

}  // namespace

std::chrono::milliseconds RetryPolicy::delayAfter(int attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }
    double scaled = static_cast<double>(baseDelay.count()) * std::pow(factor, attempt - 1);
    double capped = std::min(scaled, static_cast<double>(maxDelay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

RetryPolicy RetryPolicy::forFileDeletion() {
    RetryPolicy policy;
    policy.maxAttempts = 10;
    policy.baseDelay = std::chrono::milliseconds(LINGERING_FILE_LOCKS ? 2000 : 1000);
    policy.factor = 2.0;
    policy.maxDelay = std::chrono::milliseconds(10000);
    return policy;
}

RetryPolicy RetryPolicy::forDirectoryDeletion() {
    RetryPolicy policy;
    policy.maxAttempts = LINGERING_FILE_LOCKS ? 15 : 8;
    policy.baseDelay = std::chrono::milliseconds(LINGERING_FILE_LOCKS ? 3000 : 1500);
    policy.factor = 1.5;
    policy.maxDelay = std::chrono::milliseconds(15000);
    return policy;
}

RetryPolicy RetryPolicy::forPortRelease() {
    RetryPolicy policy;
    policy.maxAttempts = 5;
    policy.baseDelay = std::chrono::milliseconds(200);
    policy.factor = 2.0;
    policy.maxDelay = std::chrono::milliseconds(1000);
    return policy;
}

void Retry::defaultSleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

RetryOutcome Retry::run(const RetryPolicy &policy, const std::function<bool(std::string &error)> &operation,
                        const std::function<bool()> &probe, const RetrySleeper &sleeper) {
    RetryOutcome outcome;
    const int maxAttempts = std::max(1, policy.maxAttempts);
    auto wait = [&](std::chrono::milliseconds delay) {
        if (sleeper) {
            sleeper(delay);
        } else {
            defaultSleep(delay);
        }
    };

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        outcome.attempts = attempt;

        if (attempt > 1 && probe && !probe()) {
            outcome.lastError = "resource still busy";
            LOG_DEBUG("Retry: probe reports busy (attempt {}/{})", attempt, maxAttempts);
            if (attempt < maxAttempts) {
                wait(policy.delayAfter(attempt));
            }
            continue;
        }

        std::string error;
        bool ok = false;
        try {
            ok = operation(error);
        } catch (const std::exception &e) {
            error = e.what();
        }

        if (ok) {
            outcome.succeeded = true;
            outcome.lastError.clear();
            return outcome;
        }

        outcome.lastError = error;
        if (attempt < maxAttempts) {
            auto delay = policy.delayAfter(attempt);
            LOG_DEBUG("Retry: attempt {}/{} failed ({}), retrying in {}ms", attempt, maxAttempts, error,
                      delay.count());
            wait(delay);
        }
    }

    return outcome;
}

}  // namespace TOE
