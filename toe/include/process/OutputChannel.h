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
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace TOE {

enum class OutputStream { Stdout, Stderr };

inline const char *toString(OutputStream stream) {
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

/**
 * @brief One line of service output
 */
struct OutputLine {
    OutputStream stream = OutputStream::Stdout;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Bounded, lossless line queue between a pipe reader and its consumer
 *
 * push() blocks while the channel is full instead of dropping lines.
 * After close() producers are rejected and consumers drain what is left.
 */
class OutputChannel {
public:
    explicit OutputChannel(size_t capacity = 8192);

    /**
     * @return false if the channel was closed before the line could be queued
     */
    bool push(OutputLine line);

    /**
     * @brief Wait up to timeout for the next line
     * @return Next line, or nullopt on timeout or when closed and empty
     */
    std::optional<OutputLine> pop(std::chrono::milliseconds timeout);

    void close();

    /**
     * @brief Closed and every queued line consumed
     */
    bool drained() const;

    size_t size() const;

    size_t capacity() const {
        return capacity_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<OutputLine> lines_;
    bool closed_ = false;
};

}  // namespace TOE
