// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "process/OutputChannel.h"
#include <algorithm>

namespace TOE {

OutputChannel::OutputChannel(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

bool OutputChannel::push(OutputLine line) {
    std::unique_lock<std::mutex> lock(mutex_);
    notFull_.wait(lock, [this] { return closed_ || lines_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    lines_.push_back(std::move(line));
    notEmpty_.notify_one();
    return true;
}

std::optional<OutputLine> OutputChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !lines_.empty(); })) {
        return std::nullopt;
    }
    if (lines_.empty()) {
        return std::nullopt;
    }
    OutputLine line = std::move(lines_.front());
    lines_.pop_front();
    notFull_.notify_one();
    return line;
}

void OutputChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    notEmpty_.notify_all();
    notFull_.notify_all();
}

bool OutputChannel::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && lines_.empty();
}

size_t OutputChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

}  // namespace TOE
