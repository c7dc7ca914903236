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

#include "process/ServiceProcess.h"
#include "common/HarnessErrors.h"
#include "common/Logger.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace TOE {

namespace {

constexpr size_t TAIL_LINES = 200;

void closeFd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string> &overrides) {
    std::vector<std::string> env;
    for (char **entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq != std::string::npos && overrides.count(item.substr(0, eq))) {
            continue;
        }
        env.push_back(std::move(item));
    }
    for (const auto &[key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

}  // namespace

const char *toString(ServiceState state) {
    switch (state) {
    case ServiceState::NotStarted:
        return "NotStarted";
    case ServiceState::Starting:
        return "Starting";
    case ServiceState::Ready:
        return "Ready";
    case ServiceState::Stopping:
        return "Stopping";
    case ServiceState::Stopped:
        return "Stopped";
    case ServiceState::Crashed:
        return "Crashed";
    }
    return "Unknown";
}

ServiceProcess::ServiceProcess(ServiceSpec spec, size_t channelCapacity)
    : spec_(std::move(spec)), channel_(channelCapacity) {}

ServiceProcess::~ServiceProcess() {
    if (pid_ > 0 && isAlive()) {
        sendSignal(SIGKILL);
        waitForExit(std::chrono::milliseconds(2000));
    }
    joinReaders();
}

void ServiceProcess::launch(LineHandler onLine, ClosedHandler onClosed) {
    onLine_ = std::move(onLine);
    onClosed_ = std::move(onClosed);

    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    if (pipe(stdoutPipe) != 0 || pipe(stderrPipe) != 0) {
        std::string reason = std::strerror(errno);
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        throw SetupException(SetupError{"Failed to create pipes for " + spec_.name + ": " + reason, {}});
    }

    // Everything the child touches is prepared before fork: only async-signal-safe calls after it
    std::vector<std::string> envStrings = buildEnvironment(spec_.environment);
    std::vector<char *> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto &item : envStrings) {
        envp.push_back(item.data());
    }
    envp.push_back(nullptr);

    std::string shell = "/bin/sh";
    std::string shellName = "sh";
    std::string flag = "-c";
    std::string command = spec_.command;
    std::array<char *, 4> argv = {shellName.data(), flag.data(), command.data(), nullptr};
    const char *workdir = spec_.workingDirectory.empty() ? nullptr : spec_.workingDirectory.c_str();

    setState(ServiceState::Starting);
    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        setState(ServiceState::Crashed);
        throw SetupException(SetupError{"Failed to fork " + spec_.name + ": " + reason, {}});
    }

    if (pid == 0) {
        setpgid(0, 0);
        close(stdoutPipe[0]);
        close(stderrPipe[0]);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        close(stdoutPipe[1]);
        close(stderrPipe[1]);

        int nullFd = open("/dev/null", O_RDONLY);
        if (nullFd >= 0) {
            dup2(nullFd, STDIN_FILENO);
            close(nullFd);
        }
        if (workdir && chdir(workdir) != 0) {
            _exit(126);
        }

        execve(shell.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    // Parent: also set the group here so signals are valid before the child runs
    setpgid(pid, pid);
    pid_ = pid;
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);
    fcntl(stdoutPipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderrPipe[0], F_SETFL, O_NONBLOCK);

    LOG_INFO("Started {} (pid {}): {}", spec_.name, pid_, spec_.command);

    int outFd = stdoutPipe[0];
    int errFd = stderrPipe[0];
    pumpThread_ = std::thread([this, outFd, errFd]() { pumpLoop(outFd, errFd); });
    readerThread_ = std::thread([this]() { readerLoop(); });
}

void ServiceProcess::emit(OutputStream stream, std::string &pending, const char *data, size_t size) {
    pending.append(data, size);
    size_t start = 0;
    size_t newline;
    while ((newline = pending.find('\n', start)) != std::string::npos) {
        std::string text = pending.substr(start, newline - start);
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        if (!text.empty()) {
            channel_.push(OutputLine{stream, std::move(text), std::chrono::system_clock::now()});
        }
        start = newline + 1;
    }
    pending.erase(0, start);
}

void ServiceProcess::pumpLoop(int stdoutFd, int stderrFd) {
    std::array<char, 4096> buffer{};
    std::string pendingOut;
    std::string pendingErr;
    int fds[2] = {stdoutFd, stderrFd};
    std::string *pending[2] = {&pendingOut, &pendingErr};
    const OutputStream streams[2] = {OutputStream::Stdout, OutputStream::Stderr};

    while (fds[0] >= 0 || fds[1] >= 0) {
        struct pollfd pfds[2];
        nfds_t count = 0;
        int index[2] = {-1, -1};
        for (int i = 0; i < 2; ++i) {
            if (fds[i] >= 0) {
                pfds[count].fd = fds[i];
                pfds[count].events = POLLIN;
                pfds[count].revents = 0;
                index[count] = i;
                ++count;
            }
        }

        int ready = poll(pfds, count, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            if (stopPump_.load()) {
                break;
            }
            continue;
        }

        for (nfds_t p = 0; p < count; ++p) {
            if (pfds[p].revents == 0) {
                continue;
            }
            int i = index[p];
            ssize_t n = read(fds[i], buffer.data(), buffer.size());
            if (n > 0) {
                emit(streams[i], *pending[i], buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
                closeFd(fds[i]);
            }
        }
    }

    closeFd(fds[0]);
    closeFd(fds[1]);
    for (int i = 0; i < 2; ++i) {
        if (!pending[i]->empty()) {
            channel_.push(OutputLine{streams[i], *pending[i], std::chrono::system_clock::now()});
        }
    }
    channel_.close();
}

void ServiceProcess::readerLoop() {
    while (!channel_.drained()) {
        auto line = channel_.pop(std::chrono::milliseconds(100));
        if (!line) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(tailMutex_);
            tail_.push_back(line->text);
            if (tail_.size() > TAIL_LINES) {
                tail_.pop_front();
            }
        }
        if (onLine_) {
            onLine_(*this, *line);
        }
    }
    if (onClosed_) {
        onClosed_(*this);
    }
}

ServiceState ServiceProcess::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

void ServiceProcess::setState(ServiceState state) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = state;
}

bool ServiceProcess::markCrashed() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ == ServiceState::Starting || state_ == ServiceState::Ready) {
        state_ = ServiceState::Crashed;
        return true;
    }
    return false;
}

bool ServiceProcess::isAlive() {
    std::lock_guard<std::mutex> lock(waitMutex_);
    if (pid_ <= 0 || exited_) {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }

    exited_ = true;
    if (result == pid_) {
        if (WIFEXITED(status)) {
            exitCode_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitCode_ = 128 + WTERMSIG(status);
        }
    }
    return false;
}

std::optional<int> ServiceProcess::exitCode() const {
    std::lock_guard<std::mutex> lock(waitMutex_);
    return exitCode_;
}

bool ServiceProcess::waitForExit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (isAlive()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

bool ServiceProcess::sendSignal(int signal) {
    if (!isAlive()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(waitMutex_);
    if (kill(-pid_, signal) != 0 && kill(pid_, signal) != 0) {
        LOG_DEBUG("Signal {} to {} (pid {}) failed: {}", signal, spec_.name, pid_, std::strerror(errno));
        return false;
    }
    signalsSent_.push_back(signal);
    return true;
}

std::vector<int> ServiceProcess::signalsSent() const {
    std::lock_guard<std::mutex> lock(waitMutex_);
    return signalsSent_;
}

std::vector<std::string> ServiceProcess::recentOutput() const {
    std::lock_guard<std::mutex> lock(tailMutex_);
    return std::vector<std::string>(tail_.begin(), tail_.end());
}

void ServiceProcess::joinReaders() {
    stopPump_.store(true);
    if (pumpThread_.joinable() && pumpThread_.get_id() != std::this_thread::get_id()) {
        pumpThread_.join();
    }
    if (readerThread_.joinable() && readerThread_.get_id() != std::this_thread::get_id()) {
        readerThread_.join();
    }
}

}  // namespace TOE
