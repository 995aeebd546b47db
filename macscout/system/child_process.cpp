/*
 * child_process.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-05

Description: Run an external program with a deadline and a stop token

**************************************************/

#include "child_process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace macscout::system {

namespace {
constexpr size_t BUFFER_SIZE = 4096;
constexpr size_t MAX_OUTPUT_SIZE = 256 * 1024;
constexpr auto POLL_SLICE = std::chrono::milliseconds(50);
constexpr auto REAP_INTERVAL = std::chrono::milliseconds(10);
}  // namespace

ChildProcess::ChildProcess(std::string program, std::vector<std::string> args)
    : program_(std::move(program)), args_(std::move(args)) {}

ChildProcess::~ChildProcess() {
    if (running()) {
        terminate();
    }
    closePipe();
}

void ChildProcess::start() {
    if (running()) {
        throw ProcessError("Process '" + program_ + "' is already running");
    }

    int pipefd[2] = {-1, -1};
    if (pipe2(pipefd, O_CLOEXEC) == -1) {
        spdlog::error("Failed to create output pipe: {}", strerror(errno));
        throw ProcessError("Failed to create output pipe");
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> execArgs;
    execArgs.reserve(args_.size() + 2);
    execArgs.push_back(const_cast<char*>(program_.c_str()));
    for (const auto& arg : args_) {
        execArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    execArgs.push_back(nullptr);

    const std::string execFailure = "cannot execute " + program_ + "\n";
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = fork();
    if (pid == -1) {
        spdlog::error("Failed to fork process: {}", strerror(errno));
        close(pipefd[0]);
        close(pipefd[1]);
        if (devnull >= 0) {
            close(devnull);
        }
        throw ProcessError("Failed to fork process");
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);

        execvp(execArgs[0], execArgs.data());

        [[maybe_unused]] auto n =
            ::write(STDERR_FILENO, execFailure.data(), execFailure.size());
        _exit(127);
    }

    setpgid(pid, pid);
    close(pipefd[1]);
    if (devnull >= 0) {
        close(devnull);
    }

    output_fd_ = pipefd[0];
    int flags = fcntl(output_fd_, F_GETFL, 0);
    if (flags != -1) {
        fcntl(output_fd_, F_SETFL, flags | O_NONBLOCK);
    }
    pid_ = pid;
    exit_code_ = 0;
    spdlog::debug("Started '{}' as pid {}", program_, pid_);
}

auto ChildProcess::readAvailable(std::string& output) -> bool {
    std::array<char, BUFFER_SIZE> buffer;
    while (true) {
        ssize_t bytesRead = ::read(output_fd_, buffer.data(), buffer.size());
        if (bytesRead > 0) {
            auto room =
                MAX_OUTPUT_SIZE - std::min(MAX_OUTPUT_SIZE, output.size());
            output.append(buffer.data(),
                          std::min(room, static_cast<size_t>(bytesRead)));
            continue;
        }
        if (bytesRead == 0) {
            return true;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return false;
        }
        spdlog::warn("Read from '{}' failed: {}", program_, strerror(errno));
        return true;
    }
}

auto ChildProcess::wait(std::chrono::milliseconds timeout,
                        std::stop_token stop) -> Outcome {
    Outcome outcome;
    if (!running()) {
        throw ProcessError("Process '" + program_ + "' was not started");
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool eof = false;

    while (true) {
        if (stop.stop_requested()) {
            terminate();
            outcome.status = WaitStatus::Stopped;
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            terminate();
            outcome.status = WaitStatus::TimedOut;
            break;
        }

        if (eof) {
            if (reap(false)) {
                outcome.status = WaitStatus::Exited;
                break;
            }
            std::this_thread::sleep_for(REAP_INTERVAL);
            continue;
        }

        auto slice = std::min<std::chrono::milliseconds>(
            POLL_SLICE, std::chrono::duration_cast<std::chrono::milliseconds>(
                            deadline - now) +
                            std::chrono::milliseconds(1));
        pollfd pfd = {output_fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(slice.count()));
        if (rc < 0 && errno != EINTR) {
            spdlog::error("poll on '{}' failed: {}", program_, strerror(errno));
            eof = true;
        } else if (rc > 0) {
            eof = readAvailable(outcome.output);
        }
    }

    if (output_fd_ != -1) {
        readAvailable(outcome.output);
    }
    closePipe();
    outcome.exit_code = exit_code_;
    return outcome;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) noexcept {
    if (!running()) {
        return;
    }

    kill(-pid_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            return;
        }
        std::this_thread::sleep_for(REAP_INTERVAL);
    }

    spdlog::warn("'{}' (pid {}) ignored SIGTERM, killing", program_, pid_);
    kill(-pid_, SIGKILL);
    reap(true);
}

auto ChildProcess::reap(bool block) noexcept -> bool {
    if (pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (rc == -1 && errno == EINTR);

    if (rc == 0) {
        return false;
    }
    if (rc == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
    } else {
        spdlog::warn("waitpid for pid {} failed: {}", pid_, strerror(errno));
        exit_code_ = -1;
    }
    pid_ = -1;
    return true;
}

void ChildProcess::closePipe() noexcept {
    if (output_fd_ != -1) {
        close(output_fd_);
        output_fd_ = -1;
    }
}

}  // namespace macscout::system
