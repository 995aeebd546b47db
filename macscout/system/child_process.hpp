/*
 * child_process.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-05

Description: Run an external program with a deadline and a stop token

**************************************************/

#ifndef MACSCOUT_SYSTEM_CHILD_PROCESS_HPP
#define MACSCOUT_SYSTEM_CHILD_PROCESS_HPP

#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include <sys/types.h>

namespace macscout::system {

/**
 * @brief Raised when a child process cannot be spawned.
 */
class ProcessError : public std::runtime_error {
public:
    explicit ProcessError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief One external program run, stdout and stderr merged.
 *
 * The child runs in its own process group so that terminating it also
 * stops anything it spawned (esptool is a Python script). Destroying a
 * running ChildProcess kills the group and reaps it.
 */
class ChildProcess {
public:
    enum class WaitStatus {
        Exited,    ///< The program exited on its own
        TimedOut,  ///< Deadline passed, the program was terminated
        Stopped    ///< Stop was requested, the program was terminated
    };

    struct Outcome {
        WaitStatus status{WaitStatus::Exited};
        int exit_code{0};  ///< 128 + signal when killed by a signal
        std::string output;
    };

    ChildProcess(std::string program, std::vector<std::string> args);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Spawn the program.
     *
     * @throws ProcessError if the pipe or fork fails
     */
    void start();

    /**
     * @brief Collect output until exit, deadline or stop request.
     */
    [[nodiscard]] auto wait(std::chrono::milliseconds timeout,
                            std::stop_token stop) -> Outcome;

    /**
     * @brief SIGTERM the process group, SIGKILL it after `grace`.
     */
    void terminate(std::chrono::milliseconds grace =
                       std::chrono::milliseconds(500)) noexcept;

    [[nodiscard]] auto running() const noexcept -> bool { return pid_ > 0; }
    [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

private:
    auto readAvailable(std::string& output) -> bool;
    auto reap(bool block) noexcept -> bool;
    void closePipe() noexcept;

    std::string program_;
    std::vector<std::string> args_;
    pid_t pid_{-1};
    int output_fd_{-1};
    int exit_code_{0};
};

}  // namespace macscout::system

#endif  // MACSCOUT_SYSTEM_CHILD_PROCESS_HPP
