/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-02

Description: Exception types carrying throw-site information

**************************************************/

#ifndef MACSCOUT_ERROR_EXCEPTION_HPP
#define MACSCOUT_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace macscout::error {

/**
 * @brief Base exception that records where it was thrown.
 *
 * The message is assembled from all extra arguments streamed in order, so
 * `THROW_INVALID_ARGUMENT("bad value: ", value)` reads naturally at the call
 * site.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file), line_(line), func_(func) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
        thread_id_ = std::this_thread::get_id();
    }

    /**
     * @brief Full diagnostic text including the throw site.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class LogicError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace macscout::error

#define THROW_INVALID_ARGUMENT(...)                                      \
    throw macscout::error::InvalidArgument(__FILE__, __LINE__, __func__, \
                                           __VA_ARGS__)

#define THROW_LOGIC_ERROR(...)                                      \
    throw macscout::error::LogicError(__FILE__, __LINE__, __func__, \
                                      __VA_ARGS__)

#endif  // MACSCOUT_ERROR_EXCEPTION_HPP
