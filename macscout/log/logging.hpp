/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-08

Description: spdlog setup for the engine and the console monitor

**************************************************/

#ifndef MACSCOUT_LOG_LOGGING_HPP
#define MACSCOUT_LOG_LOGGING_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace macscout::log {

struct LogConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};
    std::string file;  ///< Rotating log file, empty to disable
    std::size_t max_file_size{5 * 1024 * 1024};
    std::size_t max_files{3};

    [[nodiscard]] bool isValid() const noexcept;
};

/**
 * @brief Parse a level name: trace, debug, info, warn, error, critical,
 * off, or their one-letter forms. Case-insensitive.
 */
[[nodiscard]] auto stringToLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

[[nodiscard]] auto logLevelToString(spdlog::level::level_enum level)
    -> std::string;

/**
 * @brief Install the default logger: colour console plus optional file.
 *
 * @throws macscout::error::InvalidArgument on an unknown level name
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void setupLogging(const LogConfig& config);

}  // namespace macscout::log

#endif  // MACSCOUT_LOG_LOGGING_HPP
