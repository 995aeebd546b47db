/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-08

Description: spdlog setup for the engine and the console monitor

**************************************************/

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "macscout/error/exception.hpp"

namespace macscout::log {

bool LogConfig::isValid() const noexcept {
    if (!stringToLogLevel(level)) {
        return false;
    }
    return file.empty() || (max_file_size > 0 && max_files > 0);
}

auto stringToLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (level == "TRACE" || level == "T")
        return spdlog::level::trace;
    if (level == "DEBUG" || level == "D")
        return spdlog::level::debug;
    if (level == "INFO" || level == "I")
        return spdlog::level::info;
    if (level == "WARN" || level == "WARNING" || level == "W")
        return spdlog::level::warn;
    if (level == "ERROR" || level == "ERR" || level == "E")
        return spdlog::level::err;
    if (level == "CRITICAL" || level == "CRIT" || level == "C" ||
        level == "FATAL")
        return spdlog::level::critical;
    if (level == "OFF")
        return spdlog::level::off;

    return std::nullopt;
}

auto logLevelToString(spdlog::level::level_enum level) -> std::string {
    auto name = spdlog::level::to_string_view(level);
    return std::string(name.data(), name.size());
}

void setupLogging(const LogConfig& config) {
    auto level = stringToLogLevel(config.level);
    if (!level) {
        THROW_INVALID_ARGUMENT("Unknown log level: ", config.level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.max_file_size, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>("macscout", sinks.begin(),
                                                   sinks.end());
    logger->set_level(*level);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging initialized: level={}, file={}",
                  logLevelToString(*level),
                  config.file.empty() ? "<none>" : config.file);
}

}  // namespace macscout::log
