/*
 * engine_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-09

Description: Engine configuration and its JSON form

**************************************************/

#ifndef MACSCOUT_CONFIG_ENGINE_CONFIG_HPP
#define MACSCOUT_CONFIG_ENGINE_CONFIG_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "macscout/async/backoff.hpp"
#include "macscout/async/identification_pool.hpp"
#include "macscout/engine/scan_scheduler.hpp"
#include "macscout/log/logging.hpp"
#include "macscout/serial/esptool_identifier.hpp"
#include "macscout/serial/scanner.hpp"

namespace macscout::config {

using json = nlohmann::json;

/**
 * @brief Raised for unreadable, malformed or out-of-range configuration.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Everything needed to run the engine and the console monitor.
 *
 * Durations are expressed in milliseconds in the JSON form
 * (`poll_interval_ms`, `attempt_timeout_ms`, ...).
 */
struct EngineConfig {
    engine::ScanConfig scan;
    async::PoolConfig pool;
    async::BackoffConfig backoff;
    serial::EsptoolConfig identifier;
    serial::ScannerConfig scanner;
    log::LogConfig log;

    [[nodiscard]] bool isValid() const noexcept;
};

/**
 * @brief Build a config from a JSON object.
 *
 * Missing keys keep their defaults; unknown keys are ignored.
 *
 * @throws ConfigError on a wrong type or an invalid value
 */
[[nodiscard]] auto fromJson(const json& document) -> EngineConfig;

[[nodiscard]] auto toJson(const EngineConfig& config) -> json;

/**
 * @throws ConfigError if the text is not valid JSON or fromJson() fails
 */
[[nodiscard]] auto parseConfig(std::string_view text) -> EngineConfig;

/**
 * @throws ConfigError if the file cannot be read or parseConfig() fails
 */
[[nodiscard]] auto loadConfigFile(const std::filesystem::path& path)
    -> EngineConfig;

}  // namespace macscout::config

#endif  // MACSCOUT_CONFIG_ENGINE_CONFIG_HPP
