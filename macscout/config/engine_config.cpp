/*
 * engine_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-09

Description: Engine configuration and its JSON form

**************************************************/

#include "engine_config.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

#include <spdlog/spdlog.h>

namespace macscout::config {

namespace {

constexpr uint64_t INT64_MAX_VALUE = INT64_MAX;
constexpr int64_t MAX_WORKERS = 64;
constexpr int64_t MAX_ATTEMPTS = 100;
constexpr int64_t MAX_MILLIS = 24LL * 60 * 60 * 1000;
constexpr int64_t MAX_LOG_FILE_SIZE = 1LL << 30;
constexpr int64_t MAX_LOG_FILES = 1000;

[[noreturn]] void fail(std::string_view section, std::string_view key,
                       std::string_view problem) {
    std::string message = "config ";
    message.append(section).append(".").append(key).append(": ").append(
        problem);
    throw ConfigError(message);
}

auto section(const json& document, const char* name) -> const json* {
    auto it = document.find(name);
    if (it == document.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        fail(name, "*", "expected an object");
    }
    return &*it;
}

void readBool(const json& object, const char* sec, const char* key,
              bool& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return;
    }
    if (!it->is_boolean()) {
        fail(sec, key, "expected a boolean");
    }
    out = it->get<bool>();
}

void readString(const json& object, const char* sec, const char* key,
                std::string& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return;
    }
    if (!it->is_string()) {
        fail(sec, key, "expected a string");
    }
    out = it->get<std::string>();
}

auto readInteger(const json& object, const char* sec, const char* key,
                 int64_t minimum, int64_t maximum) -> std::optional<int64_t> {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        fail(sec, key, "expected an integer");
    }
    if (it->is_number_unsigned() && it->get<uint64_t>() > INT64_MAX_VALUE) {
        fail(sec, key, "must be at most " + std::to_string(maximum));
    }
    auto value = it->get<int64_t>();
    if (value < minimum) {
        fail(sec, key, "must be at least " + std::to_string(minimum));
    }
    if (value > maximum) {
        fail(sec, key, "must be at most " + std::to_string(maximum));
    }
    return value;
}

void readMillis(const json& object, const char* sec, const char* key,
                std::chrono::milliseconds& out, int64_t minimum,
                int64_t maximum = MAX_MILLIS) {
    if (auto value = readInteger(object, sec, key, minimum, maximum)) {
        out = std::chrono::milliseconds(*value);
    }
}

template <typename T>
void readCount(const json& object, const char* sec, const char* key, T& out,
               int64_t minimum, int64_t maximum) {
    if (auto value = readInteger(object, sec, key, minimum, maximum)) {
        out = static_cast<T>(*value);
    }
}

void readScan(const json& document, engine::ScanConfig& scan) {
    if (const auto* obj = section(document, "scan")) {
        readMillis(*obj, "scan", "poll_interval_ms", scan.poll_interval, 1);
    }
}

void readPool(const json& document, async::PoolConfig& pool) {
    if (const auto* obj = section(document, "pool")) {
        readCount(*obj, "pool", "workers", pool.workers, 1, MAX_WORKERS);
        readMillis(*obj, "pool", "attempt_timeout_ms", pool.attempt_timeout,
                   1);
        readCount(*obj, "pool", "max_attempts", pool.max_attempts, 1,
                  MAX_ATTEMPTS);
        readMillis(*obj, "pool", "shutdown_grace_ms", pool.shutdown_grace, 0);
    }
}

void readBackoff(const json& document, async::BackoffConfig& backoff) {
    const auto* obj = section(document, "backoff");
    if (obj == nullptr) {
        return;
    }
    std::string strategy(async::strategyToString(backoff.strategy));
    readString(*obj, "backoff", "strategy", strategy);
    auto parsed = async::strategyFromString(strategy);
    if (!parsed) {
        fail("backoff", "strategy", "expected \"linear\" or \"exponential\"");
    }
    backoff.strategy = *parsed;
    readMillis(*obj, "backoff", "base_ms", backoff.base, 0);
    readMillis(*obj, "backoff", "max_delay_ms", backoff.max_delay, 0);
    if (!backoff.isValid()) {
        fail("backoff", "max_delay_ms", "must not be below base_ms");
    }
}

void readIdentifier(const json& document, serial::EsptoolConfig& identifier) {
    const auto* obj = section(document, "identifier");
    if (obj == nullptr) {
        return;
    }
    readString(*obj, "identifier", "program", identifier.program);
    if (identifier.program.empty()) {
        fail("identifier", "program", "must not be empty");
    }
    if (auto it = obj->find("args"); it != obj->end()) {
        if (!it->is_array()) {
            fail("identifier", "args", "expected an array of strings");
        }
        identifier.args.clear();
        for (const auto& arg : *it) {
            if (!arg.is_string()) {
                fail("identifier", "args", "expected an array of strings");
            }
            identifier.args.push_back(arg.get<std::string>());
        }
    }
}

void readScanner(const json& document, serial::ScannerConfig& scanner) {
    if (const auto* obj = section(document, "scanner")) {
        readBool(*obj, "scanner", "include_virtual_ports",
                 scanner.include_virtual_ports);
        readBool(*obj, "scanner", "usb_only", scanner.usb_only);
        readBool(*obj, "scanner", "detect_bridges", scanner.detect_bridges);
        readBool(*obj, "scanner", "enable_performance_logging",
                 scanner.enable_performance_logging);
    }
}

void readLog(const json& document, log::LogConfig& logging) {
    const auto* obj = section(document, "log");
    if (obj == nullptr) {
        return;
    }
    readString(*obj, "log", "level", logging.level);
    if (!log::stringToLogLevel(logging.level)) {
        fail("log", "level", "unknown level \"" + logging.level + "\"");
    }
    readString(*obj, "log", "pattern", logging.pattern);
    readString(*obj, "log", "file", logging.file);
    readCount(*obj, "log", "max_file_size", logging.max_file_size, 1,
              MAX_LOG_FILE_SIZE);
    readCount(*obj, "log", "max_files", logging.max_files, 1, MAX_LOG_FILES);
}

}  // namespace

bool EngineConfig::isValid() const noexcept {
    return scan.isValid() && pool.isValid() && backoff.isValid() &&
           !identifier.program.empty() && scanner.is_valid() &&
           log.isValid();
}

auto fromJson(const json& document) -> EngineConfig {
    if (!document.is_object()) {
        throw ConfigError("config: top level must be an object");
    }

    EngineConfig config;
    readScan(document, config.scan);
    readPool(document, config.pool);
    readBackoff(document, config.backoff);
    readIdentifier(document, config.identifier);
    readScanner(document, config.scanner);
    readLog(document, config.log);
    return config;
}

auto toJson(const EngineConfig& config) -> json {
    return json{
        {"scan", {{"poll_interval_ms", config.scan.poll_interval.count()}}},
        {"pool",
         {{"workers", config.pool.workers},
          {"attempt_timeout_ms", config.pool.attempt_timeout.count()},
          {"max_attempts", config.pool.max_attempts},
          {"shutdown_grace_ms", config.pool.shutdown_grace.count()}}},
        {"backoff",
         {{"strategy", std::string(async::strategyToString(
                           config.backoff.strategy))},
          {"base_ms", config.backoff.base.count()},
          {"max_delay_ms", config.backoff.max_delay.count()}}},
        {"identifier",
         {{"program", config.identifier.program},
          {"args", config.identifier.args}}},
        {"scanner",
         {{"include_virtual_ports", config.scanner.include_virtual_ports},
          {"usb_only", config.scanner.usb_only},
          {"detect_bridges", config.scanner.detect_bridges},
          {"enable_performance_logging",
           config.scanner.enable_performance_logging}}},
        {"log",
         {{"level", config.log.level},
          {"pattern", config.log.pattern},
          {"file", config.log.file},
          {"max_file_size", config.log.max_file_size},
          {"max_files", config.log.max_files}}}};
}

auto parseConfig(std::string_view text) -> EngineConfig {
    json document;
    try {
        document = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config: invalid JSON: ") + e.what());
    }
    return fromJson(document);
}

auto loadConfigFile(const std::filesystem::path& path) -> EngineConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("config: cannot open " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ConfigError("config: cannot read " + path.string());
    }

    auto config = parseConfig(buffer.str());
    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

}  // namespace macscout::config
