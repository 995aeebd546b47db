/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-11

Description: macscout-monitor, console front end of the engine

**************************************************/

#include <getopt.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "macscout/config/engine_config.hpp"
#include "macscout/engine/engine.hpp"
#include "macscout/error/exception.hpp"
#include "macscout/export/exporter.hpp"
#include "macscout/log/logging.hpp"
#include "macscout/serial/esptool_identifier.hpp"
#include "macscout/serial/scanner.hpp"

namespace {

using namespace macscout;

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_EXPORT = 2;

std::atomic<bool> g_stop_requested{false};

extern "C" void handleStopSignal(int /*signum*/) {
    g_stop_requested.store(true);
}

struct Options {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> export_file;
    std::optional<long> duration_seconds;
    std::optional<std::string> log_level;
    bool once{false};
    bool help{false};
};

void printUsage(std::ostream& out, const char* program) {
    out << "Usage: " << program
        << " [--config FILE] [--export FILE] [--duration SECONDS]\n"
           "       [--log-level LEVEL] [--once]\n\n"
           "  -c, --config FILE      JSON configuration file\n"
           "  -e, --export FILE      write records on exit (.json or .csv)\n"
           "  -d, --duration SEC     stop after SEC seconds\n"
           "  -l, --log-level LEVEL  trace, debug, info, warn, error, off\n"
           "  -1, --once             scan once, wait for results, exit\n"
           "  -h, --help             show this help\n";
}

auto parseArguments(int argc, char** argv) -> std::optional<Options> {
    static const option LONG_OPTIONS[] = {
        {"config", required_argument, nullptr, 'c'},
        {"export", required_argument, nullptr, 'e'},
        {"duration", required_argument, nullptr, 'd'},
        {"log-level", required_argument, nullptr, 'l'},
        {"once", no_argument, nullptr, '1'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    Options options;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "c:e:d:l:1h", LONG_OPTIONS,
                              nullptr)) != -1) {
        switch (opt) {
            case 'c':
                options.config_file = optarg;
                break;
            case 'e':
                options.export_file = optarg;
                break;
            case 'd': {
                char* end = nullptr;
                long value = std::strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || value <= 0) {
                    std::cerr << "Invalid duration: " << optarg << "\n";
                    return std::nullopt;
                }
                options.duration_seconds = value;
                break;
            }
            case 'l':
                options.log_level = optarg;
                break;
            case '1':
                options.once = true;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                return std::nullopt;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return std::nullopt;
    }
    return options;
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = handleStopSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void printEvent(const device::RegistryEvent& event) {
    const auto& record = event.record;
    const auto time = exporter::formatTimestamp(device::Clock::now());
    switch (event.type) {
        case device::RegistryEvent::Type::Added:
            std::cout << time << "  + " << record.port_id << " detected\n";
            break;
        case device::RegistryEvent::Type::StatusChanged:
            std::cout << time << "  " << record.port_id << ": "
                      << (event.previous
                              ? device::statusToString(*event.previous)
                              : "new")
                      << " -> " << device::statusToString(record.status);
            if (record.mac) {
                std::cout << "  " << *record.mac;
            }
            if (record.last_error) {
                std::cout << "  (" << *record.last_error << ")";
            }
            std::cout << "\n";
            break;
        case device::RegistryEvent::Type::Updated:
            break;
    }
}

void printTable(const std::vector<device::DeviceRecord>& records) {
    std::cout << std::left << std::setw(20) << "PORT" << std::setw(20)
              << "MAC" << std::setw(10) << "STATUS" << std::setw(9)
              << "ATTEMPTS" << "LAST ERROR\n";
    for (const auto& record : records) {
        std::cout << std::left << std::setw(20) << record.port_id
                  << std::setw(20) << record.mac.value_or("-")
                  << std::setw(10) << device::statusToString(record.status)
                  << std::setw(9) << record.attempt_count
                  << record.last_error.value_or("") << "\n";
    }
    std::cout.flush();
}

// Worst case for one port: every attempt times out and waits the longest
// backoff before the next one.
auto settleTimeout(const config::EngineConfig& settings)
    -> std::chrono::milliseconds {
    return (settings.pool.attempt_timeout + settings.backoff.max_delay) *
               settings.pool.max_attempts +
           settings.pool.shutdown_grace;
}

}  // namespace

int main(int argc, char** argv) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }
    if (options->help) {
        printUsage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }

    config::EngineConfig settings;
    try {
        if (options->config_file) {
            settings = config::loadConfigFile(*options->config_file);
        }
        if (options->log_level) {
            settings.log.level = *options->log_level;
        }
        log::setupLogging(settings.log);
    } catch (const config::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const error::Exception& e) {
        std::cerr << e.getMessage() << "\n";
        return EXIT_USAGE;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot set up logging: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    std::unique_ptr<engine::Engine> monitor;
    try {
        auto scanner = std::make_shared<serial::SerialPortScanner>(
            settings.scanner);
        auto identifier =
            std::make_shared<serial::EsptoolIdentifier>(settings.identifier);
        monitor = std::make_unique<engine::Engine>(settings, scanner,
                                                  identifier);
    } catch (const error::Exception& e) {
        spdlog::critical("Invalid configuration: {}", e.getMessage());
        return EXIT_USAGE;
    }

    auto& records = monitor->query();
    records.subscribe([&records](const device::RegistryEvent& event) {
        printEvent(event);
        if (event.type == device::RegistryEvent::Type::StatusChanged) {
            std::cout << "    "
                      << query::RecordQuery::formatStatusLine(records.counts())
                      << "\n";
        }
        std::cout.flush();
    });

    if (options->once) {
        if (!monitor->runOnce(settleTimeout(settings))) {
            spdlog::warn("Some identifications did not settle in time");
        }
        monitor->stop();
        printTable(records.all());
    } else {
        installSignalHandlers();
        monitor->start();

        const auto started = std::chrono::steady_clock::now();
        const auto limit = options->duration_seconds
                               ? std::optional<std::chrono::seconds>(
                                     *options->duration_seconds)
                               : std::nullopt;
        while (!g_stop_requested.load()) {
            if (limit && std::chrono::steady_clock::now() - started >= *limit) {
                spdlog::info("Duration of {} s reached", limit->count());
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        monitor->stop();
    }

    const auto stats = monitor->poolStatistics();
    spdlog::info("Attempts: {} started, {} succeeded, {} failed, {} retried, "
                 "{} cancelled, {} discarded",
                 stats.started.load(), stats.succeeded.load(),
                 stats.failed.load(), stats.retried.load(),
                 stats.cancelled.load(), stats.discarded.load());

    if (options->export_file) {
        try {
            exporter::exportToFile(*options->export_file,
                                   records.exportSnapshot());
        } catch (const exporter::ExportError& e) {
            spdlog::error("Export failed: {}", e.what());
            return EXIT_EXPORT;
        }
    }
    return EXIT_SUCCESS;
}
