/*
 * esptool_identifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-05

Description: Device identifier backed by an external esptool process

**************************************************/

#include "esptool_identifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

#include "macscout/system/child_process.hpp"
#include "mac_address.hpp"

namespace macscout::serial {

namespace {

constexpr std::string_view PORT_PLACEHOLDER = "{port}";
constexpr size_t MAX_MESSAGE_LENGTH = 160;

auto toLower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

auto containsAny(const std::string& haystack,
                 std::initializer_list<std::string_view> needles) -> bool {
    return std::any_of(needles.begin(), needles.end(),
                       [&](std::string_view needle) {
                           return haystack.find(needle) != std::string::npos;
                       });
}

// Last non-empty line of the tool output, which is where esptool puts the
// fatal error.
auto lastLine(std::string_view output) -> std::string {
    size_t end = output.find_last_not_of(" \t\r\n");
    if (end == std::string_view::npos) {
        return {};
    }
    size_t begin = output.find_last_of('\n', end);
    begin = (begin == std::string_view::npos) ? 0 : begin + 1;
    std::string line(output.substr(begin, end - begin + 1));
    if (line.size() > MAX_MESSAGE_LENGTH) {
        line.resize(MAX_MESSAGE_LENGTH);
    }
    return line;
}

}  // namespace

EsptoolIdentifier::EsptoolIdentifier(EsptoolConfig config)
    : config_(std::move(config)) {}

auto EsptoolIdentifier::buildArguments(const std::string& port) const
    -> std::vector<std::string> {
    std::vector<std::string> args;
    args.reserve(config_.args.size());
    for (auto arg : config_.args) {
        size_t pos = 0;
        while ((pos = arg.find(PORT_PLACEHOLDER, pos)) != std::string::npos) {
            arg.replace(pos, PORT_PLACEHOLDER.size(), port);
            pos += port.size();
        }
        args.push_back(std::move(arg));
    }
    return args;
}

auto EsptoolIdentifier::classifyFailure(int exit_code, std::string_view output)
    -> IdentifyFailure {
    const auto lower = toLower(output);
    auto message = lastLine(output);
    if (message.empty()) {
        message = "exit code " + std::to_string(exit_code);
    }

    if (containsAny(lower, {"permission denied", "errno 13",
                            "resource busy", "errno 16"})) {
        return {IdentifyError::AccessDenied, message};
    }
    if (containsAny(lower, {"no such file", "errno 2", "errno 5",
                            "input/output error", "device disconnected",
                            "device reports readiness to read but returned "
                            "no data"})) {
        return {IdentifyError::Disconnected, message};
    }
    if (exit_code == 0) {
        return {IdentifyError::ProtocolError, "mac not found"};
    }
    return {IdentifyError::ProtocolError, message};
}

auto EsptoolIdentifier::identify(const std::string& port,
                                 std::chrono::milliseconds timeout,
                                 std::stop_token stop) -> IdentifyResult {
    system::ChildProcess process(config_.program, buildArguments(port));
    try {
        process.start();
    } catch (const system::ProcessError& e) {
        spdlog::error("Cannot run {} for {}: {}", config_.program, port,
                      e.what());
        return IdentifyFailure{IdentifyError::ProtocolError, e.what()};
    }

    auto outcome = process.wait(timeout, stop);
    switch (outcome.status) {
        case system::ChildProcess::WaitStatus::Stopped:
            return IdentifyFailure{IdentifyError::Cancelled,
                                   "identification cancelled"};
        case system::ChildProcess::WaitStatus::TimedOut:
            return IdentifyFailure{
                IdentifyError::Timeout,
                "no answer within " + std::to_string(timeout.count()) + " ms"};
        case system::ChildProcess::WaitStatus::Exited:
            break;
    }

    if (auto mac = extractMac(outcome.output)) {
        spdlog::debug("{} reported MAC {} for {}", config_.program, *mac,
                      port);
        return *mac;
    }

    auto failure = classifyFailure(outcome.exit_code, outcome.output);
    spdlog::debug("{} failed for {} (exit {}): {}", config_.program, port,
                  outcome.exit_code, failure.message);
    return failure;
}

}  // namespace macscout::serial
