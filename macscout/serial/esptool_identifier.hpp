/*
 * esptool_identifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-05

Description: Device identifier backed by an external esptool process

**************************************************/

#ifndef MACSCOUT_SERIAL_ESPTOOL_IDENTIFIER_HPP
#define MACSCOUT_SERIAL_ESPTOOL_IDENTIFIER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "identifier.hpp"

namespace macscout::serial {

/**
 * @brief How to invoke the MAC reading tool.
 *
 * Every occurrence of `{port}` in `args` is replaced with the port being
 * identified.
 */
struct EsptoolConfig {
    std::string program{"esptool.py"};
    std::vector<std::string> args{"--port", "{port}", "--baud", "115200",
                                  "read_mac"};
};

/**
 * @brief Reads the MAC by running esptool and parsing its "MAC:" line.
 *
 * The ROM bootloader handshake is left to esptool. A stop request or an
 * expired timeout terminates the tool's process group.
 */
class EsptoolIdentifier : public DeviceIdentifier {
public:
    explicit EsptoolIdentifier(EsptoolConfig config = {});

    [[nodiscard]] auto identify(const std::string& port,
                                std::chrono::milliseconds timeout,
                                std::stop_token stop)
        -> IdentifyResult override;

    [[nodiscard]] auto config() const noexcept -> const EsptoolConfig& {
        return config_;
    }

    /**
     * @brief Expand `{port}` placeholders in the configured arguments.
     */
    [[nodiscard]] auto buildArguments(const std::string& port) const
        -> std::vector<std::string>;

    /**
     * @brief Map a finished run without a MAC to a failure category.
     */
    [[nodiscard]] static auto classifyFailure(int exit_code,
                                              std::string_view output)
        -> IdentifyFailure;

private:
    EsptoolConfig config_;
};

}  // namespace macscout::serial

#endif  // MACSCOUT_SERIAL_ESPTOOL_IDENTIFIER_HPP
