/*
 * identifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-04

Description: Device identification capability

**************************************************/

#ifndef MACSCOUT_SERIAL_IDENTIFIER_HPP
#define MACSCOUT_SERIAL_IDENTIFIER_HPP

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace macscout::serial {

/**
 * @brief Reasons an identification attempt can fail.
 */
enum class IdentifyError {
    Timeout,        ///< No answer within the attempt timeout
    AccessDenied,   ///< Port busy or permission denied
    ProtocolError,  ///< Malformed, empty or unexpected response
    Disconnected,   ///< Device vanished during the call
    Cancelled       ///< Stop was requested by the caller
};

[[nodiscard]] auto identifyErrorToString(IdentifyError error) noexcept
    -> std::string_view;

/**
 * @brief Failure details for one attempt.
 */
struct IdentifyFailure {
    IdentifyError code{IdentifyError::ProtocolError};
    std::string message;

    /**
     * @brief Human-readable form stored as a record's last_error.
     */
    [[nodiscard]] auto describe() const -> std::string;
};

/**
 * @brief Either a normalized MAC string or the reason there is none.
 */
using IdentifyResult = std::variant<std::string, IdentifyFailure>;

/**
 * @brief Reads the hardware MAC address of the device behind a port.
 *
 * The byte-level bootloader handshake lives entirely behind this interface.
 * Implementations must return within roughly `timeout` and must return
 * promptly with IdentifyError::Cancelled once `stop` is requested. They
 * may be called concurrently for different ports, never for the same port.
 */
class DeviceIdentifier {
public:
    virtual ~DeviceIdentifier() = default;

    [[nodiscard]] virtual auto identify(const std::string& port,
                                        std::chrono::milliseconds timeout,
                                        std::stop_token stop)
        -> IdentifyResult = 0;
};

}  // namespace macscout::serial

#endif  // MACSCOUT_SERIAL_IDENTIFIER_HPP
