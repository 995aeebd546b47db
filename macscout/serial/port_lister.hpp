/*
 * port_lister.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-04

Description: Port snapshot source capability

**************************************************/

#ifndef MACSCOUT_SERIAL_PORT_LISTER_HPP
#define MACSCOUT_SERIAL_PORT_LISTER_HPP

#include <stdexcept>
#include <string>

#include "macscout/device/device_record.hpp"

namespace macscout::serial {

/**
 * @brief Raised when the OS port listing itself fails.
 *
 * Transient: the scheduler logs it and tries again on the next tick.
 */
class EnumerationError : public std::runtime_error {
public:
    explicit EnumerationError(const std::string& message)
        : std::runtime_error(message) {}
    explicit EnumerationError(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Returns the serial ports currently attached.
 */
class PortLister {
public:
    virtual ~PortLister() = default;

    /**
     * @throws EnumerationError if the device listing call fails
     */
    [[nodiscard]] virtual auto list_ports() -> device::PortSet = 0;
};

}  // namespace macscout::serial

#endif  // MACSCOUT_SERIAL_PORT_LISTER_HPP
