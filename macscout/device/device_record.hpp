/*
 * device_record.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-03

Description: Device record and identification state machine

**************************************************/

#ifndef MACSCOUT_DEVICE_DEVICE_RECORD_HPP
#define MACSCOUT_DEVICE_DEVICE_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace macscout::device {

/**
 * @brief Opaque identity of a serial connection point (e.g. /dev/ttyUSB0).
 */
using PortId = std::string;

/**
 * @brief Ordered set of port identities.
 *
 * Ordered so that ports found in the same snapshot are dispatched in a
 * deterministic order.
 */
using PortSet = std::set<PortId>;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Identification status of a port.
 */
enum class DeviceStatus : uint8_t {
    Pending,  ///< Seen, waiting for an identification job
    Reading,  ///< Identification cycle in progress (including retries)
    Success,  ///< MAC confirmed
    Failed,   ///< Retries exhausted
    Removed   ///< Port disappeared
};

/**
 * @brief Why a registry mutation happened.
 *
 * Used for transition validation and for logging.
 */
enum class MutationReason : uint8_t {
    SchedulerDispatch,
    WorkerResult,
    SchedulerRemoval,
    EngineStop,
    ExplicitReset
};

/**
 * @brief Persisted identification history for one port.
 */
struct DeviceRecord {
    PortId port_id;
    DeviceStatus status{DeviceStatus::Pending};
    std::optional<std::string> mac;  ///< Set iff status == Success
    TimePoint first_seen{};
    std::optional<TimePoint> last_attempt;
    uint32_t attempt_count{0};
    std::optional<std::string> last_error;  ///< Set iff status == Failed

    std::optional<std::string> last_known_mac;  ///< Survives removal
    uint32_t appearances{0};
    uint64_t sequence{0};  ///< Registry-wide creation order
    uint64_t cycle{0};     ///< Current identification cycle
};

[[nodiscard]] auto statusToString(DeviceStatus status) noexcept
    -> std::string_view;

/**
 * @brief Parse a status label produced by statusToString().
 *
 * Matching is case-insensitive.
 */
[[nodiscard]] auto statusFromString(std::string_view label)
    -> std::optional<DeviceStatus>;

[[nodiscard]] auto reasonToString(MutationReason reason) noexcept
    -> std::string_view;

/**
 * @brief Statuses that count as "attached" for the scan diff.
 */
[[nodiscard]] constexpr auto isActive(DeviceStatus status) noexcept -> bool {
    return status != DeviceStatus::Removed;
}

/**
 * @brief Statuses from which no automatic transition occurs.
 */
[[nodiscard]] constexpr auto isTerminal(DeviceStatus status) noexcept
    -> bool {
    return status == DeviceStatus::Success ||
           status == DeviceStatus::Failed || status == DeviceStatus::Removed;
}

/**
 * @brief Check a transition against the state machine.
 *
 * The table is total: every (from, to, reason) triple is either explicitly
 * allowed or rejected.
 */
[[nodiscard]] auto isValidTransition(DeviceStatus from, DeviceStatus to,
                                     MutationReason reason) noexcept -> bool;

}  // namespace macscout::device

#endif  // MACSCOUT_DEVICE_DEVICE_RECORD_HPP
