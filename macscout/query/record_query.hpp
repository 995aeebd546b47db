/*
 * record_query.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-08

Description: Read-only views of the device registry for UIs and exporters

**************************************************/

#ifndef MACSCOUT_QUERY_RECORD_QUERY_HPP
#define MACSCOUT_QUERY_RECORD_QUERY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "macscout/device/registry.hpp"

namespace macscout::query {

/**
 * @brief Record filter. Empty members match everything.
 */
struct RecordFilter {
    std::set<device::DeviceStatus> statuses;
    /// Case-insensitive substring of port_id, mac, last_known_mac or the
    /// status label
    std::string text;

    [[nodiscard]] auto matches(const device::DeviceRecord& record) const
        -> bool;
};

struct StatusCounts {
    std::size_t pending{0};
    std::size_t reading{0};
    std::size_t success{0};
    std::size_t failed{0};
    std::size_t removed{0};

    [[nodiscard]] auto total() const noexcept -> std::size_t {
        return pending + reading + success + failed + removed;
    }
};

/**
 * @brief One exported line.
 */
struct ExportRow {
    device::TimePoint timestamp;  ///< Last attempt, or first sighting
    device::PortId port_id;
    std::string mac_or_empty;
    std::string status_label;
};

/**
 * @brief Immutable export view, ordered by record creation.
 */
struct ExportSnapshot {
    device::TimePoint taken_at{};
    uint64_t version{0};
    std::vector<ExportRow> rows;
};

class RecordQuery {
public:
    explicit RecordQuery(device::DeviceRegistry& registry);

    [[nodiscard]] auto all() const -> std::vector<device::DeviceRecord>;

    [[nodiscard]] auto find(const RecordFilter& filter) const
        -> std::vector<device::DeviceRecord>;

    [[nodiscard]] auto get(const device::PortId& port) const
        -> std::optional<device::DeviceRecord>;

    [[nodiscard]] auto counts() const -> StatusCounts;

    [[nodiscard]] auto exportSnapshot() const -> ExportSnapshot;

    /**
     * @brief Subscribe to record changes in mutation order.
     *
     * Attempt-start updates are only delivered with `include_updates`.
     */
    auto subscribe(device::DeviceRegistry::Listener listener,
                   bool include_updates = false)
        -> device::DeviceRegistry::Token;

    void unsubscribe(device::DeviceRegistry::Token token);

    [[nodiscard]] static auto toExportRow(const device::DeviceRecord& record)
        -> ExportRow;

    /**
     * @brief "3 ports: 1 pending, 0 reading, 2 success, ..." summary.
     */
    [[nodiscard]] static auto formatStatusLine(const StatusCounts& counts)
        -> std::string;

private:
    device::DeviceRegistry& registry_;
};

}  // namespace macscout::query

#endif  // MACSCOUT_QUERY_RECORD_QUERY_HPP
