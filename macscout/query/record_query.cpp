#include "record_query.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace macscout::query {

namespace {

auto toLower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

}  // namespace

auto RecordFilter::matches(const device::DeviceRecord& record) const -> bool {
    if (!statuses.empty() && !statuses.contains(record.status)) {
        return false;
    }
    if (text.empty()) {
        return true;
    }
    const auto needle = toLower(text);
    auto contains = [&needle](std::string_view field) {
        return toLower(field).find(needle) != std::string::npos;
    };
    return contains(record.port_id) ||
           (record.mac && contains(*record.mac)) ||
           (record.last_known_mac && contains(*record.last_known_mac)) ||
           contains(device::statusToString(record.status));
}

RecordQuery::RecordQuery(device::DeviceRegistry& registry)
    : registry_(registry) {}

auto RecordQuery::all() const -> std::vector<device::DeviceRecord> {
    return registry_.snapshot().records;
}

auto RecordQuery::find(const RecordFilter& filter) const
    -> std::vector<device::DeviceRecord> {
    auto records = registry_.snapshot().records;
    std::erase_if(records, [&](const device::DeviceRecord& record) {
        return !filter.matches(record);
    });
    return records;
}

auto RecordQuery::get(const device::PortId& port) const
    -> std::optional<device::DeviceRecord> {
    return registry_.get(port);
}

auto RecordQuery::counts() const -> StatusCounts {
    StatusCounts counts;
    for (const auto& record : registry_.snapshot().records) {
        switch (record.status) {
            case device::DeviceStatus::Pending:
                ++counts.pending;
                break;
            case device::DeviceStatus::Reading:
                ++counts.reading;
                break;
            case device::DeviceStatus::Success:
                ++counts.success;
                break;
            case device::DeviceStatus::Failed:
                ++counts.failed;
                break;
            case device::DeviceStatus::Removed:
                ++counts.removed;
                break;
        }
    }
    return counts;
}

auto RecordQuery::exportSnapshot() const -> ExportSnapshot {
    auto snap = registry_.snapshot();
    ExportSnapshot result;
    result.taken_at = snap.taken_at;
    result.version = snap.version;
    result.rows.reserve(snap.records.size());
    for (const auto& record : snap.records) {
        result.rows.push_back(toExportRow(record));
    }
    return result;
}

auto RecordQuery::subscribe(device::DeviceRegistry::Listener listener,
                            bool include_updates)
    -> device::DeviceRegistry::Token {
    if (include_updates || !listener) {
        return registry_.subscribe(std::move(listener));
    }
    return registry_.subscribe(
        [listener = std::move(listener)](const device::RegistryEvent& event) {
            if (event.type != device::RegistryEvent::Type::Updated) {
                listener(event);
            }
        });
}

void RecordQuery::unsubscribe(device::DeviceRegistry::Token token) {
    registry_.unsubscribe(token);
}

auto RecordQuery::toExportRow(const device::DeviceRecord& record)
    -> ExportRow {
    ExportRow row;
    row.timestamp = record.last_attempt.value_or(record.first_seen);
    row.port_id = record.port_id;
    if (record.status == device::DeviceStatus::Success && record.mac) {
        row.mac_or_empty = *record.mac;
    } else if (record.status == device::DeviceStatus::Removed &&
               record.last_known_mac) {
        row.mac_or_empty = *record.last_known_mac;
    }
    row.status_label = std::string(device::statusToString(record.status));
    return row;
}

auto RecordQuery::formatStatusLine(const StatusCounts& counts)
    -> std::string {
    std::ostringstream oss;
    oss << counts.total() << (counts.total() == 1 ? " port: " : " ports: ")
        << counts.pending << " pending, " << counts.reading << " reading, "
        << counts.success << " success, " << counts.failed << " failed, "
        << counts.removed << " removed";
    return oss.str();
}

}  // namespace macscout::query
