/*
 * exporter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-10

Description: CSV and JSON export of registry snapshots

**************************************************/

#include "exporter.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace macscout::exporter {

using json = nlohmann::json;

auto formatTimestamp(device::TimePoint time) -> std::string {
    std::time_t raw = device::Clock::to_time_t(time);
    std::tm local{};
    localtime_r(&raw, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

auto escapeCsvField(const std::string& field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char c : field) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

void writeCsv(std::ostream& out, const query::ExportSnapshot& snapshot) {
    out << "timestamp,port,mac,status\r\n";
    for (const auto& row : snapshot.rows) {
        out << escapeCsvField(formatTimestamp(row.timestamp)) << ','
            << escapeCsvField(row.port_id) << ','
            << escapeCsvField(row.mac_or_empty) << ','
            << escapeCsvField(row.status_label) << "\r\n";
    }
}

void writeJson(std::ostream& out, const query::ExportSnapshot& snapshot) {
    auto rows = json::array();
    for (const auto& row : snapshot.rows) {
        rows.push_back({{"timestamp", formatTimestamp(row.timestamp)},
                        {"port", row.port_id},
                        {"mac", row.mac_or_empty},
                        {"status", row.status_label}});
    }
    out << rows.dump(2) << '\n';
}

auto formatForPath(const std::filesystem::path& path) -> ExportFormat {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return extension == ".json" ? ExportFormat::Json : ExportFormat::Csv;
}

void exportToFile(const std::filesystem::path& path,
                  const query::ExportSnapshot& snapshot) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw ExportError("Cannot open " + path.string() + " for writing");
    }

    const auto format = formatForPath(path);
    if (format == ExportFormat::Json) {
        writeJson(file, snapshot);
    } else {
        writeCsv(file, snapshot);
    }
    file.flush();
    if (!file) {
        throw ExportError("Failed to write " + path.string());
    }

    spdlog::info("Exported {} record(s) to {} ({})", snapshot.rows.size(),
                 path.string(), format == ExportFormat::Json ? "json" : "csv");
}

}  // namespace macscout::exporter
