/*
 * exporter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-10

Description: CSV and JSON export of registry snapshots

**************************************************/

#ifndef MACSCOUT_EXPORT_EXPORTER_HPP
#define MACSCOUT_EXPORT_EXPORTER_HPP

#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>

#include "macscout/query/record_query.hpp"

namespace macscout::exporter {

class ExportError : public std::runtime_error {
public:
    explicit ExportError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class ExportFormat { Csv, Json };

/**
 * @brief Local time as "YYYY-MM-DD HH:MM:SS".
 */
[[nodiscard]] auto formatTimestamp(device::TimePoint time) -> std::string;

/**
 * @brief Quote a CSV field when it holds a comma, quote or line break.
 */
[[nodiscard]] auto escapeCsvField(const std::string& field) -> std::string;

/**
 * @brief Header `timestamp,port,mac,status`, then one line per row.
 */
void writeCsv(std::ostream& out, const query::ExportSnapshot& snapshot);

/**
 * @brief A JSON array of {timestamp, port, mac, status} objects.
 */
void writeJson(std::ostream& out, const query::ExportSnapshot& snapshot);

/**
 * @brief ".json" selects JSON, anything else CSV. Case-insensitive.
 */
[[nodiscard]] auto formatForPath(const std::filesystem::path& path)
    -> ExportFormat;

/**
 * @throws ExportError if the file cannot be written
 */
void exportToFile(const std::filesystem::path& path,
                  const query::ExportSnapshot& snapshot);

}  // namespace macscout::exporter

#endif  // MACSCOUT_EXPORT_EXPORTER_HPP
