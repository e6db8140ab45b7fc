#pragma once

/**
 * @file ReportJson.hpp
 * @brief JSON form of parsed reports for the tool-call boundary
 */

#include <tether/report/ParsedReport.hpp>

#include <nlohmann/json.hpp>

namespace tether {

/**
 * @brief Serialize a parsed report
 *
 * Absent optional fields are omitted, never written as null or zero.
 * parse_incomplete and missing_fields are always present.
 *
 * @param include_raw Also emit the raw engine text under "raw"
 */
[[nodiscard]] nlohmann::json ToJson(const ParsedReport &report, bool include_raw = false);

/// Payload only (the object that ToJson places under "data")
[[nodiscard]] nlohmann::json DataToJson(const ReportData &data);

} // namespace tether
