#pragma once

#include "paramscript/record.h"
#include <nlohmann/json.hpp>
#include <string>

namespace paramscript {

// ============================================================================
// Text format: one name=value line per field
// ============================================================================

// Right-hand side of a field line: 5, true, None, "raw text", p"raw/path",
// [1,'a'], array([[1,2]]), {json object}
std::string valueToLiteral(const Value& value);

// Inverse of valueToLiteral; anything that is not a literal is kept as text
Value literalToValue(const std::string& text);

std::string recordToText(const Record& record);

/**
 * @brief Parse the text format.
 *
 * Splits each line on its first '=', skips blank and '#' lines. Reserved names
 * are skipped with a warning.
 * @throws std::runtime_error on a line without '='
 */
Record recordFromText(const std::string& text);

// File versions (std::runtime_error if the file cannot be opened)
void writeRecord(const std::string& path, const Record& record);
Record readRecord(const std::string& path);

// ============================================================================
// JSON
// ============================================================================

nlohmann::ordered_json valueToJson(const Value& value);
Value valueFromJson(const nlohmann::ordered_json& j);

nlohmann::ordered_json recordToJson(const Record& record);

// @throws std::runtime_error if j is not an object
Record recordFromJson(const nlohmann::ordered_json& j);

// ============================================================================
// Reports
// ============================================================================

// Definitions next to their evaluated values, failed fields listed at the end
std::string generateRecordReport(const Record& definitions, const Record& snapshot);

}  // namespace paramscript
