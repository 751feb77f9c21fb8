#include "paramscript/serialization.h"
#include "paramscript/dependency_resolver.h"
#include "paramscript/errors.h"
#include "paramscript/evaluator.h"
#include "paramscript/grammar.h"
#include "paramscript/parser.h"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace paramscript {

// ============================================================================
// Text format
// ============================================================================

static std::string quoteText(const std::string& text, char quote) {
    return quote + ExpressionGrammar::escapeQuoted(text, quote) + quote;
}

static std::string listToLiteral(const List& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += items[i].isText() ? toRepr(items[i]) : valueToLiteral(items[i]);
    }
    return out + "]";
}

std::string valueToLiteral(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Text: return quoteText(value.asText(), '"');
        case ValueKind::Path: return "p" + quoteText(value.as<PathValue>().str(), '"');
        case ValueKind::List: return listToLiteral(value.as<List>());
        case ValueKind::Array: return "array(" + toText(value) + ")";
        case ValueKind::Record: return recordToJson(value.asRecord()).dump();
        default: return toText(value);
    }
}

static bool isQuoted(const std::string& text, size_t prefix) {
    return text.size() >= prefix + 2 && text[prefix] == '"' && text.back() == '"';
}

Value literalToValue(const std::string& text) {
    static const ExpressionParser parser;

    std::string rhs = ExpressionGrammar::trim(text);
    if (rhs.empty() || rhs == "None") return Value();
    if (isQuoted(rhs, 0)) {
        return Value(ExpressionGrammar::unescapeQuoted(rhs.substr(1, rhs.size() - 2)));
    }
    if (rhs[0] == 'p' && isQuoted(rhs, 1)) {
        return Value(PathValue(ExpressionGrammar::unescapeQuoted(rhs.substr(2, rhs.size() - 3))));
    }

    if (rhs[0] == '{') {
        try {
            return Value(recordFromJson(nlohmann::ordered_json::parse(rhs)));
        } catch (const nlohmann::json::parse_error&) {
            return Value(rhs);
        }
    }

    ParseResult parsed = parser.parse(rhs);
    if (!parsed.success) return Value(rhs);
    try {
        return ExpressionEvaluator().evaluate(parsed.expression);
    } catch (const UnresolvedReference&) {
        return Value(rhs);
    } catch (const EvaluationError&) {
        return Value(rhs);
    }
}

std::string recordToText(const Record& record) {
    std::ostringstream ss;
    ss << "# record with " << record.size() << " fields\n\n";
    for (size_t i = 0; i < record.size(); ++i) {
        ss << record.keyAt(i) << "=" << valueToLiteral(record.at(i)) << "\n";
    }
    return ss.str();
}

Record recordFromText(const std::string& text) {
    Record record;
    std::istringstream in(text);
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        std::string trimmed = ExpressionGrammar::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("line " + std::to_string(lineNumber) + ": expected name=value");
        }
        std::string name = ExpressionGrammar::trim(trimmed.substr(0, eq));
        if (name.empty()) {
            throw std::runtime_error("line " + std::to_string(lineNumber) + ": missing field name");
        }
        if (Record::isReserved(name)) {
            std::cerr << "Warning: line " << lineNumber << ": reserved name '" << name << "' skipped\n";
            continue;
        }
        record.set(name, literalToValue(trimmed.substr(eq + 1)));
    }
    return record;
}

void writeRecord(const std::string& path, const Record& record) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + path);
    }
    file << recordToText(record);
}

Record readRecord(const std::string& path) {
    auto content = readFile(path);
    if (!content) {
        throw std::runtime_error("Could not open file: " + path);
    }
    return recordFromText(*content);
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::ordered_json valueToJson(const Value& value) {
    switch (value.kind()) {
        case ValueKind::None: return nullptr;
        case ValueKind::Bool: return value.as<bool>();
        case ValueKind::Number: {
            double x = value.asNumber();
            if (!std::isfinite(x)) return {{"$number", formatNumber(x)}};
            return x;
        }
        case ValueKind::Text: return value.asText();
        case ValueKind::Path: return {{"$path", value.as<PathValue>().str()}};
        case ValueKind::List: {
            nlohmann::ordered_json items = nlohmann::ordered_json::array();
            for (const auto& item : value.as<List>()) {
                items.push_back(valueToJson(item));
            }
            return items;
        }
        case ValueKind::Array: {
            const auto& array = value.as<NdArray>();
            nlohmann::ordered_json j;
            j["$array"]["shape"] = array.shape;
            j["$array"]["data"] = array.data;
            return j;
        }
        case ValueKind::Record: return recordToJson(value.asRecord());
        case ValueKind::Error: {
            const auto& marker = value.as<ErrorMarker>();
            nlohmann::ordered_json j;
            j["$error"] = marker.cause;
            j["missing"] = marker.missingName;
            return j;
        }
    }
    return nullptr;
}

Value valueFromJson(const nlohmann::ordered_json& j) {
    if (j.is_null()) return Value();
    if (j.is_boolean()) return Value(j.get<bool>());
    if (j.is_number()) return Value(j.get<double>());
    if (j.is_string()) return Value(j.get<std::string>());
    if (j.is_array()) {
        List items;
        for (const auto& item : j) {
            items.push_back(valueFromJson(item));
        }
        return Value(std::move(items));
    }

    if (j.contains("$path")) {
        return Value(PathValue(j.at("$path").get<std::string>()));
    }
    if (j.contains("$number")) {
        return Value(std::strtod(j.at("$number").get<std::string>().c_str(), nullptr));
    }
    if (j.contains("$array")) {
        NdArray array;
        array.shape = j.at("$array").at("shape").get<std::vector<size_t>>();
        array.data = j.at("$array").at("data").get<std::vector<double>>();
        if (array.ndim() > MAX_ARRAY_DIMENSIONS || NdArray::elementCount(array.shape) != array.size()) {
            throw std::runtime_error("array shape " + j.at("$array").at("shape").dump() +
                                     " does not match its data");
        }
        return Value(std::move(array));
    }
    if (j.contains("$error")) {
        ErrorMarker marker;
        marker.cause = j.at("$error").get<std::string>();
        if (j.contains("missing")) marker.missingName = j.at("missing").get<std::string>();
        return Value(std::move(marker));
    }
    return Value(recordFromJson(j));
}

nlohmann::ordered_json recordToJson(const Record& record) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (size_t i = 0; i < record.size(); ++i) {
        j[record.keyAt(i)] = valueToJson(record.at(i));
    }
    return j;
}

Record recordFromJson(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("expected a JSON object, got " + std::string(j.type_name()));
    }
    Record record;
    for (const auto& [name, value] : j.items()) {
        record.set(name, valueFromJson(value));
    }
    return record;
}

// ============================================================================
// Reports
// ============================================================================

std::string generateRecordReport(const Record& definitions, const Record& snapshot) {
    std::ostringstream ss;
    auto failures = collectErrors(snapshot);

    size_t dynamicCount = 0;
    for (const auto& value : definitions.values()) {
        if (DependencyResolver::isDynamic(value)) ++dynamicCount;
    }

    ss << "=== Evaluation Report ===\n";
    ss << "Status: " << (failures.empty() ? "SUCCESS" : "FAILED") << "\n";
    ss << "Fields: " << snapshot.size() << " (" << (definitions.size() - dynamicCount)
       << " static, " << dynamicCount << " dynamic)\n";
    ss << "Errors: " << failures.size() << "\n";

    ss << "\n--- Values (" << snapshot.size() << ") ---\n";
    for (size_t i = 0; i < snapshot.size(); ++i) {
        const std::string& name = snapshot.keyAt(i);
        ss << "  " << std::setw(20) << std::left << name << " = " << toRepr(snapshot.at(i));
        const Value* raw = definitions.find(name);
        if (raw && DependencyResolver::isDynamic(*raw)) {
            ss << "    <- " << valueToLiteral(*raw);
        }
        ss << "\n";
    }

    if (!failures.empty()) {
        ss << "\n--- Errors (" << failures.size() << ") ---\n";
        for (const auto& [name, marker] : failures) {
            ss << "  " << std::setw(20) << std::left << name << " : " << marker.cause;
            if (!marker.missingName.empty()) {
                ss << " [missing: " << marker.missingName << "]";
            }
            ss << "\n";
        }
    }

    return ss.str();
}

}  // namespace paramscript
