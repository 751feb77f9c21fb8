#include "paramscript/value.h"
#include "paramscript/grammar.h"
#include "paramscript/record.h"
#include <charconv>
#include <stdexcept>

namespace paramscript {

// ============================================================================
// NdArray
// ============================================================================

NdArray NdArray::vector(std::vector<double> values) {
    NdArray a;
    a.shape = {values.size()};
    a.data = std::move(values);
    return a;
}

NdArray NdArray::matrix(size_t rows, size_t cols, std::vector<double> values) {
    if (values.size() != rows * cols) {
        throw std::invalid_argument("matrix data does not match shape " +
                                    std::to_string(rows) + "x" + std::to_string(cols));
    }
    NdArray a;
    a.shape = {rows, cols};
    a.data = std::move(values);
    return a;
}

NdArray NdArray::filled(std::vector<size_t> shape, double value) {
    NdArray a;
    a.data.assign(elementCount(shape), value);
    a.shape = std::move(shape);
    return a;
}

size_t NdArray::elementCount(const std::vector<size_t>& shape) {
    size_t n = 1;
    for (size_t d : shape) n *= d;
    return n;
}

// ============================================================================
// Value
// ============================================================================

Value::Value(const Record& r) : node(std::make_shared<const Record>(r)) {}

const Record& Value::asRecord() const {
    const auto& ptr = as<RecordPtr>();
    if (!ptr) throw std::runtime_error("null record value");
    return *ptr;
}

bool Value::operator==(const Value& other) const {
    if (node.index() != other.node.index()) return false;
    if (is<RecordPtr>()) {
        const auto& a = as<RecordPtr>();
        const auto& b = other.as<RecordPtr>();
        if (!a || !b) return a == b;
        return *a == *b;
    }
    return node == other.node;
}

// ============================================================================
// Textual forms
// ============================================================================

std::string formatNumber(double value) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, result.ptr);
}

static void appendArray(std::string& out, const NdArray& a, size_t dim, size_t& offset) {
    out += '[';
    for (size_t i = 0; i < a.shape[dim]; ++i) {
        if (i > 0) out += ',';
        if (dim + 1 == a.ndim()) {
            out += formatNumber(a.data[offset++]);
        } else {
            appendArray(out, a, dim + 1, offset);
        }
    }
    out += ']';
}

static std::string arrayToText(const NdArray& a) {
    if (a.ndim() == 0) {
        return a.data.empty() ? "[]" : formatNumber(a.data.front());
    }
    std::string out;
    size_t offset = 0;
    appendArray(out, a, 0, offset);
    return out;
}

// Single quotes unless the text holds a single quote and no double quote
static std::string quote(const std::string& s) {
    bool single = s.find('\'') == std::string::npos || s.find('"') != std::string::npos;
    char q = single ? '\'' : '"';
    return q + ExpressionGrammar::escapeQuoted(s, q) + q;
}

std::string toText(const Value& value) {
    switch (value.kind()) {
        case ValueKind::None: return "None";
        case ValueKind::Bool: return value.as<bool>() ? "true" : "false";
        case ValueKind::Number: return formatNumber(value.asNumber());
        case ValueKind::Text: return value.asText();
        case ValueKind::Path: return value.as<PathValue>().str();
        case ValueKind::List: {
            std::string out = "[";
            const auto& items = value.as<List>();
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ',';
                out += toRepr(items[i]);
            }
            return out + "]";
        }
        case ValueKind::Array: return arrayToText(value.as<NdArray>());
        case ValueKind::Record: return value.asRecord().toString();
        case ValueKind::Error: return value.as<ErrorMarker>().toString();
    }
    return "";
}

std::string toRepr(const Value& value) {
    if (value.isText()) return quote(value.asText());
    if (value.is<PathValue>()) return quote(value.as<PathValue>().str());
    return toText(value);
}

std::string kindToString(ValueKind kind) {
    switch (kind) {
        case ValueKind::None: return "none";
        case ValueKind::Bool: return "bool";
        case ValueKind::Number: return "number";
        case ValueKind::Text: return "text";
        case ValueKind::Path: return "path";
        case ValueKind::List: return "list";
        case ValueKind::Array: return "array";
        case ValueKind::Record: return "record";
        case ValueKind::Error: return "error";
    }
    return "unknown";
}

}  // namespace paramscript
