#pragma once

#include "paramscript/path_value.h"
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace paramscript {

class Record;
struct Value;

using RecordPtr = std::shared_ptr<const Record>;
using List = std::vector<Value>;

// ============================================================================
// Numeric array (1 to 4 dimensions, row-major)
// ============================================================================

constexpr size_t MAX_ARRAY_DIMENSIONS = 4;
constexpr size_t MAX_ARRAY_ELEMENTS = 10000000;

struct NdArray {
    std::vector<size_t> shape;  // empty shape = 0-d scalar (internal only)
    std::vector<double> data;

    size_t ndim() const { return shape.size(); }
    size_t size() const { return data.size(); }

    static NdArray vector(std::vector<double> values);
    static NdArray matrix(size_t rows, size_t cols, std::vector<double> values);
    static NdArray filled(std::vector<size_t> shape, double value);

    // Number of elements implied by a shape
    static size_t elementCount(const std::vector<size_t>& shape);

    bool operator==(const NdArray& other) const {
        return shape == other.shape && data == other.data;
    }
};

// ============================================================================
// Error marker
// ============================================================================

// Sentinel stored in a snapshot field whose evaluation failed
struct ErrorMarker {
    std::string cause;
    std::string missingName;  // set for unresolved references

    std::string toString() const { return "< " + cause + " >"; }

    bool operator==(const ErrorMarker& other) const {
        return cause == other.cause && missingName == other.missingName;
    }
};

// ============================================================================
// Value
// ============================================================================

enum class ValueKind {
    None,
    Bool,
    Number,
    Text,
    Path,
    List,
    Array,
    Record,
    Error
};

struct Value {
    std::variant<
        std::monostate,
        bool,
        double,
        std::string,
        PathValue,
        List,
        NdArray,
        RecordPtr,
        ErrorMarker
    > node;

    Value() = default;
    Value(bool b) : node(b) {}
    Value(int n) : node(static_cast<double>(n)) {}
    Value(long n) : node(static_cast<double>(n)) {}
    Value(double d) : node(d) {}
    Value(const char* s) : node(std::string(s)) {}
    Value(std::string s) : node(std::move(s)) {}
    Value(PathValue p) : node(std::move(p)) {}
    Value(List l) : node(std::move(l)) {}
    Value(NdArray a) : node(std::move(a)) {}
    Value(RecordPtr r) : node(std::move(r)) {}
    Value(const Record& r);
    Value(ErrorMarker e) : node(std::move(e)) {}

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    template<typename T>
    T& as() { return std::get<T>(node); }

    ValueKind kind() const { return static_cast<ValueKind>(node.index()); }

    bool isNone() const { return is<std::monostate>(); }
    bool isNumber() const { return is<double>(); }
    bool isText() const { return is<std::string>(); }
    bool isError() const { return is<ErrorMarker>(); }

    double asNumber() const { return as<double>(); }
    const std::string& asText() const { return as<std::string>(); }
    const Record& asRecord() const;

    // An empty list assigned to an existing field deletes it
    bool isEmptyList() const { return is<List>() && as<List>().empty(); }

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
};

// ============================================================================
// Textual forms
// ============================================================================

// Shortest round-trip representation of a double ("5", "0.1", "1e+21")
std::string formatNumber(double value);

// Text substituted for a value by interpolation: strings and paths raw,
// lists as [1,2,'a'], arrays as nested brackets, errors as "< cause >"
std::string toText(const Value& value);

// Same as toText, except strings are quoted (used for list elements)
std::string toRepr(const Value& value);

std::string kindToString(ValueKind kind);

}  // namespace paramscript
