#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace paramscript {

// Forward declarations
struct Expression;

// Type alias for smart pointers
using ExprPtr = std::shared_ptr<Expression>;

// ============================================================================
// Expression Types
// ============================================================================

struct NumberLiteral {
    double value;
};

struct StringLiteral {
    std::string value;
};

struct BooleanLiteral {
    bool value;
};

struct NoneLiteral {};

struct Name {
    std::string name;
};

// [a, b, c]
struct ListLiteral {
    std::vector<ExprPtr> items;
};

// $[...] and its bracketed sub-blocks; rows are separated by ';'
struct ArrayLiteral {
    std::vector<std::vector<ExprPtr>> rows;
    bool nested = false;  // false for the outer $[...]
};

// a:b or a:step:b inside an array literal
struct RangeLiteral {
    double start;
    double step;
    double stop;
};

struct UnaryOp {
    std::string op;  // "-", "+"
    ExprPtr operand;
};

struct BinaryOp {
    std::string op;  // "+", "-", "*", "/", "//", "%", "**", "@"
    ExprPtr left;
    ExprPtr right;
};

struct FunctionCall {
    std::string name;
    std::vector<ExprPtr> args;
};

// One item of a subscript: an index or a start:stop:step slice
struct IndexItem {
    bool isSlice = false;
    ExprPtr index;
    ExprPtr start;  // null when omitted
    ExprPtr stop;
    ExprPtr step;
};

struct Subscript {
    ExprPtr target;
    std::vector<IndexItem> items;
};

// x.T
struct Transpose {
    ExprPtr operand;
};

// Expression is a variant of all possible expression types
struct Expression {
    std::variant<
        NumberLiteral,
        StringLiteral,
        BooleanLiteral,
        NoneLiteral,
        Name,
        ListLiteral,
        ArrayLiteral,
        RangeLiteral,
        UnaryOp,
        BinaryOp,
        FunctionCall,
        Subscript,
        Transpose
    > node;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    template<typename T>
    T& as() { return std::get<T>(node); }
};

// ============================================================================
// Helper functions for AST construction
// ============================================================================

template<typename T>
inline ExprPtr makeExpr(T node) {
    auto expr = std::make_shared<Expression>();
    expr->node = std::move(node);
    return expr;
}

inline ExprPtr makeNumber(double value) {
    return makeExpr(NumberLiteral{value});
}

inline ExprPtr makeString(const std::string& value) {
    return makeExpr(StringLiteral{value});
}

inline ExprPtr makeName(const std::string& name) {
    return makeExpr(Name{name});
}

inline ExprPtr makeUnaryOp(const std::string& op, ExprPtr operand) {
    return makeExpr(UnaryOp{op, std::move(operand)});
}

inline ExprPtr makeBinaryOp(const std::string& op, ExprPtr left, ExprPtr right) {
    return makeExpr(BinaryOp{op, std::move(left), std::move(right)});
}

inline ExprPtr makeFunctionCall(const std::string& name, std::vector<ExprPtr> args) {
    return makeExpr(FunctionCall{name, std::move(args)});
}

}  // namespace paramscript
