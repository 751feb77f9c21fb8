#pragma once

#include "paramscript/ast.h"
#include "paramscript/grammar.h"
#include "paramscript/options.h"
#include "paramscript/parser.h"
#include "paramscript/record.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace paramscript {

// ============================================================================
// Expression Evaluator
// ============================================================================

/**
 * @brief Evaluates an expression AST.
 *
 * Names resolve to fields of the context record first, then to constants.
 * Without a context only constants are visible. A name bound to a field that
 * holds an ErrorMarker is an error.
 *
 * @throws UnresolvedReference for unknown names and functions
 * @throws EvaluationError for type, shape, index and range errors
 */
class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(const Record* context = nullptr, size_t maxRangeElements = 100);

    Value evaluate(const ExprPtr& expr) const;

private:
    const Record* context_;
    size_t maxRangeElements_;

    Value evaluateName(const std::string& name) const;
    NdArray evaluateArrayBlock(const ArrayLiteral& array) const;
    Value evaluateSubscript(const Subscript& subscript) const;
    long evaluateIndex(const ExprPtr& expr) const;
};

// ============================================================================
// Record Evaluator
// ============================================================================

/**
 * @brief Turns a record of literal and expression fields into a snapshot.
 *
 * Fields are evaluated in record order against the snapshot built so far, so
 * a reference to a later field is unresolved unless the record was sorted
 * (see EvaluatorOptions::sortDefinitions). A failing field becomes an
 * ErrorMarker and the remaining fields are still evaluated.
 */
class Evaluator {
public:
    explicit Evaluator(const EvaluatorOptions& options = EvaluatorOptions());

    // Full snapshot; never mutates the source
    Record evaluate(const Record& record) const;

    // Snapshot restricted to the given names (FieldNotFound if one is absent)
    Record evaluate(const Record& record, const std::vector<std::string>& names) const;

    // Evaluated value of one field
    Value value(const Record& record, const std::string& name) const;

    // Evaluate one raw field value against an existing snapshot
    Value evaluateField(const std::string& name, const Value& raw, const Record& snapshot) const;

    /**
     * @brief Interpolate ${...} markers of a template against a record.
     *
     * No arithmetic is applied to the template itself. Escaped markers lose
     * their backslash. A marker that cannot be resolved is left as it is and
     * reported on stderr. Never throws.
     */
    std::string format(const std::string& tmpl, const Record& record) const;

    /**
     * @brief Evaluate the record, then process a template line by line.
     *
     * Comment lines are interpolated only; a line starting with '%' becomes a
     * '#' line; other lines are interpolated and replaced by their value when
     * they are arithmetic. Inline comments are kept.
     */
    std::string formatEval(const std::string& tmpl, const Record& record) const;

    const EvaluatorOptions& options() const { return options_; }

private:
    EvaluatorOptions options_;
    std::shared_ptr<ExpressionParser> parser_;

    Value evaluateText(const std::string& name, const std::string& raw, const Record& snapshot) const;
    Value evaluatePath(const PathValue& path, const Record& snapshot) const;
    Value evaluateLiteralList(const std::string& body, const Record& snapshot) const;
    Value freezeStrings(const Value& value, const Record& snapshot) const;
    Value evaluateArithmetic(const std::string& text) const;
    Value resolveMarker(const Marker& marker, const Record& snapshot) const;
    std::string substitute(const std::string& text, const Record& snapshot) const;
    std::string evaluateLine(const std::string& line, const Record& snapshot) const;
};

// Names and markers of the failed fields of a snapshot
std::vector<std::pair<std::string, ErrorMarker>> collectErrors(const Record& snapshot);

}  // namespace paramscript
