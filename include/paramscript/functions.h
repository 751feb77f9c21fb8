#pragma once

#include "paramscript/value.h"
#include <string>
#include <vector>

namespace paramscript {

// ============================================================================
// Operators
// ============================================================================

// "-" and "+" on numbers, lists and arrays
Value applyUnaryOperator(const std::string& op, const Value& operand);

/**
 * @brief Apply + - * / // % ** @ to two values.
 *
 * Scalars follow IEEE arithmetic. Lists and arrays are combined element-wise
 * with broadcasting; '*' never performs a matrix product, only '@' does.
 * A result involving an array operand is an array, otherwise lists stay
 * lists. '+' also concatenates two texts.
 * @throws EvaluationError for unsupported operand types or shapes
 */
Value applyBinaryOperator(const std::string& op, const Value& left, const Value& right);

// ============================================================================
// Standard functions
// ============================================================================

bool isStandardFunction(const std::string& name);

/**
 * @brief Evaluate a built-in function.
 * @throws UnresolvedReference for unknown function names
 * @throws EvaluationError for bad arguments
 */
Value evaluateStandardFunction(const std::string& name, const std::vector<Value>& args);

}  // namespace paramscript
