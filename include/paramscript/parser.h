#pragma once

#include "ast.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace paramscript {

// ============================================================================
// Parser Result
// ============================================================================

struct ParseResult {
    bool success = false;
    ExprPtr expression;
    std::string errorMessage;
    size_t column = 0;  // 1-based column of the first error
};

// ============================================================================
// Expression Parser
// ============================================================================

/**
 * @brief PEG parser for the arithmetic/array expression language.
 *
 * Accepts numbers, quoted strings, true/false/None, names, list literals,
 * $[...] array literals with ranges, the operators + - * / // % ** @, unary
 * signs, subscripts and slices, the .T transpose and function calls.
 * The '^' alias is not part of the grammar; it is rewritten before parsing.
 */
class ExpressionParser {
public:
    ExpressionParser();
    ~ExpressionParser();

    ExpressionParser(const ExpressionParser&) = delete;
    ExpressionParser& operator=(const ExpressionParser&) = delete;

    ParseResult parse(const std::string& text) const;

    // Throws ExpressionSyntaxError on failure
    ExprPtr parseOrThrow(const std::string& text) const;

    bool isGrammarValid() const;
    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// ============================================================================
// Utility functions
// ============================================================================

// Read a file into a string
std::optional<std::string> readFile(const std::string& filepath);

// Collect referenced names (function names excluded), first use first
void collectNames(const ExprPtr& expr, std::vector<std::string>& names);

// Convert AST to string representation (for debugging)
std::string astToString(const ExprPtr& expr);

}  // namespace paramscript
