#pragma once

#include <stdexcept>
#include <string>

namespace paramscript {

// ============================================================================
// Error taxonomy
// ============================================================================

// Direct record access on a missing (or reserved) name
class FieldNotFound : public std::runtime_error {
public:
    explicit FieldNotFound(const std::string& name)
        : std::runtime_error("field not found: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// A name used by an expression is not defined in the current context
class UnresolvedReference : public std::runtime_error {
public:
    explicit UnresolvedReference(const std::string& name)
        : std::runtime_error("unresolved reference to `" + name + "`"), name_(name) {}

    UnresolvedReference(const std::string& name, const std::string& message)
        : std::runtime_error(message), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Arithmetic, type, shape or index failure while computing a value
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Text that is not a valid expression
class ExpressionSyntaxError : public std::runtime_error {
public:
    explicit ExpressionSyntaxError(const std::string& message)
        : std::runtime_error(message) {}
};

// Strict dependency sort could not order every dynamic field
class OrderingFailure : public std::runtime_error {
public:
    OrderingFailure(size_t pending, size_t total)
        : std::runtime_error("could not order " + std::to_string(pending) + "/" +
                             std::to_string(total) + " expressions"),
          pending_(pending), total_(total) {}

    size_t pending() const { return pending_; }
    size_t total() const { return total_; }

private:
    size_t pending_;
    size_t total_;
};

}  // namespace paramscript
