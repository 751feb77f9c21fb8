#pragma once

#include "paramscript/record.h"
#include <string>
#include <utility>
#include <vector>

namespace paramscript {

enum class OrderingMode {
    Strict,   // unorderable fields raise OrderingFailure
    Lenient   // unorderable fields are force-accepted, last one first
};

// ============================================================================
// Ordering Result
// ============================================================================

struct OrderingResult {
    bool success = false;
    std::string errorMessage;

    Record record;                    // reordered fields (partial on strict failure)
    std::vector<std::string> order;   // names in evaluation order

    size_t staticCount = 0;
    size_t dynamicCount = 0;
    size_t pendingAtFailure = 0;      // pending fields when the first scan stalled

    // Fields accepted without their references being defined (lenient only)
    std::vector<std::string> forced;
};

// ============================================================================
// Dependency Resolver
// ============================================================================

/**
 * @brief Reorders a record so that every dynamic field follows the fields it
 * references.
 *
 * Static fields (no unescaped marker) keep their relative order at the front.
 * Dynamic fields are then appended one by one, always the leftmost pending
 * field whose references are all defined. A name is defined when it is already
 * in the reordered record or is a builtin constant.
 */
class DependencyResolver {
public:
    // Text or path value with at least one unescaped marker
    static bool isDynamic(const Value& value);

    // Names referenced by the markers of a value (empty for static values)
    static std::vector<std::string> references(const Value& value);

    /**
     * @brief Reordered copy of a record.
     *
     * Lenient mode prints a single warning on stderr (unless silent) when it
     * has to force fields.
     * @throws OrderingFailure in strict mode when a scan makes no progress
     */
    static Record sort(const Record& record, OrderingMode mode = OrderingMode::Lenient,
                       bool silent = false);

    // Same ordering as sort(), reported instead of thrown
    static OrderingResult analyze(const Record& record, OrderingMode mode = OrderingMode::Lenient);

    // Per field, in record order: are all references defined by earlier
    // fields (or constants)?
    static std::vector<std::pair<std::string, bool>> isDefined(const Record& record);

private:
    static bool isReady(const std::string& name, const Value& value, const Record& scope);
};

// Concatenate two records (right side wins) and sort the result
Record combine(const Record& left, const Record& right, OrderingMode mode = OrderingMode::Lenient);

// Generate JSON output for the ordering report
std::string generateOrderingJSON(const OrderingResult& result);

}  // namespace paramscript
