#include "paramscript/dependency_resolver.h"
#include "paramscript/constants.h"
#include "paramscript/errors.h"
#include "paramscript/grammar.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <iterator>
#include <list>

namespace paramscript {

// ============================================================================
// Field classification
// ============================================================================

static const std::string* markerText(const Value& value) {
    if (value.isText()) return &value.asText();
    if (value.is<PathValue>()) return &value.as<PathValue>().str();
    return nullptr;
}

bool DependencyResolver::isDynamic(const Value& value) {
    const std::string* text = markerText(value);
    return text && ExpressionGrammar::hasMarkers(*text);
}

std::vector<std::string> DependencyResolver::references(const Value& value) {
    const std::string* text = markerText(value);
    if (!text) return {};
    return ExpressionGrammar::references(*text);
}

bool DependencyResolver::isReady(const std::string& name, const Value& value, const Record& scope) {
    for (const auto& ref : references(value)) {
        if (ref == name) continue;  // ${own name} is kept verbatim by the evaluator
        if (!scope.has(ref) && !Constants::isConstant(ref)) return false;
    }
    return true;
}

// ============================================================================
// Ordering
// ============================================================================

OrderingResult DependencyResolver::analyze(const Record& record, OrderingMode mode) {
    OrderingResult result;

    std::list<size_t> pending;
    for (size_t i = 0; i < record.size(); ++i) {
        if (isDynamic(record.at(i))) {
            pending.push_back(i);
            continue;
        }
        result.record.set(record.keyAt(i), record.at(i));
        result.order.push_back(record.keyAt(i));
    }
    result.staticCount = result.order.size();
    result.dynamicCount = pending.size();

    while (!pending.empty()) {
        auto ready = std::find_if(pending.begin(), pending.end(), [&](size_t i) {
            return isReady(record.keyAt(i), record.at(i), result.record);
        });

        if (ready == pending.end()) {
            if (result.pendingAtFailure == 0) {
                result.pendingAtFailure = pending.size();
            }
            if (mode == OrderingMode::Strict) {
                result.errorMessage = OrderingFailure(pending.size(), record.size()).what();
                return result;
            }
            ready = std::prev(pending.end());
            result.forced.push_back(record.keyAt(*ready));
        }

        result.record.set(record.keyAt(*ready), record.at(*ready));
        result.order.push_back(record.keyAt(*ready));
        pending.erase(ready);
    }

    if (!result.forced.empty()) {
        result.errorMessage = OrderingFailure(result.pendingAtFailure, record.size()).what();
    }
    result.success = true;
    return result;
}

Record DependencyResolver::sort(const Record& record, OrderingMode mode, bool silent) {
    OrderingResult result = analyze(record, mode);
    if (!result.success) {
        throw OrderingFailure(result.pendingAtFailure, record.size());
    }

    if (!result.forced.empty() && !silent) {
        std::cerr << "Warning: " << result.errorMessage << "; forced:";
        for (const auto& name : result.forced) {
            std::cerr << " " << name;
        }
        std::cerr << "\n";
    }
    return result.record;
}

std::vector<std::pair<std::string, bool>> DependencyResolver::isDefined(const Record& record) {
    std::vector<std::pair<std::string, bool>> defined;
    Record scope;
    for (size_t i = 0; i < record.size(); ++i) {
        defined.emplace_back(record.keyAt(i), isReady(record.keyAt(i), record.at(i), scope));
        scope.set(record.keyAt(i), record.at(i));
    }
    return defined;
}

Record combine(const Record& left, const Record& right, OrderingMode mode) {
    return DependencyResolver::sort(left.concat(right), mode);
}

// ============================================================================
// JSON report
// ============================================================================

std::string generateOrderingJSON(const OrderingResult& result) {
    nlohmann::json j;

    j["stats"]["fields"] = result.order.size() + (result.success ? 0 : result.pendingAtFailure);
    j["stats"]["static"] = result.staticCount;
    j["stats"]["dynamic"] = result.dynamicCount;
    j["stats"]["forced"] = result.forced.size();
    j["stats"]["success"] = result.success;

    if (!result.errorMessage.empty()) {
        j["error"] = result.errorMessage;
    }

    nlohmann::json fieldsJson = nlohmann::json::array();
    for (size_t i = 0; i < result.order.size(); ++i) {
        const std::string& name = result.order[i];
        const Value& value = result.record.get(name);

        nlohmann::json fieldJson;
        fieldJson["position"] = i;
        fieldJson["name"] = name;
        fieldJson["dynamic"] = DependencyResolver::isDynamic(value);
        fieldJson["references"] = DependencyResolver::references(value);
        fieldJson["forced"] = std::find(result.forced.begin(), result.forced.end(), name) !=
                              result.forced.end();
        fieldsJson.push_back(fieldJson);
    }
    j["order"] = fieldsJson;

    return j.dump(2);
}

}  // namespace paramscript
