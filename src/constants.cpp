#include "paramscript/constants.h"
#include <limits>

namespace paramscript {

const std::map<std::string, ConstantInfo> Constants::registry_ = {
    {"pi", {3.14159265358979323846, "Pi"}},
    {"tau", {6.28318530717958647692, "2 Pi"}},
    {"e", {2.71828182845904523536, "Euler's number"}},
    {"inf", {std::numeric_limits<double>::infinity(), "Positive infinity"}},
    {"nan", {std::numeric_limits<double>::quiet_NaN(), "Not a number"}}
};

bool Constants::isConstant(const std::string& name) {
    return registry_.count(name) > 0;
}

std::optional<double> Constants::lookup(const std::string& name) {
    auto it = registry_.find(name);
    if (it == registry_.end()) return std::nullopt;
    return it->second.value;
}

const std::map<std::string, ConstantInfo>& Constants::getAll() {
    return registry_;
}

}  // namespace paramscript
