#pragma once

#include <map>
#include <optional>
#include <string>

namespace paramscript {

struct ConstantInfo {
    double value;
    std::string description;
};

// Named constants visible to every expression. Inside ${...} a field of the
// same name shadows the constant.
class Constants {
public:
    static bool isConstant(const std::string& name);

    // Value of a constant, or nullopt for unknown names
    static std::optional<double> lookup(const std::string& name);

    static const std::map<std::string, ConstantInfo>& getAll();

private:
    static const std::map<std::string, ConstantInfo> registry_;
};

}  // namespace paramscript
