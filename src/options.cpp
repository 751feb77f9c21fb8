#include "paramscript/options.h"
#include "paramscript/grammar.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace paramscript {

static std::optional<bool> parseBool(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    if (text == "true" || text == "yes" || text == "on" || text == "1") return true;
    if (text == "false" || text == "no" || text == "off" || text == "0") return false;
    return std::nullopt;
}

bool loadEvaluatorOptionsFromFile(const std::string& path, EvaluatorOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        std::string trimmed = ExpressionGrammar::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        size_t eqPos = trimmed.find('=');
        if (eqPos == std::string::npos) {
            std::cerr << "Warning: " << path << ":" << lineNumber << ": expected key = value\n";
            continue;
        }
        std::string key = ExpressionGrammar::trim(trimmed.substr(0, eqPos));
        std::string value = ExpressionGrammar::trim(trimmed.substr(eqPos + 1));

        // Trailing comment after the value
        size_t hashPos = value.find('#');
        if (hashPos != std::string::npos) {
            value = ExpressionGrammar::trim(value.substr(0, hashPos));
        }

        if (key == "maxRangeElements") {
            try {
                long n = std::stol(value);
                if (n <= 0) throw std::out_of_range("non-positive");
                options.maxRangeElements = static_cast<size_t>(n);
            } catch (const std::exception&) {
                std::cerr << "Warning: " << path << ":" << lineNumber
                          << ": invalid value for maxRangeElements: " << value << "\n";
            }
            continue;
        }

        bool* target = nullptr;
        if (key == "evaluation") target = &options.evaluation;
        else if (key == "sortDefinitions") target = &options.sortDefinitions;
        else if (key == "strictOrdering") target = &options.strictOrdering;
        else if (key == "strictArithmetic") target = &options.strictArithmetic;
        else if (key == "protection") target = &options.protection;
        else if (key == "verbose") target = &options.verbose;
        else if (key == "silent") target = &options.silent;

        if (!target) {
            std::cerr << "Warning: " << path << ":" << lineNumber << ": unknown option '" << key << "'\n";
            continue;
        }
        auto parsed = parseBool(value);
        if (!parsed) {
            std::cerr << "Warning: " << path << ":" << lineNumber
                      << ": invalid boolean for " << key << ": " << value << "\n";
            continue;
        }
        *target = *parsed;
    }
    return true;
}

}  // namespace paramscript
