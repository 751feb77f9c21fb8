#pragma once

#include <cstddef>
#include <string>

namespace paramscript {

/**
 * @brief Options for record evaluation.
 */
struct EvaluatorOptions {
    bool evaluation = true;          // false: substitute markers, never compute
    bool sortDefinitions = false;    // reorder fields before evaluating
    bool strictOrdering = false;     // unorderable fields raise OrderingFailure
    bool strictArithmetic = false;   // failed arithmetic becomes an ErrorMarker, not text
    bool protection = false;         // rewrite $name to ${name} for known fields
    size_t maxRangeElements = 100;   // largest a:b / a:step:b expansion
    bool verbose = false;            // diagnostics on stderr
    bool silent = false;             // suppress warnings
};

/**
 * @brief Load evaluator options from a "key = value" file.
 *
 * Lines starting with '#' and blank lines are skipped. Booleans accept
 * true/false, yes/no, on/off and 1/0. Unknown keys and bad values are
 * reported on stderr and ignored.
 * @return false if the file cannot be opened
 */
bool loadEvaluatorOptionsFromFile(const std::string& path, EvaluatorOptions& options);

}  // namespace paramscript
