#include "paramscript/grammar.h"
#include "paramscript/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>

namespace paramscript {

static const std::set<std::string> KEYWORDS = {
    "true", "True", "false", "False", "None", "null"
};

static bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string expressionKindToString(ExpressionKind kind) {
    switch (kind) {
        case ExpressionKind::RecursiveLiteral: return "recursive-literal";
        case ExpressionKind::LiteralText: return "literal";
        case ExpressionKind::PartialInterpolation: return "partial-interpolation";
        case ExpressionKind::Evaluation: return "evaluation";
    }
    return "unknown";
}

bool Marker::isPlainName() const {
    return ExpressionGrammar::isIdentifier(ExpressionGrammar::trim(content));
}

// ============================================================================
// Basic helpers
// ============================================================================

std::string ExpressionGrammar::trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string ExpressionGrammar::escapeQuoted(const std::string& text, char quote) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == quote) {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    return out;
}

std::string ExpressionGrammar::unescapeQuoted(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            char next = text[i + 1];
            if (next == '\\' || next == '"' || next == '\'') {
                out += next;
                ++i;
                continue;
            }
            if (next == 'n') {
                out += '\n';
                ++i;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

bool ExpressionGrammar::isIdentifier(const std::string& text) {
    if (text.empty() || !isIdentStart(text.front())) return false;
    return std::all_of(text.begin(), text.end(), isIdentChar);
}

// ============================================================================
// Comments
// ============================================================================

static std::string stripLineComment(const std::string& line) {
    size_t firstNonBlank = line.find_first_not_of(" \t");
    std::string out;
    out.reserve(line.size());
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size() && line[i + 1] == '#') {
            out += '#';
            ++i;
            continue;
        }
        if (c == '#') {
            // A leading '#' keeps the whole line (markdown titles, shebangs)
            if (i == firstNonBlank) return line;
            size_t last = out.find_last_not_of(" \t\r");
            return last == std::string::npos ? std::string() : out.substr(0, last + 1);
        }
        out += c;
    }
    return out;
}

std::string ExpressionGrammar::stripComment(const std::string& text) {
    if (text.find('#') == std::string::npos) return text;

    std::string out;
    size_t start = 0;
    while (true) {
        size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            out += stripLineComment(text.substr(start));
            break;
        }
        out += stripLineComment(text.substr(start, newline - start));
        out += '\n';
        start = newline + 1;
    }
    return out;
}

// ============================================================================
// Markers
// ============================================================================

std::vector<Marker> ExpressionGrammar::findMarkers(const std::string& text, bool skipQuoted) {
    std::vector<Marker> markers;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (skipQuoted) {
            if (quote) {
                if (c == '\\') {
                    ++i;
                } else if (c == quote) {
                    quote = 0;
                }
                continue;
            }
            if (c == '\'' || c == '"') {
                quote = c;
                continue;
            }
        }
        if ((c != '$' && c != '@') || i + 1 >= text.size() || text[i + 1] != '{') continue;

        size_t close = text.find('}', i + 2);
        if (close == std::string::npos) break;  // unterminated marker stays text

        Marker marker;
        marker.sigil = c;
        marker.escaped = i > 0 && text[i - 1] == '\\';
        marker.begin = marker.escaped ? i - 1 : i;
        marker.end = close + 1;
        marker.content = text.substr(i + 2, close - i - 2);
        markers.push_back(marker);
        i = close;
    }
    return markers;
}

bool ExpressionGrammar::hasMarkers(const std::string& text) {
    auto markers = findMarkers(text);
    return std::any_of(markers.begin(), markers.end(),
                       [](const Marker& m) { return !m.escaped; });
}

bool ExpressionGrammar::hasEscapedMarker(const std::string& text) {
    auto markers = findMarkers(text);
    return std::any_of(markers.begin(), markers.end(),
                       [](const Marker& m) { return m.escaped; });
}

std::string ExpressionGrammar::interpolate(const std::string& text, const MarkerResolver& resolve,
                                           bool skipQuoted) {
    std::string out;
    size_t pos = 0;
    for (const auto& marker : findMarkers(text, skipQuoted)) {
        out += text.substr(pos, marker.begin - pos);
        if (marker.escaped) {
            out += text.substr(marker.begin + 1, marker.end - marker.begin - 1);
        } else {
            out += resolve(marker);
        }
        pos = marker.end;
    }
    out += text.substr(pos);
    return out;
}

static void addUnique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

static void scanReferences(const std::string& content, std::vector<std::string>& names) {
    size_t n = content.size();
    size_t i = 0;
    while (i < n) {
        char c = content[i];
        if (c == '\'' || c == '"') {
            size_t close = content.find(c, i + 1);
            i = close == std::string::npos ? n : close + 1;
            continue;
        }
        bool number = std::isdigit(static_cast<unsigned char>(c)) ||
                      (c == '.' && i + 1 < n && std::isdigit(static_cast<unsigned char>(content[i + 1])));
        if (number) {
            while (i < n && (isIdentChar(content[i]) || content[i] == '.')) ++i;
            continue;
        }
        if (!isIdentStart(c)) {
            ++i;
            continue;
        }

        size_t j = i;
        while (j < n && isIdentChar(content[j])) ++j;
        std::string name = content.substr(i, j - i);

        size_t prev = content.find_last_not_of(" \t", i == 0 ? std::string::npos : i - 1);
        bool attribute = i > 0 && prev != std::string::npos && content[prev] == '.';
        size_t next = content.find_first_not_of(" \t", j);
        bool call = next != std::string::npos && content[next] == '(';

        if (!attribute && !call && KEYWORDS.count(name) == 0) {
            addUnique(names, name);
        }
        i = j;
    }
}

std::vector<std::string> ExpressionGrammar::references(const std::string& text) {
    std::vector<std::string> names;
    for (const auto& marker : findMarkers(text)) {
        if (marker.escaped) continue;
        scanReferences(marker.content, names);
    }
    return names;
}

// ============================================================================
// Prefixes and classification
// ============================================================================

bool ExpressionGrammar::isLiteralText(const std::string& text) {
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos || text[first] != '$') return false;
    if (first + 1 < text.size() && (text[first + 1] == '{' || text[first + 1] == '[')) return false;
    return true;
}

bool ExpressionGrammar::isRecursiveLiteral(const std::string& text) {
    size_t first = text.find_first_not_of(" \t");
    return first != std::string::npos && text[first] == '!';
}

std::string ExpressionGrammar::stripPrefix(const std::string& text) {
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t rest = text.find_first_not_of(" \t", first + 1);
    return rest == std::string::npos ? "" : text.substr(rest);
}

ExpressionKind ExpressionGrammar::classify(const std::string& text) {
    if (isRecursiveLiteral(text)) return ExpressionKind::RecursiveLiteral;
    bool escaped = hasEscapedMarker(text);
    if (isLiteralText(text) && !escaped) return ExpressionKind::LiteralText;
    if (escaped) return ExpressionKind::PartialInterpolation;
    return ExpressionKind::Evaluation;
}

bool ExpressionGrammar::isSelfReference(const std::string& text, const std::string& name) {
    return trim(text) == "${" + name + "}";
}

// ============================================================================
// Rewrites
// ============================================================================

std::string ExpressionGrammar::toPowerOperator(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 4);
    char quote = 0;
    bool escaped = false;
    for (char c : text) {
        if (quote) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == quote) {
                quote = 0;
            }
            out += c;
            continue;
        }
        if (c == '\'' || c == '"') quote = c;
        if (c == '^') {
            out += "**";
        } else {
            out += c;
        }
    }
    return out;
}

std::string ExpressionGrammar::protect(const std::string& text, const std::vector<std::string>& names) {
    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == '$') {
            out += "\\$";
            i += 2;
            continue;
        }
        if (text[i] == '$' && i + 1 < text.size() && isIdentStart(text[i + 1])) {
            size_t j = i + 1;
            while (j < text.size() && isIdentChar(text[j])) ++j;
            std::string name = text.substr(i + 1, j - i - 1);
            if (std::find(names.begin(), names.end(), name) != names.end()) {
                out += "${" + name + "}";
                i = j;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

// Drop the accumulated floating-point noise of start + i*step (0.30000000000000004)
static double cleanRangeValue(double x) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.12g", x);
    return std::strtod(buffer, nullptr);
}

std::vector<double> ExpressionGrammar::expandRange(double start, double step, double stop,
                                                   size_t maxElements) {
    if (step == 0.0) {
        throw EvaluationError("range step cannot be zero");
    }
    double span = (stop - start) / step;
    if (!std::isfinite(span)) {
        throw EvaluationError("invalid range bounds");
    }
    if (span < 0.0) return {};
    if (span + 1.0 > static_cast<double>(maxElements)) {
        throw EvaluationError("range expands to more than " + std::to_string(maxElements) + " elements");
    }

    size_t count = static_cast<size_t>(std::floor(span + 1e-10)) + 1;
    std::vector<double> values(count);
    for (size_t i = 0; i < count; ++i) {
        values[i] = cleanRangeValue(start + step * static_cast<double>(i));
    }
    return values;
}

}  // namespace paramscript
