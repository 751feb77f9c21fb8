#pragma once

#include <functional>
#include <string>
#include <vector>

namespace paramscript {

// ============================================================================
// Markers
// ============================================================================

// One ${...} or @{...} occurrence inside a text
struct Marker {
    size_t begin = 0;     // first character, the backslash when escaped
    size_t end = 0;       // one past the closing brace
    char sigil = '$';     // '$' interpolates, '@' coerces to a 2-D array
    std::string content;  // text between the braces
    bool escaped = false;

    bool isPlainName() const;
    std::string text() const { return std::string(1, sigil) + "{" + content + "}"; }
};

// How a text value is processed by the evaluator
enum class ExpressionKind {
    RecursiveLiteral,      // !<literal list>
    LiteralText,           // $text: substitute, never evaluate
    PartialInterpolation,  // contains \${...}: substitute only
    Evaluation             // substitute, then arithmetic
};

std::string expressionKindToString(ExpressionKind kind);

// ============================================================================
// Expression Grammar
// ============================================================================

/**
 * @brief Text-level rules of the template mini-language.
 *
 * Handles comments, escapes, ${...} and @{...} markers, the $ and ! prefixes,
 * the ^ power alias and numeric ranges. The arithmetic itself is parsed by
 * ExpressionParser.
 */
class ExpressionGrammar {
public:
    using MarkerResolver = std::function<std::string(const Marker&)>;

    /**
     * @brief Drop comments, line by line.
     *
     * Text from an unescaped '#' to the end of the line is removed and
     * trailing blanks trimmed, unless '#' is the first non-blank character of
     * the line. "\#" becomes a literal '#'.
     */
    static std::string stripComment(const std::string& text);

    // All markers in order; with skipQuoted, markers inside '...' or "..."
    // are ignored
    static std::vector<Marker> findMarkers(const std::string& text, bool skipQuoted = false);

    static bool hasMarkers(const std::string& text);         // unescaped only
    static bool hasEscapedMarker(const std::string& text);

    /**
     * @brief Replace every unescaped marker by resolve(marker).
     *
     * Escaped markers lose their backslash and stay as marker text, so they
     * can be substituted by a later pass.
     */
    static std::string interpolate(const std::string& text, const MarkerResolver& resolve,
                                   bool skipQuoted = false);

    /**
     * @brief Names referenced by the unescaped markers of a text.
     *
     * Function names, attributes (.T), keywords and numbers are excluded.
     * Order of first use.
     */
    static std::vector<std::string> references(const std::string& text);

    static ExpressionKind classify(const std::string& text);

    // $-prefixed text that is neither ${...} nor $[...]
    static bool isLiteralText(const std::string& text);
    static bool isRecursiveLiteral(const std::string& text);

    // Remove the leading '$' or '!' and the blanks around it
    static std::string stripPrefix(const std::string& text);

    // Value is exactly ${name}
    static bool isSelfReference(const std::string& text, const std::string& name);

    // ^ becomes ** outside quoted strings
    static std::string toPowerOperator(const std::string& text);

    // $name becomes ${name} for the given names (\$ protects)
    static std::string protect(const std::string& text, const std::vector<std::string>& names);

    /**
     * @brief Explicit elements of start:step:stop (stop included).
     * @throws EvaluationError for a zero step or more than maxElements values
     */
    static std::vector<double> expandRange(double start, double step, double stop,
                                           size_t maxElements);

    // Backslash escapes for text inside the given quote: \\, the quote itself
    // and \n. Reading also accepts \" and \'; unknown escapes such as \${ are
    // kept verbatim.
    static std::string escapeQuoted(const std::string& text, char quote = '"');
    static std::string unescapeQuoted(const std::string& text);

    static bool isIdentifier(const std::string& text);
    static std::string trim(const std::string& text);
};

}  // namespace paramscript
