#pragma once

#include <string>

namespace paramscript {

// ============================================================================
// PathValue
// ============================================================================

/**
 * @brief A string flagged as a filesystem path, always stored with POSIX
 * separators.
 *
 * Backslashes become '/', repeated separators and "." segments collapse and a
 * trailing separator is kept. Joining with '/' puts exactly one separator
 * between the fragments and keeps a trailing separator carried by the right
 * operand.
 */
class PathValue {
public:
    PathValue() = default;
    explicit PathValue(const std::string& raw);

    const std::string& str() const { return path_; }
    bool empty() const { return path_.empty(); }
    bool isAbsolute() const { return !path_.empty() && path_.front() == '/'; }
    bool hasTrailingSeparator() const;

    // Join two fragments; an absolute right operand replaces the left one
    PathValue join(const PathValue& other) const;
    PathValue operator/(const PathValue& other) const { return join(other); }
    PathValue operator/(const std::string& other) const { return join(PathValue(other)); }

    // Plain concatenation followed by normalization
    PathValue operator+(const std::string& text) const { return PathValue(path_ + text); }

    bool operator==(const PathValue& other) const { return path_ == other.path_; }
    bool operator!=(const PathValue& other) const { return path_ != other.path_; }

    static std::string normalize(const std::string& raw);

private:
    std::string path_;
};

}  // namespace paramscript
