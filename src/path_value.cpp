#include "paramscript/path_value.h"
#include <algorithm>
#include <sstream>
#include <vector>

namespace paramscript {

PathValue::PathValue(const std::string& raw)
    : path_(normalize(raw)) {}

bool PathValue::hasTrailingSeparator() const {
    return path_.size() > 1 && path_.back() == '/';
}

std::string PathValue::normalize(const std::string& raw) {
    std::string s = raw;
    std::replace(s.begin(), s.end(), '\\', '/');
    if (s.empty()) return s;

    bool absolute = s.front() == '/';
    bool trailing = s.size() > 1 && s.back() == '/';

    std::vector<std::string> segments;
    std::stringstream ss(s);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == ".") continue;
        segments.push_back(segment);
    }

    std::string joined;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) joined += '/';
        joined += segments[i];
    }

    if (joined.empty()) {
        if (absolute) return "/";
        return trailing ? "./" : ".";
    }

    std::string result = absolute ? "/" + joined : joined;
    if (trailing) result += '/';
    return result;
}

PathValue PathValue::join(const PathValue& other) const {
    if (other.empty()) return *this;
    if (path_.empty() || other.isAbsolute()) return other;
    return PathValue(path_ + "/" + other.path_);
}

}  // namespace paramscript
