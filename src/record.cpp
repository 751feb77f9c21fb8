#include "paramscript/record.h"
#include "paramscript/errors.h"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace paramscript {

// Bookkeeping names used by script generators; never stored as fields
static const std::set<std::string> RESERVED_NAMES = {
    "_type", "_fulltype", "_ftype", "_excludedattr",
    "_evaluation", "_protection", "_debug"
};

bool Record::isReserved(const std::string& name) {
    return RESERVED_NAMES.count(name) > 0;
}

Record::Record(std::initializer_list<Field> fields) {
    for (const auto& [name, value] : fields) {
        set(name, value);
    }
}

// ============================================================================
// Field access
// ============================================================================

void Record::set(const std::string& name, Value value) {
    if (isReserved(name)) {
        throw std::invalid_argument("'" + name + "' is a reserved name");
    }
    if (name.empty()) {
        throw std::invalid_argument("field name cannot be empty");
    }
    auto it = index_.find(name);
    if (it != index_.end()) {
        if (value.isEmptyList()) {
            remove(name);
        } else {
            values_[it->second] = std::move(value);
        }
        return;
    }
    index_[name] = keys_.size();
    keys_.push_back(name);
    values_.push_back(std::move(value));
}

const Value& Record::get(const std::string& name) const {
    const Value* value = find(name);
    if (!value) throw FieldNotFound(name);
    return *value;
}

const Value* Record::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &values_[it->second];
}

bool Record::has(const std::string& name) const {
    return index_.count(name) > 0;
}

long Record::indexOf(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? -1 : static_cast<long>(it->second);
}

void Record::remove(const std::string& name) {
    auto it = index_.find(name);
    if (it == index_.end()) throw FieldNotFound(name);
    size_t pos = it->second;
    keys_.erase(keys_.begin() + pos);
    values_.erase(values_.begin() + pos);
    reindex();
}

void Record::clear() {
    keys_.clear();
    values_.clear();
    index_.clear();
}

void Record::reindex() {
    index_.clear();
    for (size_t i = 0; i < keys_.size(); ++i) {
        index_[keys_[i]] = i;
    }
}

std::vector<Field> Record::items() const {
    std::vector<Field> result;
    result.reserve(keys_.size());
    for (size_t i = 0; i < keys_.size(); ++i) {
        result.emplace_back(keys_[i], values_[i]);
    }
    return result;
}

// ============================================================================
// Positional access
// ============================================================================

const Value& Record::at(size_t index) const {
    if (index >= values_.size()) {
        throw std::out_of_range("field index " + std::to_string(index) +
                                " out of range (size " + std::to_string(size()) + ")");
    }
    return values_[index];
}

const std::string& Record::keyAt(size_t index) const {
    if (index >= keys_.size()) {
        throw std::out_of_range("field index " + std::to_string(index) +
                                " out of range (size " + std::to_string(size()) + ")");
    }
    return keys_[index];
}

Record Record::slice(size_t begin, size_t end) const {
    Record result;
    end = std::min(end, size());
    for (size_t i = begin; i < end; ++i) {
        result.set(keys_[i], values_[i]);
    }
    return result;
}

Record Record::select(const std::vector<size_t>& indices) const {
    Record result;
    for (size_t i : indices) {
        result.set(keyAt(i), at(i));
    }
    return result;
}

Record Record::select(const std::vector<std::string>& names) const {
    Record result;
    for (const auto& name : names) {
        result.set(name, get(name));
    }
    return result;
}

// ============================================================================
// Set algebra
// ============================================================================

Record Record::concat(const Record& other) const {
    Record result(*this);
    result.append(other);
    return result;
}

Record Record::difference(const Record& other) const {
    Record result(*this);
    result.subtract(other);
    return result;
}

Record& Record::append(const Record& other) {
    for (size_t i = 0; i < other.size(); ++i) {
        set(other.keys_[i], other.values_[i]);
    }
    return *this;
}

Record& Record::subtract(const Record& other) {
    for (const auto& name : other.keys_) {
        if (has(name)) remove(name);
    }
    return *this;
}

void Record::check(const Record& defaults) {
    for (size_t i = 0; i < defaults.size(); ++i) {
        const std::string& name = defaults.keys_[i];
        const Value* current = find(name);
        if (!current || current->isNone() || current->isEmptyList()) {
            set(name, defaults.values_[i]);
        }
    }
}

bool Record::operator==(const Record& other) const {
    return keys_ == other.keys_ && values_ == other.values_;
}

std::string Record::toString() const {
    std::string out = "{";
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (i > 0) out += ", ";
        out += keys_[i] + "=" + toRepr(values_[i]);
    }
    return out + "}";
}

Record Record::fromKeysValues(const std::vector<std::string>& keys,
                              const std::vector<Value>& values) {
    Record result;
    if (keys.empty() || values.empty()) return result;
    size_t iv = 0;
    for (const auto& key : keys) {
        result.set(key, values[iv]);
        iv = std::min(values.size() - 1, iv + 1);
    }
    for (size_t i = keys.size(); i < values.size(); ++i) {
        result.set("key" + std::to_string(i), values[i]);
    }
    return result;
}

}  // namespace paramscript
