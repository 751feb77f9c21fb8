#pragma once

#include "paramscript/value.h"
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace paramscript {

using Field = std::pair<std::string, Value>;

// ============================================================================
// Record: ordered name -> value container
// ============================================================================

/**
 * @brief Ordered collection of named fields.
 *
 * Names are unique and insertion order is significant. Lookup by name goes
 * through a hash index kept alongside the ordered key list. Assigning an empty
 * list to an existing field deletes it. Reserved bookkeeping names are never
 * stored.
 */
class Record {
public:
    Record() = default;
    Record(std::initializer_list<Field> fields);

    // ------------------------------------------------------------------------
    // Field access
    // ------------------------------------------------------------------------

    /**
     * @brief Create or replace a field.
     * @throws std::invalid_argument for reserved names
     */
    void set(const std::string& name, Value value);

    /**
     * @brief Value of a field.
     * @throws FieldNotFound if the name is absent
     */
    const Value& get(const std::string& name) const;

    // Returns nullptr if absent
    const Value* find(const std::string& name) const;

    bool has(const std::string& name) const;
    bool contains(const std::string& name) const { return has(name); }

    /**
     * @brief Delete a field.
     * @throws FieldNotFound if the name is absent or reserved
     */
    void remove(const std::string& name);

    void clear();

    // ------------------------------------------------------------------------
    // Enumeration (insertion order)
    // ------------------------------------------------------------------------

    const std::vector<std::string>& keys() const { return keys_; }
    const std::vector<Value>& values() const { return values_; }
    std::vector<Field> items() const;

    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

    // Position of a name, or -1
    long indexOf(const std::string& name) const;

    // ------------------------------------------------------------------------
    // Positional access (std::out_of_range on bad index)
    // ------------------------------------------------------------------------

    const Value& at(size_t index) const;
    const std::string& keyAt(size_t index) const;

    // Fields [begin, end), clamped to the record size
    Record slice(size_t begin, size_t end) const;
    Record select(const std::vector<size_t>& indices) const;
    Record select(const std::vector<std::string>& names) const;

    // ------------------------------------------------------------------------
    // Set algebra
    // ------------------------------------------------------------------------

    // Right operand wins on collision; new names are appended
    Record concat(const Record& other) const;
    // Drops every name present in other
    Record difference(const Record& other) const;

    Record& append(const Record& other);
    Record& subtract(const Record& other);

    Record operator+(const Record& other) const { return concat(other); }
    Record operator-(const Record& other) const { return difference(other); }
    Record& operator+=(const Record& other) { return append(other); }
    Record& operator-=(const Record& other) { return subtract(other); }

    // Fill fields that are missing, None or empty lists from defaults
    void check(const Record& defaults);

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

    // Compact one-line form: {a=1, b='text'}
    std::string toString() const;

    /**
     * @brief Build a record from parallel name/value lists.
     *
     * When there are fewer values than names the last value repeats; extra
     * values are stored under "key<i>".
     */
    static Record fromKeysValues(const std::vector<std::string>& keys,
                                 const std::vector<Value>& values);

    static bool isReserved(const std::string& name);

private:
    std::vector<std::string> keys_;
    std::vector<Value> values_;
    std::unordered_map<std::string, size_t> index_;

    void reindex();
};

}  // namespace paramscript
