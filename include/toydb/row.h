#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace toydb {

// A single record: column name -> textual value.
// Columns keep the order in which they were first set.
class Row {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Field> fields);

    // Throws RowKeyError when the column is absent.
    const std::string& at(std::string_view column) const;

    // nullptr when the column is absent
    const std::string* find(std::string_view column) const;

    bool contains(std::string_view column) const;

    // Overwrites an existing column in place or appends a new one.
    void set(std::string column, std::string value);

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    std::vector<std::string> columns() const;

    const_iterator begin() const { return fields_.cbegin(); }
    const_iterator end() const { return fields_.cend(); }

    nlohmann::json to_json() const;
    std::string to_string() const;

    // Order-insensitive: same set of (column, value) pairs.
    bool operator==(const Row& other) const;
    bool operator!=(const Row& other) const { return !(*this == other); }

private:
    std::vector<Field> fields_;
};

} // namespace toydb
