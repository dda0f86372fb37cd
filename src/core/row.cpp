#include "toydb/row.h"
#include "toydb/exceptions.h"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <algorithm>

namespace toydb {

Row::Row(std::initializer_list<Field> fields) {
    for (const auto& field : fields) {
        set(field.first, field.second);
    }
}

const std::string& Row::at(std::string_view column) const {
    const std::string* value = find(column);
    if (value == nullptr) {
        throw RowKeyError(std::string(column));
    }
    return *value;
}

const std::string* Row::find(std::string_view column) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
        [column](const Field& field) { return field.first == column; });
    return it == fields_.end() ? nullptr : &it->second;
}

bool Row::contains(std::string_view column) const {
    return find(column) != nullptr;
}

void Row::set(std::string column, std::string value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
        [&column](const Field& field) { return field.first == column; });
    if (it != fields_.end()) {
        it->second = std::move(value);
        return;
    }
    fields_.emplace_back(std::move(column), std::move(value));
}

std::vector<std::string> Row::columns() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& field : fields_) {
        names.push_back(field.first);
    }
    return names;
}

nlohmann::json Row::to_json() const {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [column, value] : fields_) {
        object[column] = value;
    }
    return object;
}

std::string Row::to_string() const {
    std::string out = "{";
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) out += ", ";
        out += fmt::format("{}: {}", fields_[i].first, fields_[i].second);
    }
    out += "}";
    return out;
}

bool Row::operator==(const Row& other) const {
    if (fields_.size() != other.fields_.size()) {
        return false;
    }
    for (const auto& [column, value] : fields_) {
        const std::string* theirs = other.find(column);
        if (theirs == nullptr || *theirs != value) {
            return false;
        }
    }
    return true;
}

} // namespace toydb
