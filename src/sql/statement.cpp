#include "toydb/sql/statement.h"

#include <sstream>

namespace toydb::sql {

namespace {

void write_list(std::stringstream& ss, const std::vector<std::string>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << items[i];
    }
}

void write_where(std::stringstream& ss, const std::optional<Predicate>& where) {
    if (where) {
        ss << " WHERE " << where->to_string();
    }
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

std::string SelectStatement::to_string() const {
    std::stringstream ss;
    ss << "SELECT ";
    write_list(ss, columns);
    ss << " FROM " << table;
    write_where(ss, where);

    if (order_by) {
        ss << " ORDER BY " << *order_by;
    }

    return ss.str();
}

std::string InsertStatement::to_string() const {
    std::stringstream ss;
    ss << "INSERT INTO " << table << " (";
    write_list(ss, columns);
    ss << ") VALUES (";
    write_list(ss, values);
    ss << ")";
    return ss.str();
}

std::string UpdateStatement::to_string() const {
    std::stringstream ss;
    ss << "UPDATE " << table << " SET ";

    bool first = true;
    for (const auto& [column, value] : assignments) {
        if (!first) ss << ", ";
        ss << column << "=" << value;
        first = false;
    }

    write_where(ss, where);
    return ss.str();
}

std::string DeleteStatement::to_string() const {
    std::stringstream ss;
    ss << "DELETE FROM " << table;
    write_where(ss, where);
    return ss.str();
}

const char* statement_kind(const Statement& stmt) {
    return std::visit(overloaded{
        [](const SelectStatement&) { return "SELECT"; },
        [](const InsertStatement&) { return "INSERT"; },
        [](const UpdateStatement&) { return "UPDATE"; },
        [](const DeleteStatement&) { return "DELETE"; },
    }, stmt);
}

const std::string& statement_table(const Statement& stmt) {
    return std::visit([](const auto& s) -> const std::string& { return s.table; }, stmt);
}

std::string to_string(const Statement& stmt) {
    return std::visit([](const auto& s) { return s.to_string(); }, stmt);
}

} // namespace toydb::sql
