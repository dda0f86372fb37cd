#pragma once

#include "toydb/sql/predicate.h"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toydb::sql {

// SELECT <columns> FROM <table> [WHERE <cond>] [ORDER BY <column>]
struct SelectStatement {
    std::vector<std::string> columns;  // {"*"} selects every column
    std::string table;
    std::optional<Predicate> where;
    std::optional<std::string> order_by;

    bool selects_all() const { return columns.size() == 1 && columns.front() == "*"; }

    std::string to_string() const;
};

// INSERT INTO <table> (<columns>) VALUES (<values>)
// Values are raw source text; quotes are kept.
struct InsertStatement {
    std::string table;
    std::vector<std::string> columns;
    std::vector<std::string> values;

    std::string to_string() const;
};

// UPDATE <table> SET <col>=<val>, ... [WHERE <cond>]
struct UpdateStatement {
    std::string table;
    std::map<std::string, std::string> assignments;
    std::optional<Predicate> where;

    std::string to_string() const;
};

// DELETE FROM <table> [WHERE <cond>]
struct DeleteStatement {
    std::string table;
    std::optional<Predicate> where;

    std::string to_string() const;
};

using Statement = std::variant<SelectStatement, InsertStatement, UpdateStatement, DeleteStatement>;

// "SELECT", "INSERT", "UPDATE" or "DELETE"
const char* statement_kind(const Statement& stmt);

const std::string& statement_table(const Statement& stmt);

std::string to_string(const Statement& stmt);

} // namespace toydb::sql
