#pragma once

#include "toydb/row.h"

#include <string>
#include <string_view>

namespace toydb::sql {

enum class CompareOp {
    EQUAL,          // =
    NOT_EQUAL,      // !=
    LESS,           // <
    LESS_EQUAL,     // <=
    GREATER,        // >
    GREATER_EQUAL   // >=
};

const char* compare_op_symbol(CompareOp op);

// Single WHERE comparison: row[column] <op> literal.
// Values are compared as text; "9" < "10" is false.
struct Predicate {
    std::string column;
    CompareOp op{CompareOp::EQUAL};
    std::string literal;

    // Throws RowKeyError when the row has no such column.
    bool matches(const Row& row) const;

    std::string to_string() const;

    bool operator==(const Predicate& other) const {
        return column == other.column && op == other.op && literal == other.literal;
    }
};

/// Compiles `<identifier> <operator> <rest>` into a Predicate.
/// Throws PredicateError on malformed text and UnsupportedOperatorError
/// when the operator token is not one of = != < <= > >=.
Predicate compile_predicate(std::string_view clause);

} // namespace toydb::sql
