#pragma once

#include "toydb/result.h"

#include <stdexcept>
#include <string>

namespace toydb {

// Base class for everything the SQL layer and the engine throw internally.
// Engine::execute converts these into Result errors at the API boundary.
class Exception : public std::runtime_error {
public:
    Exception(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

    Error to_error() const { return Error(code_, what()); }

private:
    ErrorCode code_;
};

class ParseError : public Exception {
public:
    explicit ParseError(const std::string& message)
        : Exception(ErrorCode::ParseError, message) {}
};

class PredicateError : public Exception {
public:
    explicit PredicateError(const std::string& message)
        : Exception(ErrorCode::PredicateError, message) {}

protected:
    PredicateError(ErrorCode code, const std::string& message)
        : Exception(code, message) {}
};

class UnsupportedOperatorError : public PredicateError {
public:
    explicit UnsupportedOperatorError(const std::string& op)
        : PredicateError(ErrorCode::UnsupportedOperator,
                         "Unsupported operator in WHERE condition: " + op)
        , op_(op) {}

    const std::string& op() const noexcept { return op_; }

private:
    std::string op_;
};

class RowKeyError : public Exception {
public:
    explicit RowKeyError(const std::string& column)
        : Exception(ErrorCode::RowKeyError, "Column '" + column + "' not present in row")
        , column_(column) {}

    const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

class TableExistsError : public Exception {
public:
    explicit TableExistsError(const std::string& table)
        : Exception(ErrorCode::TableExists, "Table '" + table + "' already exists") {}
};

class TableNotFoundError : public Exception {
public:
    explicit TableNotFoundError(const std::string& table)
        : Exception(ErrorCode::TableNotFound, "Table '" + table + "' does not exist") {}
};

class ColumnValueMismatchError : public Exception {
public:
    ColumnValueMismatchError(size_t columns, size_t values)
        : Exception(ErrorCode::ColumnValueMismatch,
                    "INSERT lists " + std::to_string(columns) + " columns but " +
                    std::to_string(values) + " values") {}
};

} // namespace toydb
