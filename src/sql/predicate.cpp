#include "toydb/sql/predicate.h"
#include "toydb/exceptions.h"

#include <cctype>

namespace toydb::sql {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || uc >= 0x80;
}

bool is_operator_char(char c) {
    return c == '=' || c == '!' || c == '<' || c == '>';
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

// The whole operator run is one token, so "<=" can never be read as "<".
// The cost: "a == 5", "a => 5" and "a <> 5" are rejected as unsupported
// operators instead of being read as "=" or "<" followed by a raw operand
// such as "= 5" or "> 5".
CompareOp lookup_operator(std::string_view token) {
    if (token == "=") return CompareOp::EQUAL;
    if (token == "!=") return CompareOp::NOT_EQUAL;
    if (token == "<") return CompareOp::LESS;
    if (token == "<=") return CompareOp::LESS_EQUAL;
    if (token == ">") return CompareOp::GREATER;
    if (token == ">=") return CompareOp::GREATER_EQUAL;
    throw UnsupportedOperatorError(std::string(token));
}

} // anonymous namespace

const char* compare_op_symbol(CompareOp op) {
    switch (op) {
        case CompareOp::EQUAL: return "=";
        case CompareOp::NOT_EQUAL: return "!=";
        case CompareOp::LESS: return "<";
        case CompareOp::LESS_EQUAL: return "<=";
        case CompareOp::GREATER: return ">";
        case CompareOp::GREATER_EQUAL: return ">=";
    }
    return "?";
}

bool Predicate::matches(const Row& row) const {
    const std::string& value = row.at(column);

    switch (op) {
        case CompareOp::EQUAL: return value == literal;
        case CompareOp::NOT_EQUAL: return value != literal;
        case CompareOp::LESS: return value < literal;
        case CompareOp::LESS_EQUAL: return value <= literal;
        case CompareOp::GREATER: return value > literal;
        case CompareOp::GREATER_EQUAL: return value >= literal;
    }
    return false;
}

std::string Predicate::to_string() const {
    return column + " " + compare_op_symbol(op) + " " + literal;
}

Predicate compile_predicate(std::string_view clause) {
    std::string_view text = trim(clause);
    const std::string unsupported = "Unsupported WHERE condition: " + std::string(text);

    size_t pos = 0;
    while (pos < text.size() && is_word_char(text[pos])) {
        ++pos;
    }
    if (pos == 0) {
        throw PredicateError(unsupported);
    }

    Predicate predicate;
    predicate.column = std::string(text.substr(0, pos));

    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }

    size_t op_start = pos;
    while (pos < text.size() && is_operator_char(text[pos])) {
        ++pos;
    }
    if (pos == op_start) {
        throw PredicateError(unsupported);
    }
    predicate.op = lookup_operator(text.substr(op_start, pos - op_start));

    std::string_view rest = trim(text.substr(pos));
    if (rest.empty()) {
        throw PredicateError(unsupported);
    }
    predicate.literal = std::string(rest);

    return predicate;
}

} // namespace toydb::sql
