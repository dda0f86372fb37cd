#pragma once

#include "toydb/exceptions.h"
#include "toydb/sql/lexer.h"
#include "toydb/sql/statement.h"

#include <string>
#include <string_view>
#include <vector>

namespace toydb::sql {

class Parser {
public:
    explicit Parser(std::string_view source);

    // Throws ParseError, or PredicateError for a malformed WHERE clause.
    Statement parse();

private:
    // Half-open token range [first, last)
    struct Span {
        size_t first;
        size_t last;
    };

    SelectStatement parse_select();
    InsertStatement parse_insert();
    UpdateStatement parse_update();
    DeleteStatement parse_delete();

    std::vector<std::string> parse_column_list(bool select_list);
    std::optional<Predicate> parse_where(size_t clause_end);
    std::pair<std::string, std::string> parse_assignment(Span span);

    // Splits on top-level commas
    std::vector<Span> split_list(Span span) const;

    // Raw source text covered by the tokens in span
    std::string slice(Span span) const;

    const Token& current() const;
    const Token& advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    const Token& consume(TokenType type, const std::string& message);
    const Token& consume_name(const std::string& message);
    const Token& consume_column(bool select_list);
    void expect_end();

    ParseError error(const std::string& message) const;
    ParseError error_at(const Token& token, const std::string& message) const;

    std::string source_;
    std::vector<Token> tokens_;
    size_t current_{0};
    size_t end_{0};  // first token after the statement body (trailing ';' or EOF)
};

/// Parses one statement
Statement parse(std::string_view text);

} // namespace toydb::sql
