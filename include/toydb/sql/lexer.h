#pragma once

#include "toydb/sql/token.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toydb::sql {

class Lexer {
public:
    explicit Lexer(std::string_view source);

    // Tokenizes the whole statement; the last token is always END_OF_FILE.
    // Never throws: unknown characters become OTHER tokens.
    std::vector<Token> tokenize();

    Token next_token();

private:
    void skip_whitespace();

    Token scan_word();
    bool opens_string() const;
    Token scan_string();
    Token scan_operator();
    Token make_token(TokenType type);

    char current() const;
    char advance();

    bool is_at_end() const;
    static bool is_word_char(char c);
    static bool is_operator_char(char c);

    std::string_view source_;
    size_t start_{0};
    size_t current_{0};
    size_t line_{1};
    size_t column_{1};
    size_t start_line_{1};
    size_t start_column_{1};

    static const std::unordered_map<std::string, TokenType> keywords_;
};

} // namespace toydb::sql
