#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace toydb::sql {

enum class TokenType {
    // Keywords
    SELECT,
    FROM,
    WHERE,
    ORDER,
    BY,
    INSERT,
    INTO,
    VALUES,
    UPDATE,
    SET,
    DELETE,

    // Delimiters
    STAR,            // *
    COMMA,           // ,
    LEFT_PAREN,      // (
    RIGHT_PAREN,     // )
    SEMICOLON,       // ;

    // Maximal run of = ! < >
    OPERATOR,

    // Literals
    IDENTIFIER,      // any word: table names, column names, bare numbers
    STRING_LITERAL,  // quoted text, quotes included

    // Special
    OTHER,           // any other single character
    END_OF_FILE
};

struct Token {
    TokenType type;
    std::string lexeme;  // source text of the token
    size_t offset;       // byte offset into the statement
    size_t line;
    size_t column;

    Token(TokenType t, std::string lex, size_t off, size_t l, size_t c)
        : type(t), lexeme(std::move(lex)), offset(off), line(l), column(c) {}

    size_t end() const { return offset + lexeme.size(); }

    bool is_keyword() const {
        return type >= TokenType::SELECT && type <= TokenType::DELETE;
    }

    std::string to_string() const;
};

const char* token_type_name(TokenType type);

} // namespace toydb::sql
