#include "toydb/sql/lexer.h"

#include <boost/algorithm/string/case_conv.hpp>

#include <cctype>

namespace toydb::sql {

const std::unordered_map<std::string, TokenType> Lexer::keywords_ = {
    {"SELECT", TokenType::SELECT},
    {"FROM", TokenType::FROM},
    {"WHERE", TokenType::WHERE},
    {"ORDER", TokenType::ORDER},
    {"BY", TokenType::BY},
    {"INSERT", TokenType::INSERT},
    {"INTO", TokenType::INTO},
    {"VALUES", TokenType::VALUES},
    {"UPDATE", TokenType::UPDATE},
    {"SET", TokenType::SET},
    {"DELETE", TokenType::DELETE}
};

Lexer::Lexer(std::string_view source) : source_(source) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        Token token = next_token();
        bool done = token.type == TokenType::END_OF_FILE;
        tokens.push_back(std::move(token));
        if (done) break;
    }

    return tokens;
}

Token Lexer::next_token() {
    skip_whitespace();

    start_ = current_;
    start_line_ = line_;
    start_column_ = column_;

    if (is_at_end()) {
        return make_token(TokenType::END_OF_FILE);
    }

    char c = current();

    if (is_word_char(c)) {
        return scan_word();
    }

    if ((c == '\'' || c == '"') && opens_string()) {
        return scan_string();
    }

    if (is_operator_char(c)) {
        return scan_operator();
    }

    advance();
    switch (c) {
        case '*': return make_token(TokenType::STAR);
        case ',': return make_token(TokenType::COMMA);
        case '(': return make_token(TokenType::LEFT_PAREN);
        case ')': return make_token(TokenType::RIGHT_PAREN);
        case ';': return make_token(TokenType::SEMICOLON);
        default: return make_token(TokenType::OTHER);
    }
}

Token Lexer::scan_word() {
    while (!is_at_end() && is_word_char(current())) {
        advance();
    }

    std::string upper_text = boost::to_upper_copy(std::string(source_.substr(start_, current_ - start_)));

    auto it = keywords_.find(upper_text);
    if (it != keywords_.end()) {
        return make_token(it->second);
    }

    return make_token(TokenType::IDENTIFIER);
}

// A quote starts a literal only at a word boundary and only when it is closed,
// so the apostrophe in O'Brien stays a lone OTHER token.
bool Lexer::opens_string() const {
    if (current_ > 0 && is_word_char(source_[current_ - 1])) {
        return false;
    }
    return source_.find(source_[current_], current_ + 1) != std::string_view::npos;
}

Token Lexer::scan_string() {
    char quote = advance();

    while (current() != quote) {
        advance();
    }
    advance();

    return make_token(TokenType::STRING_LITERAL);
}

Token Lexer::scan_operator() {
    while (!is_at_end() && is_operator_char(current())) {
        advance();
    }
    return make_token(TokenType::OPERATOR);
}

Token Lexer::make_token(TokenType type) {
    return Token(type, std::string(source_.substr(start_, current_ - start_)),
                 start_, start_line_, start_column_);
}

void Lexer::skip_whitespace() {
    while (!is_at_end() && std::isspace(static_cast<unsigned char>(current()))) {
        advance();
    }
}

char Lexer::current() const {
    if (is_at_end()) return '\0';
    return source_[current_];
}

char Lexer::advance() {
    char c = source_[current_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

bool Lexer::is_at_end() const {
    return current_ >= source_.length();
}

bool Lexer::is_word_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || uc >= 0x80;
}

bool Lexer::is_operator_char(char c) {
    return c == '=' || c == '!' || c == '<' || c == '>';
}

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::SELECT: return "SELECT";
        case TokenType::FROM: return "FROM";
        case TokenType::WHERE: return "WHERE";
        case TokenType::ORDER: return "ORDER";
        case TokenType::BY: return "BY";
        case TokenType::INSERT: return "INSERT";
        case TokenType::INTO: return "INTO";
        case TokenType::VALUES: return "VALUES";
        case TokenType::UPDATE: return "UPDATE";
        case TokenType::SET: return "SET";
        case TokenType::DELETE: return "DELETE";
        case TokenType::STAR: return "'*'";
        case TokenType::COMMA: return "','";
        case TokenType::LEFT_PAREN: return "'('";
        case TokenType::RIGHT_PAREN: return "')'";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::OPERATOR: return "operator";
        case TokenType::IDENTIFIER: return "identifier";
        case TokenType::STRING_LITERAL: return "string literal";
        case TokenType::OTHER: return "character";
        case TokenType::END_OF_FILE: return "end of input";
    }
    return "unknown";
}

std::string Token::to_string() const {
    return std::string("Token(") + token_type_name(type) + ", '" + lexeme + "')";
}

} // namespace toydb::sql
