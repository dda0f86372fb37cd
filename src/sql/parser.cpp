#include "toydb/sql/parser.h"

#include <fmt/core.h>

#include <cctype>

namespace toydb::sql {

namespace {

std::string trim(std::string_view text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return std::string(text);
}

// Keywords double as table and column names
bool is_name(const Token& token) {
    return token.type == TokenType::IDENTIFIER || token.is_keyword();
}

bool is_identifier(std::string_view text) {
    if (text.empty()) return false;
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || c == '_' || uc >= 0x80)) return false;
    }
    return true;
}

} // anonymous namespace

Parser::Parser(std::string_view source)
    : source_(trim(source))
    , tokens_(Lexer(source_).tokenize()) {
    end_ = tokens_.size() - 1;
    if (end_ > 0 && tokens_[end_ - 1].type == TokenType::SEMICOLON) {
        --end_;
    }
}

Statement Parser::parse() {
    switch (current().type) {
        case TokenType::SELECT:
            return parse_select();
        case TokenType::INSERT:
            return parse_insert();
        case TokenType::UPDATE:
            return parse_update();
        case TokenType::DELETE:
            return parse_delete();
        default:
            throw ParseError("Query did not match any known SQL operation");
    }
}

SelectStatement Parser::parse_select() {
    SelectStatement stmt;

    consume(TokenType::SELECT, "Expected SELECT");
    stmt.columns = parse_column_list(true);

    consume(TokenType::FROM, "Expected FROM after column list");
    stmt.table = consume_name("Expected table name").lexeme;

    // ORDER BY is only recognized as the final clause
    size_t clause_end = end_;
    if (clause_end >= current_ + 3 &&
        tokens_[clause_end - 3].type == TokenType::ORDER &&
        tokens_[clause_end - 2].type == TokenType::BY &&
        is_name(tokens_[clause_end - 1])) {
        stmt.order_by = tokens_[clause_end - 1].lexeme;
        clause_end -= 3;
    }

    if (current_ < clause_end) {
        consume(TokenType::WHERE, "Expected WHERE, ORDER BY or end of statement");
        stmt.where = parse_where(clause_end);
    }

    if (stmt.order_by) {
        current_ += 3;
    }

    expect_end();
    return stmt;
}

InsertStatement Parser::parse_insert() {
    InsertStatement stmt;

    consume(TokenType::INSERT, "Expected INSERT");
    consume(TokenType::INTO, "Expected INTO after INSERT");
    stmt.table = consume_name("Expected table name").lexeme;

    consume(TokenType::LEFT_PAREN, "Expected '(' before column list");
    stmt.columns = parse_column_list(false);
    consume(TokenType::RIGHT_PAREN, "Expected ')' after column list");

    consume(TokenType::VALUES, "Expected VALUES");
    consume(TokenType::LEFT_PAREN, "Expected '(' after VALUES");

    // The value list runs up to the ')' that closes the statement
    size_t close = end_ - 1;
    if (end_ <= current_ + 1 || tokens_[close].type != TokenType::RIGHT_PAREN) {
        throw error("Expected non-empty value list closed by ')' at end of statement");
    }

    for (const Span& span : split_list({current_, close})) {
        stmt.values.push_back(slice(span));
    }
    current_ = end_;

    expect_end();
    return stmt;
}

UpdateStatement Parser::parse_update() {
    UpdateStatement stmt;

    consume(TokenType::UPDATE, "Expected UPDATE");
    stmt.table = consume_name("Expected table name").lexeme;
    consume(TokenType::SET, "Expected SET after table name");

    size_t where_pos = current_;
    while (where_pos < end_ && tokens_[where_pos].type != TokenType::WHERE) {
        ++where_pos;
    }

    if (where_pos == current_) {
        throw error("Expected assignment after SET");
    }

    for (const Span& span : split_list({current_, where_pos})) {
        auto [column, value] = parse_assignment(span);
        stmt.assignments[std::move(column)] = std::move(value);
    }
    current_ = where_pos;

    if (match(TokenType::WHERE)) {
        stmt.where = parse_where(end_);
    }

    expect_end();
    return stmt;
}

DeleteStatement Parser::parse_delete() {
    DeleteStatement stmt;

    consume(TokenType::DELETE, "Expected DELETE");
    consume(TokenType::FROM, "Expected FROM after DELETE");
    stmt.table = consume_name("Expected table name").lexeme;

    if (current_ < end_) {
        consume(TokenType::WHERE, "Expected WHERE or end of statement");
        stmt.where = parse_where(end_);
    }

    expect_end();
    return stmt;
}

std::vector<std::string> Parser::parse_column_list(bool select_list) {
    std::vector<std::string> columns;

    do {
        if (select_list && match(TokenType::STAR)) {
            columns.emplace_back("*");
        } else {
            columns.push_back(consume_column(select_list).lexeme);
        }
    } while (match(TokenType::COMMA));

    return columns;
}

std::optional<Predicate> Parser::parse_where(size_t clause_end) {
    if (current_ >= clause_end) {
        throw error("Expected condition after WHERE");
    }

    Predicate predicate = compile_predicate(slice({current_, clause_end}));
    current_ = clause_end;
    return predicate;
}

std::pair<std::string, std::string> Parser::parse_assignment(Span span) {
    std::string text = slice(span);
    const Token& at = tokens_[span.first];

    // Single split on '=': values containing '=' are not supported
    size_t eq = text.find('=');
    if (eq == std::string::npos || text.find('=', eq + 1) != std::string::npos) {
        throw error_at(at, fmt::format(
            "Malformed assignment '{}': expected <column>=<value> without '=' in the value", text));
    }

    std::string column = trim(std::string_view(text).substr(0, eq));
    std::string value = trim(std::string_view(text).substr(eq + 1));

    if (!is_identifier(column)) {
        throw error_at(at, fmt::format("Invalid column name '{}' in assignment", column));
    }

    return {std::move(column), std::move(value)};
}

std::vector<Parser::Span> Parser::split_list(Span span) const {
    std::vector<Span> parts;
    size_t start = span.first;
    int depth = 0;

    for (size_t i = span.first; i < span.last; ++i) {
        switch (tokens_[i].type) {
            case TokenType::LEFT_PAREN:
                ++depth;
                break;
            case TokenType::RIGHT_PAREN:
                --depth;
                break;
            case TokenType::COMMA:
                if (depth == 0) {
                    parts.push_back({start, i});
                    start = i + 1;
                }
                break;
            default:
                break;
        }
    }

    parts.push_back({start, span.last});
    return parts;
}

std::string Parser::slice(Span span) const {
    if (span.first >= span.last) {
        return "";
    }
    size_t begin = tokens_[span.first].offset;
    size_t end = tokens_[span.last - 1].end();
    return source_.substr(begin, end - begin);
}

// Utility methods
const Token& Parser::current() const {
    return tokens_[current_];
}

const Token& Parser::advance() {
    if (current().type != TokenType::END_OF_FILE) current_++;
    return tokens_[current_ - 1];
}

bool Parser::check(TokenType type) const {
    if (current_ >= end_) return false;
    return current().type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) return advance();
    throw error(message);
}

const Token& Parser::consume_name(const std::string& message) {
    if (current_ < end_ && is_name(current())) return advance();
    throw error(message);
}

// In a SELECT list a keyword is a column only when ',' or FROM follows it.
const Token& Parser::consume_column(bool select_list) {
    if (check(TokenType::IDENTIFIER)) return advance();

    if (current_ < end_ && current().is_keyword()) {
        TokenType next = tokens_[current_ + 1].type;
        if (!select_list || next == TokenType::COMMA || next == TokenType::FROM) {
            return advance();
        }
    }
    throw error("Expected column name");
}

void Parser::expect_end() {
    if (current_ != end_) {
        throw error(fmt::format("Unexpected {} '{}'",
                                token_type_name(current().type), current().lexeme));
    }
}

ParseError Parser::error(const std::string& message) const {
    return error_at(current(), message);
}

ParseError Parser::error_at(const Token& token, const std::string& message) const {
    return ParseError(fmt::format("Parse error at line {}, column {}: {}",
                                  token.line, token.column, message));
}

Statement parse(std::string_view text) {
    Parser parser(text);
    return parser.parse();
}

} // namespace toydb::sql
