#include <gtest/gtest.h>
#include "toydb/sql/lexer.h"

using namespace toydb::sql;

TEST(LexerTest, SimpleSelect) {
    std::string query = "SELECT id FROM users";
    Lexer lexer(query);

    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 5); // SELECT, id, FROM, users, EOF
    EXPECT_EQ(tokens[0].type, TokenType::SELECT);
    EXPECT_EQ(tokens[1].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[1].lexeme, "id");
    EXPECT_EQ(tokens[2].type, TokenType::FROM);
    EXPECT_EQ(tokens[3].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[3].lexeme, "users");
    EXPECT_EQ(tokens[4].type, TokenType::END_OF_FILE);
}

TEST(LexerTest, KeywordsAreCaseInsensitive) {
    Lexer lexer("select * From users wHeRe age > 3 order BY name");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::SELECT);
    EXPECT_EQ(tokens[0].lexeme, "select");
    EXPECT_EQ(tokens[1].type, TokenType::STAR);
    EXPECT_EQ(tokens[2].type, TokenType::FROM);
    EXPECT_EQ(tokens[4].type, TokenType::WHERE);
    EXPECT_EQ(tokens[8].type, TokenType::ORDER);
    EXPECT_EQ(tokens[9].type, TokenType::BY);
}

TEST(LexerTest, TwoCharacterOperatorsAreSingleTokens) {
    Lexer lexer("a <= 1 b >= 2 c != 3 d < 4");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[1].type, TokenType::OPERATOR);
    EXPECT_EQ(tokens[1].lexeme, "<=");
    EXPECT_EQ(tokens[4].lexeme, ">=");
    EXPECT_EQ(tokens[7].lexeme, "!=");
    EXPECT_EQ(tokens[10].lexeme, "<");
}

TEST(LexerTest, StringLiteralKeepsQuotes) {
    std::string query = "SELECT * FROM users WHERE name = 'John, ORDER BY x'";
    Lexer lexer(query);

    auto tokens = lexer.tokenize();

    bool found_string = false;
    for (const auto& token : tokens) {
        EXPECT_NE(token.type, TokenType::ORDER);
        if (token.type == TokenType::STRING_LITERAL) {
            EXPECT_EQ(token.lexeme, "'John, ORDER BY x'");
            found_string = true;
        }
    }
    EXPECT_TRUE(found_string);
}

TEST(LexerTest, UnclosedQuoteIsSingleCharacter) {
    Lexer lexer("VALUES ('abc)");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 6);
    EXPECT_EQ(tokens[2].type, TokenType::OTHER);
    EXPECT_EQ(tokens[2].lexeme, "'");
    EXPECT_EQ(tokens[3].lexeme, "abc");
    EXPECT_EQ(tokens[4].type, TokenType::RIGHT_PAREN);
}

TEST(LexerTest, ApostropheInsideWordIsNotQuote) {
    Lexer lexer("name = O'Brien, 'x'");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 8);
    EXPECT_EQ(tokens[2].lexeme, "O");
    EXPECT_EQ(tokens[3].type, TokenType::OTHER);
    EXPECT_EQ(tokens[3].lexeme, "'");
    EXPECT_EQ(tokens[4].lexeme, "Brien");
    EXPECT_EQ(tokens[5].type, TokenType::COMMA);
    EXPECT_EQ(tokens[6].type, TokenType::STRING_LITERAL);
    EXPECT_EQ(tokens[6].lexeme, "'x'");
}

TEST(LexerTest, OffsetsAndPositions) {
    std::string query = "INSERT INTO t\n  (a) VALUES (-1.5)";
    Lexer lexer(query);
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[3].type, TokenType::LEFT_PAREN);
    EXPECT_EQ(tokens[3].line, 2);
    EXPECT_EQ(tokens[3].column, 3);
    EXPECT_EQ(query.substr(tokens[3].offset, 1), "(");

    // "-1.5" is OTHER, IDENTIFIER, OTHER, IDENTIFIER
    EXPECT_EQ(tokens[8].type, TokenType::OTHER);
    EXPECT_EQ(tokens[8].lexeme, "-");
    EXPECT_EQ(tokens[9].lexeme, "1");
    EXPECT_EQ(tokens[10].lexeme, ".");
    EXPECT_EQ(tokens[11].lexeme, "5");
    EXPECT_EQ(tokens[11].end(), query.size() - 1);
}

TEST(LexerTest, EmptyInput) {
    Lexer lexer("   ");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(tokens[0].type, TokenType::END_OF_FILE);
}
