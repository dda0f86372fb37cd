#include <gtest/gtest.h>
#include "toydb/sql/predicate.h"
#include "toydb/exceptions.h"

using namespace toydb::sql;
using toydb::Row;

TEST(PredicateTest, CompilesAllOperators) {
    EXPECT_EQ(compile_predicate("a = 1").op, CompareOp::EQUAL);
    EXPECT_EQ(compile_predicate("a != 1").op, CompareOp::NOT_EQUAL);
    EXPECT_EQ(compile_predicate("a < 1").op, CompareOp::LESS);
    EXPECT_EQ(compile_predicate("a <= 1").op, CompareOp::LESS_EQUAL);
    EXPECT_EQ(compile_predicate("a > 1").op, CompareOp::GREATER);
    EXPECT_EQ(compile_predicate("a >= 1").op, CompareOp::GREATER_EQUAL);
}

TEST(PredicateTest, WhitespaceAroundOperatorIsOptional) {
    Predicate p = compile_predicate("  age<=30  ");
    EXPECT_EQ(p.column, "age");
    EXPECT_EQ(p.op, CompareOp::LESS_EQUAL);
    EXPECT_EQ(p.literal, "30");
}

TEST(PredicateTest, LiteralIsRawRemainder) {
    Predicate p = compile_predicate("name = 'Bob Smith'");
    EXPECT_EQ(p.literal, "'Bob Smith'");
    EXPECT_EQ(p.to_string(), "name = 'Bob Smith'");
}

TEST(PredicateTest, ComparesAsText) {
    Row row{{"age", "9"}};

    EXPECT_FALSE(compile_predicate("age < 10").matches(row));
    EXPECT_TRUE(compile_predicate("age > 10").matches(row));
    EXPECT_TRUE(compile_predicate("age = 9").matches(row));
    EXPECT_FALSE(compile_predicate("age != 9").matches(row));
    EXPECT_TRUE(compile_predicate("age >= 9").matches(row));
    EXPECT_TRUE(compile_predicate("age <= 9").matches(row));
}

TEST(PredicateTest, QuotedLiteralDoesNotMatchBareValue) {
    Row row{{"name", "Alice"}};
    EXPECT_FALSE(compile_predicate("name = 'Alice'").matches(row));

    Row quoted{{"name", "'Alice'"}};
    EXPECT_TRUE(compile_predicate("name = 'Alice'").matches(quoted));
}

TEST(PredicateTest, UnsupportedOperator) {
    try {
        compile_predicate("age <> 3");
        FAIL() << "expected UnsupportedOperatorError";
    } catch (const toydb::UnsupportedOperatorError& e) {
        EXPECT_EQ(e.op(), "<>");
        EXPECT_EQ(e.code(), toydb::ErrorCode::UnsupportedOperator);
        EXPECT_STREQ(e.what(), "Unsupported operator in WHERE condition: <>");
    }

    EXPECT_THROW(compile_predicate("a == 1"), toydb::UnsupportedOperatorError);
    EXPECT_THROW(compile_predicate("a =< 1"), toydb::UnsupportedOperatorError);
    EXPECT_THROW(compile_predicate("a ! 1"), toydb::UnsupportedOperatorError);
}

TEST(PredicateTest, MalformedConditions) {
    EXPECT_THROW(compile_predicate(""), toydb::PredicateError);
    EXPECT_THROW(compile_predicate("age"), toydb::PredicateError);
    EXPECT_THROW(compile_predicate("age >"), toydb::PredicateError);
    EXPECT_THROW(compile_predicate("= 3"), toydb::PredicateError);
    EXPECT_THROW(compile_predicate("age LIKE 3"), toydb::PredicateError);

    try {
        compile_predicate("age");
    } catch (const toydb::PredicateError& e) {
        EXPECT_EQ(e.code(), toydb::ErrorCode::PredicateError);
        EXPECT_STREQ(e.what(), "Unsupported WHERE condition: age");
    }
}

TEST(PredicateTest, MissingColumnThrowsRowKeyError) {
    Row row{{"id", "1"}};
    Predicate p = compile_predicate("age > 3");

    try {
        (void)p.matches(row);
        FAIL() << "expected RowKeyError";
    } catch (const toydb::RowKeyError& e) {
        EXPECT_EQ(e.column(), "age");
    }
}
