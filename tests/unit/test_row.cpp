#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "toydb/row.h"
#include "toydb/exceptions.h"

using toydb::Row;

TEST(RowTest, SetAppendsThenOverwrites) {
    Row row;
    EXPECT_TRUE(row.empty());

    row.set("id", "1");
    row.set("name", "'Alice'");
    row.set("id", "2");

    EXPECT_EQ(row.size(), 2);
    EXPECT_EQ(row.at("id"), "2");
    EXPECT_EQ(row.columns(), (std::vector<std::string>{"id", "name"}));
}

TEST(RowTest, MissingColumn) {
    Row row{{"id", "1"}};

    EXPECT_TRUE(row.contains("id"));
    EXPECT_FALSE(row.contains("age"));
    EXPECT_EQ(row.find("age"), nullptr);
    EXPECT_THROW((void)row.at("age"), toydb::RowKeyError);
}

TEST(RowTest, EqualityIgnoresColumnOrder) {
    Row a{{"id", "1"}, {"name", "x"}};
    Row b{{"name", "x"}, {"id", "1"}};
    Row c{{"id", "1"}};
    Row d{{"id", "1"}, {"name", "y"}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
}

TEST(RowTest, ToJsonAndString) {
    Row row{{"id", "1"}, {"name", "'Alice'"}};

    nlohmann::json j = row.to_json();
    EXPECT_EQ(j["id"], "1");
    EXPECT_EQ(j["name"], "'Alice'");

    EXPECT_EQ(row.to_string(), "{id: 1, name: 'Alice'}");
}
