#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "shell/shell_config.hpp"

namespace fs = std::filesystem;
using namespace toydb;
using namespace toydb::shell;

class ShellConfigFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "toydb_shell_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string write_file(const std::string& name, const std::string& contents) {
        fs::path path = test_dir / name;
        std::ofstream file(path);
        file << contents;
        return path.string();
    }

    fs::path test_dir;
};

TEST_F(ShellConfigFixture, LoadsKeyValueFile) {
    std::string path = write_file("toydb.conf",
        "# shell settings\n"
        "format = json\n"
        "log_level = debug\n"
        "; tables\n"
        "table = users:id,name\n"
        "table = orders:id\n"
        "allow_empty_tables = true\n"
        "stop_on_error = yes\n");

    ShellConfig config;
    auto status = config.load_from_file(path);
    ASSERT_TRUE(status) << status.error().to_string();

    EXPECT_EQ(config.format, OutputFormat::JSON);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.table_specs, (std::vector<std::string>{"users:id,name", "orders:id"}));
    EXPECT_TRUE(config.allow_empty_tables);
    EXPECT_TRUE(config.stop_on_error);
}

TEST_F(ShellConfigFixture, MissingFile) {
    ShellConfig config;
    auto status = config.load_from_file((test_dir / "absent.conf").string());
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().code(), ErrorCode::IoError);
}

TEST_F(ShellConfigFixture, RejectsUnknownKeysAndBadLines) {
    ShellConfig config;

    auto unknown = config.load_from_file(write_file("a.conf", "colour = red\n"));
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidArgument);
    EXPECT_NE(unknown.error().message().find("colour"), std::string::npos);

    auto malformed = config.load_from_file(write_file("b.conf", "format json\n"));
    ASSERT_FALSE(malformed);
    EXPECT_NE(malformed.error().message().find(":1:"), std::string::npos);

    auto bad_format = config.load_from_file(write_file("c.conf", "format = xml\n"));
    ASSERT_FALSE(bad_format);
}

TEST_F(ShellConfigFixture, LoadsSchemaFile) {
    std::string path = write_file("schema.json",
        R"({"tables": {"users": ["id", "name"], "empty": []}})");

    auto tables = load_schema_file(path);
    ASSERT_TRUE(tables) << tables.error().to_string();
    ASSERT_EQ(tables->size(), 2);

    bool found_users = false;
    for (const auto& table : *tables) {
        if (table.name == "users") {
            EXPECT_EQ(table.columns, (std::vector<std::string>{"id", "name"}));
            found_users = true;
        }
    }
    EXPECT_TRUE(found_users);
}

TEST(ShellConfigTest, ParseTableSpec) {
    auto spec = parse_table_spec(" users : id, name ,,age ");
    ASSERT_TRUE(spec);
    EXPECT_EQ(spec->name, "users");
    EXPECT_EQ(spec->columns, (std::vector<std::string>{"id", "name", "age"}));

    auto no_columns = parse_table_spec("t:");
    ASSERT_TRUE(no_columns);
    EXPECT_TRUE(no_columns->columns.empty());

    EXPECT_FALSE(parse_table_spec("users"));
    EXPECT_FALSE(parse_table_spec(":id"));
}

TEST(ShellConfigTest, ParseSchemaErrors) {
    EXPECT_FALSE(parse_schema("not json"));
    EXPECT_FALSE(parse_schema(R"({"users": ["id"]})"));
    EXPECT_FALSE(parse_schema(R"({"tables": {"users": "id"}})"));
    EXPECT_FALSE(parse_schema(R"({"tables": {"users": [1, 2]}})"));
}

TEST(ShellConfigTest, ParseOutputFormat) {
    EXPECT_EQ(parse_output_format("table").value(), OutputFormat::TABLE);
    EXPECT_EQ(parse_output_format("json").value(), OutputFormat::JSON);
    EXPECT_FALSE(parse_output_format("csv"));
}
