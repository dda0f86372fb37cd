#include <gtest/gtest.h>
#include <sstream>
#include "shell/shell.hpp"
#include "shell/result_printer.hpp"

using namespace toydb;
using namespace toydb::shell;

class ShellFixture : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(engine.create_table("users", {"id", "name"}));
    }

    bool run(const std::string& script, OutputFormat format = OutputFormat::TABLE,
             bool stop_on_error = false) {
        Shell shell(engine, format, out, err);
        shell.set_stop_on_error(stop_on_error);
        std::istringstream in(script);
        bool completed = shell.run(in);
        stats = shell.stats();
        return completed;
    }

    Engine engine;
    std::ostringstream out;
    std::ostringstream err;
    Shell::Stats stats;
};

TEST_F(ShellFixture, RunsStatementsAndPrintsTable) {
    EXPECT_TRUE(run("INSERT INTO users (id, name) VALUES (1, 'Alice');\n"
                    "SELECT * FROM users;\n"));

    EXPECT_EQ(stats.executed, 2);
    EXPECT_EQ(stats.failed, 0);
    EXPECT_TRUE(err.str().empty());

    std::string output = out.str();
    EXPECT_EQ(output.rfind("OK\n", 0), 0);
    EXPECT_NE(output.find("id             | name           | "), std::string::npos);
    EXPECT_NE(output.find("'Alice'"), std::string::npos);
    EXPECT_NE(output.find("(1 rows)"), std::string::npos);
}

TEST_F(ShellFixture, StatementMaySpanLines) {
    EXPECT_TRUE(run("INSERT INTO users (id, name)\n"
                    "  VALUES (1, 'Alice')\n"
                    "\n"
                    "SELECT name\n"
                    "FROM users"));

    EXPECT_EQ(stats.executed, 2);
    EXPECT_EQ(stats.failed, 0);
    EXPECT_NE(out.str().find("'Alice'"), std::string::npos);
}

TEST_F(ShellFixture, JsonOutput) {
    EXPECT_TRUE(run("INSERT INTO users (id, name) VALUES (1, 'Alice');\n"
                    "SELECT name FROM users;\n",
                    OutputFormat::JSON));

    EXPECT_EQ(out.str(), "[{\"name\":\"'Alice'\"}]\n");
}

TEST_F(ShellFixture, ErrorsGoToErrorStreamAndContinue) {
    EXPECT_TRUE(run("SELECT * FROM ghost;\n"
                    "INSERT INTO users (id) VALUES (1);\n"));

    EXPECT_EQ(stats.executed, 2);
    EXPECT_EQ(stats.failed, 1);
    EXPECT_EQ(err.str(), "Error: Table not found: Table 'ghost' does not exist\n");
    EXPECT_EQ(out.str(), "OK\n");
}

TEST_F(ShellFixture, StopOnError) {
    EXPECT_FALSE(run("SELECT * FROM ghost;\n"
                     "INSERT INTO users (id) VALUES (1);\n",
                     OutputFormat::TABLE, true));

    EXPECT_EQ(stats.executed, 1);
    EXPECT_EQ(engine.row_count("users").value(), 0);
}

TEST_F(ShellFixture, MetaCommands) {
    EXPECT_TRUE(run(".create orders id, total\n"
                    "INSERT INTO orders (id, total) VALUES (1, 10);\n"
                    ".tables\n"
                    ".quit\n"
                    "SELECT * FROM orders;\n"));

    EXPECT_EQ(stats.executed, 1);
    EXPECT_EQ(engine.table_columns("orders").value(), (std::vector<std::string>{"id", "total"}));

    std::string output = out.str();
    EXPECT_NE(output.find("orders (1 rows): id, total\n"), std::string::npos);
    EXPECT_NE(output.find("users (0 rows): id, name\n"), std::string::npos);
    EXPECT_EQ(output.find("(1 rows)\n"), std::string::npos);
}

TEST_F(ShellFixture, UnknownMetaCommandFails) {
    EXPECT_TRUE(run(".drop users\n"));

    EXPECT_EQ(stats.failed, 1);
    EXPECT_NE(err.str().find("Unknown command '.drop'"), std::string::npos);
}

TEST_F(ShellFixture, CreateExistingTableFails) {
    EXPECT_TRUE(run(".create users id\n"));

    EXPECT_EQ(stats.failed, 1);
    EXPECT_NE(err.str().find("already exists"), std::string::npos);
}

TEST(ResultPrinterTest, RenderEmptyResult) {
    EXPECT_EQ(render_table({}), "(0 rows)\n");
    EXPECT_EQ(render_json({}), "[]\n");
}

TEST(ResultPrinterTest, ColumnsAreUnionInFirstSeenOrder) {
    std::vector<Row> rows = {
        Row{{"id", "1"}},
        Row{{"name", "x"}, {"id", "2"}},
    };

    EXPECT_EQ(collect_columns(rows), (std::vector<std::string>{"id", "name"}));

    std::string table = render_table(rows);
    EXPECT_NE(table.find("1              |                | \n"), std::string::npos);
    EXPECT_NE(table.find("(2 rows)\n"), std::string::npos);
}
