// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ToyDB - Embedded Usage Example                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "toydb/engine.h"
#include "toydb/version.h"

#include <fmt/core.h>
#include <fmt/color.h>

#include <string>
#include <vector>

namespace {

void print_rows(const std::vector<toydb::Row>& rows) {
    for (const auto& row : rows) {
        fmt::print("  {}\n", row.to_string());
    }
    fmt::print("  ({} rows)\n\n", rows.size());
}

bool run(toydb::Engine& engine, const std::string& sql) {
    fmt::print(fmt::emphasis::bold, "{}\n", sql);

    auto result = engine.execute(sql);
    if (!result) {
        fmt::print(fg(fmt::color::red), "  ERROR: {}\n\n", result.error().to_string());
        return false;
    }

    if (result->has_value()) {
        print_rows(**result);
    } else {
        fmt::print(fg(fmt::color::green), "  OK\n\n");
    }
    return true;
}

} // anonymous namespace

int main() {
    fmt::print(fmt::emphasis::bold, "\n=== ToyDB Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", toydb::VERSION_STRING);
    fmt::print("Build:   {} ({})\n\n", toydb::BUILD_TYPE, toydb::COMPILER_ID);

    toydb::Engine engine;

    if (auto status = engine.create_table("users", {"id", "name", "age"}); !status) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", status.error().to_string());
        return 1;
    }

    const std::vector<std::string> statements = {
        "INSERT INTO users (id, name, age) VALUES (1, 'Alice', 30)",
        "INSERT INTO users (id, name, age) VALUES (2, 'Bob', 25)",
        "INSERT INTO users (id, name, age) VALUES (3, 'Charlie', 35)",
        "SELECT * FROM users WHERE age > 30 ORDER BY name",
        "UPDATE users SET age=40 WHERE id=1",
        "SELECT name, age FROM users WHERE id=1",
        "DELETE FROM users WHERE age < 30",
        "SELECT * FROM users ORDER BY name",
    };

    for (const auto& sql : statements) {
        if (!run(engine, sql)) {
            return 1;
        }
    }

    // Expected failures
    fmt::print("Error handling:\n\n");
    run(engine, "SELECT * FROM ghost");
    run(engine, "INSERT INTO users (id, name) VALUES (1)");
    run(engine, "SELECT * FROM users WHERE age <> 40");

    fmt::print(fg(fmt::color::green), "Done!\n\n");
    return 0;
}
