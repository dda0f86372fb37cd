// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ToyDB - Execution Engine                                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "toydb/result.h"
#include "toydb/row.h"
#include "toydb/sql/statement.h"
#include "toydb/table.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toydb {

/// Rows for SELECT, std::nullopt for INSERT/UPDATE/DELETE
using QueryOutput = std::optional<std::vector<Row>>;

/// In-memory table store plus statement execution.
///
/// Not thread-safe: callers sharing one engine across threads must
/// serialize create_table() and execute() themselves.
class Engine {
public:
    struct Config {
        /// SELECT, UPDATE and DELETE report an existing table with no rows
        /// as TableNotFound. INSERT only checks that the table exists.
        bool empty_table_is_missing = true;
    };

    Engine();
    explicit Engine(Config config);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = default;
    Engine& operator=(Engine&&) = default;

    // =========================================================================
    // Catalog
    // =========================================================================

    /// Declared columns are kept as metadata only and never enforced.
    [[nodiscard]] Status create_table(const std::string& name, std::vector<std::string> columns);

    [[nodiscard]] bool has_table(const std::string& name) const;

    /// Table names in ascending order
    [[nodiscard]] std::vector<std::string> list_tables() const;

    [[nodiscard]] Result<std::vector<std::string>> table_columns(const std::string& name) const;

    [[nodiscard]] Result<size_t> row_count(const std::string& name) const;

    // =========================================================================
    // Statements
    // =========================================================================

    /// Parses and executes one statement.
    [[nodiscard]] Result<QueryOutput> execute(std::string_view query);

    [[nodiscard]] Result<QueryOutput> execute(const sql::Statement& stmt);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    // Throwing implementations, one per statement variant
    QueryOutput run(const sql::SelectStatement& stmt) const;
    QueryOutput run(const sql::InsertStatement& stmt);
    QueryOutput run(const sql::UpdateStatement& stmt);
    QueryOutput run(const sql::DeleteStatement& stmt);

    // Lookup for SELECT/UPDATE/DELETE (honours empty_table_is_missing)
    Table& lookup_populated(const std::string& name);
    const Table& lookup_populated(const std::string& name) const;

    // Lookup for INSERT: existence only
    Table& lookup_existing(const std::string& name);

    Config config_;
    std::unordered_map<std::string, Table> tables_;
};

} // namespace toydb
