#include "toydb/engine.h"
#include "toydb/exceptions.h"
#include "toydb/sql/parser.h"
#include "utils/logger.hpp"

#include <algorithm>
#include <numeric>

namespace toydb {

Engine::Engine() : Engine(Config{}) {}

Engine::Engine(Config config) : config_(config) {
    Logger::debug("Engine created (empty_table_is_missing={})", config_.empty_table_is_missing);
}

// =============================================================================
// Catalog
// =============================================================================

Status Engine::create_table(const std::string& name, std::vector<std::string> columns) {
    if (tables_.count(name) != 0) {
        TableExistsError err(name);
        Logger::debug("create_table failed: {}", err.what());
        return Err(err.to_error());
    }

    Logger::info("Created table '{}' with {} declared columns", name, columns.size());
    tables_.emplace(name, Table(name, std::move(columns)));
    return Ok();
}

bool Engine::has_table(const std::string& name) const {
    return tables_.count(name) != 0;
}

std::vector<std::string> Engine::list_tables() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, table] : tables_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<std::vector<std::string>> Engine::table_columns(const std::string& name) const {
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return Err<std::vector<std::string>>(TableNotFoundError(name).to_error());
    }
    return it->second.columns;
}

Result<size_t> Engine::row_count(const std::string& name) const {
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return Err<size_t>(TableNotFoundError(name).to_error());
    }
    return it->second.row_count();
}

// =============================================================================
// Statements
// =============================================================================

Result<QueryOutput> Engine::execute(std::string_view query) {
    Logger::debug("Executing query: {}", query);

    try {
        sql::Statement stmt = sql::parse(query);
        return execute(stmt);
    } catch (const Exception& e) {
        Logger::debug("Query rejected: {}", e.what());
        return Err<QueryOutput>(e.to_error());
    }
}

Result<QueryOutput> Engine::execute(const sql::Statement& stmt) {
    Logger::debug("Dispatching {} on '{}'", sql::statement_kind(stmt), sql::statement_table(stmt));

    try {
        return std::visit([this](const auto& s) { return run(s); }, stmt);
    } catch (const Exception& e) {
        Logger::debug("{} failed: {}", sql::statement_kind(stmt), e.what());
        return Err<QueryOutput>(e.to_error());
    }
}

QueryOutput Engine::run(const sql::SelectStatement& stmt) const {
    const Table& table = lookup_populated(stmt.table);

    // Filter
    std::vector<Row> rows;
    if (stmt.where) {
        for (const Row& row : table.rows) {
            if (stmt.where->matches(row)) {
                rows.push_back(row);
            }
        }
    } else {
        rows = table.rows;
    }

    // Sort the result only; the stored table keeps insertion order
    if (stmt.order_by) {
        std::vector<const std::string*> keys;
        keys.reserve(rows.size());
        for (const Row& row : rows) {
            keys.push_back(&row.at(*stmt.order_by));
        }

        std::vector<size_t> order(rows.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
            [&keys](size_t a, size_t b) { return *keys[a] < *keys[b]; });

        std::vector<Row> sorted;
        sorted.reserve(rows.size());
        for (size_t index : order) {
            sorted.push_back(std::move(rows[index]));
        }
        rows = std::move(sorted);
    }

    // Project
    if (!stmt.selects_all()) {
        std::vector<Row> projected;
        projected.reserve(rows.size());
        for (const Row& row : rows) {
            Row out;
            for (const std::string& column : stmt.columns) {
                out.set(column, row.at(column));
            }
            projected.push_back(std::move(out));
        }
        rows = std::move(projected);
    }

    return rows;
}

QueryOutput Engine::run(const sql::InsertStatement& stmt) {
    Table& table = lookup_existing(stmt.table);

    if (stmt.columns.size() != stmt.values.size()) {
        throw ColumnValueMismatchError(stmt.columns.size(), stmt.values.size());
    }

    Row row;
    for (size_t i = 0; i < stmt.columns.size(); ++i) {
        row.set(stmt.columns[i], stmt.values[i]);
    }
    table.rows.push_back(std::move(row));

    return std::nullopt;
}

QueryOutput Engine::run(const sql::UpdateStatement& stmt) {
    Table& table = lookup_populated(stmt.table);

    // A RowKeyError mid-scan leaves earlier rows updated
    size_t updated = 0;
    for (Row& row : table.rows) {
        if (stmt.where && !stmt.where->matches(row)) {
            continue;
        }
        for (const auto& [column, value] : stmt.assignments) {
            row.set(column, value);
        }
        ++updated;
    }

    Logger::debug("Updated {} rows in '{}'", updated, stmt.table);
    return std::nullopt;
}

QueryOutput Engine::run(const sql::DeleteStatement& stmt) {
    Table& table = lookup_populated(stmt.table);

    // Without WHERE nothing survives
    std::vector<Row> survivors;
    if (stmt.where) {
        for (const Row& row : table.rows) {
            if (!stmt.where->matches(row)) {
                survivors.push_back(row);
            }
        }
    }

    Logger::debug("Deleted {} rows from '{}'", table.rows.size() - survivors.size(), stmt.table);
    table.rows = std::move(survivors);
    return std::nullopt;
}

// =============================================================================
// Lookup
// =============================================================================

Table& Engine::lookup_populated(const std::string& name) {
    const auto& self = *this;
    return const_cast<Table&>(self.lookup_populated(name));
}

const Table& Engine::lookup_populated(const std::string& name) const {
    auto it = tables_.find(name);
    if (it == tables_.end() || (config_.empty_table_is_missing && it->second.empty())) {
        throw TableNotFoundError(name);
    }
    return it->second;
}

Table& Engine::lookup_existing(const std::string& name) {
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        throw TableNotFoundError(name);
    }
    return it->second;
}

} // namespace toydb
