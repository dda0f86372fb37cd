#include "shell/result_printer.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <algorithm>

namespace toydb::shell {

namespace {

constexpr size_t kCellWidth = 15;

} // anonymous namespace

std::vector<std::string> collect_columns(const std::vector<Row>& rows) {
    std::vector<std::string> columns;
    for (const Row& row : rows) {
        for (const auto& [column, value] : row) {
            if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
                columns.push_back(column);
            }
        }
    }
    return columns;
}

std::string render_table(const std::vector<Row>& rows) {
    std::vector<std::string> columns = collect_columns(rows);
    std::string out;

    if (!columns.empty()) {
        // Header
        for (const auto& column : columns) {
            out += fmt::format("{:<{}}| ", column, kCellWidth);
        }
        out += "\n";
        out += std::string(columns.size() * (kCellWidth + 2), '-');
        out += "\n";

        // Rows
        for (const Row& row : rows) {
            for (const auto& column : columns) {
                const std::string* value = row.find(column);
                out += fmt::format("{:<{}}| ", value ? *value : std::string(), kCellWidth);
            }
            out += "\n";
        }
    }

    out += fmt::format("({} rows)\n", rows.size());
    return out;
}

std::string render_json(const std::vector<Row>& rows) {
    nlohmann::json array = nlohmann::json::array();
    for (const Row& row : rows) {
        array.push_back(row.to_json());
    }
    return array.dump() + "\n";
}

std::string render_rows(const std::vector<Row>& rows, OutputFormat format) {
    switch (format) {
        case OutputFormat::TABLE: return render_table(rows);
        case OutputFormat::JSON: return render_json(rows);
    }
    return render_table(rows);
}

} // namespace toydb::shell
