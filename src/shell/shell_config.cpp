#include "shell/shell_config.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace toydb::shell {

namespace {

std::string trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return std::string(s);
}

bool parse_bool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // anonymous namespace

Status ShellConfig::load_from_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return Err(ErrorCode::IoError, fmt::format("Config file '{}' not found", path));
    }

    std::ifstream file(path);
    if (!file) {
        return Err(ErrorCode::IoError, fmt::format("Cannot open config file '{}'", path));
    }

    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') continue;

        auto pos = trimmed.find('=');
        if (pos == std::string::npos) {
            return Err(ErrorCode::InvalidArgument,
                       fmt::format("{}:{}: expected key = value", path, line_no));
        }

        std::string key = trim(std::string_view(trimmed).substr(0, pos));
        std::string value = trim(std::string_view(trimmed).substr(pos + 1));

        if (key == "format") {
            auto fmt_result = parse_output_format(value);
            if (!fmt_result) return Err(fmt_result.error());
            format = *fmt_result;
        }
        else if (key == "log_level") log_level = value;
        else if (key == "log_file") log_file = value;
        else if (key == "schema") schema_file = value;
        else if (key == "script") script_file = value;
        else if (key == "table") table_specs.push_back(value);
        else if (key == "allow_empty_tables") allow_empty_tables = parse_bool(value);
        else if (key == "stop_on_error") stop_on_error = parse_bool(value);
        else {
            return Err(ErrorCode::InvalidArgument,
                       fmt::format("{}:{}: unknown key '{}'", path, line_no, key));
        }
    }

    return Ok();
}

Result<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "table") return OutputFormat::TABLE;
    if (name == "json") return OutputFormat::JSON;
    return Err<OutputFormat>(ErrorCode::InvalidArgument,
                             fmt::format("Unknown output format '{}' (expected table or json)", name));
}

Result<TableSpec> parse_table_spec(std::string_view spec) {
    auto colon = spec.find(':');
    if (colon == std::string_view::npos) {
        return Err<TableSpec>(ErrorCode::InvalidArgument,
                              fmt::format("Table spec '{}' must look like name:col1,col2", spec));
    }

    TableSpec table;
    table.name = trim(spec.substr(0, colon));
    if (table.name.empty()) {
        return Err<TableSpec>(ErrorCode::InvalidArgument,
                              fmt::format("Table spec '{}' has no table name", spec));
    }

    std::stringstream ss{std::string(spec.substr(colon + 1))};
    std::string column;
    while (std::getline(ss, column, ',')) {
        column = trim(column);
        if (!column.empty()) {
            table.columns.push_back(column);
        }
    }

    return table;
}

Result<std::vector<TableSpec>> parse_schema(std::string_view json_text) {
    using Tables = std::vector<TableSpec>;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<Tables>(ErrorCode::InvalidArgument, fmt::format("Invalid schema JSON: {}", e.what()));
    }

    if (!doc.is_object() || !doc.contains("tables") || !doc["tables"].is_object()) {
        return Err<Tables>(ErrorCode::InvalidArgument, "Schema must contain a \"tables\" object");
    }

    Tables tables;
    for (const auto& [name, columns] : doc["tables"].items()) {
        if (!columns.is_array()) {
            return Err<Tables>(ErrorCode::InvalidArgument,
                               fmt::format("Columns of table '{}' must be an array", name));
        }

        TableSpec table;
        table.name = name;
        for (const auto& column : columns) {
            if (!column.is_string()) {
                return Err<Tables>(ErrorCode::InvalidArgument,
                                   fmt::format("Column names of table '{}' must be strings", name));
            }
            table.columns.push_back(column.get<std::string>());
        }
        tables.push_back(std::move(table));
    }

    return tables;
}

Result<std::vector<TableSpec>> load_schema_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<std::vector<TableSpec>>(ErrorCode::IoError,
                                           fmt::format("Cannot open schema file '{}'", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_schema(buffer.str());
}

} // namespace toydb::shell
