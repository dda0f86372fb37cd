#pragma once

#include "toydb/result.h"

#include <string>
#include <string_view>
#include <vector>

namespace toydb::shell {

enum class OutputFormat {
    TABLE,
    JSON
};

struct TableSpec {
    std::string name;
    std::vector<std::string> columns;
};

struct ShellConfig {
    // Input
    std::string script_file;
    std::string schema_file;
    std::string config_file;
    std::vector<std::string> table_specs;  // "name:col1,col2"

    // Output
    OutputFormat format = OutputFormat::TABLE;

    // Logging
    std::string log_level = "warn";
    std::string log_file;

    // Engine
    bool allow_empty_tables = false;

    // Behaviour
    bool stop_on_error = false;

    /// Reads `key = value` lines; '#' and ';' start comments.
    Status load_from_file(const std::string& path);
};

[[nodiscard]] Result<OutputFormat> parse_output_format(std::string_view name);

/// "users:id,name,age"
[[nodiscard]] Result<TableSpec> parse_table_spec(std::string_view spec);

/// {"tables": {"users": ["id", "name", "age"]}}
[[nodiscard]] Result<std::vector<TableSpec>> parse_schema(std::string_view json_text);

[[nodiscard]] Result<std::vector<TableSpec>> load_schema_file(const std::string& path);

} // namespace toydb::shell
