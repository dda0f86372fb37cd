#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <unistd.h>

// Third-party includes
#include <CLI/CLI.hpp>
#include <fmt/core.h>

// Project includes
#include "shell/shell.hpp"
#include "shell/shell_config.hpp"
#include "toydb/engine.h"
#include "toydb/version.h"
#include "utils/logger.hpp"

using toydb::Logger;
using toydb::shell::ShellConfig;

namespace {

// ============================================================================
// Configuration
// ============================================================================

// Values from --config apply only where the option was not given on the command line.
bool merge_config_file(CLI::App& app, ShellConfig& config) {
    ShellConfig file_config;
    auto status = file_config.load_from_file(config.config_file);
    if (!status) {
        std::cerr << "Failed to load config: " << status.error().to_string() << std::endl;
        return false;
    }

    auto given = [&app](const char* name) { return app.get_option(name)->count() > 0; };

    if (!given("--script")) config.script_file = file_config.script_file;
    if (!given("--schema")) config.schema_file = file_config.schema_file;
    if (!given("--format")) config.format = file_config.format;
    if (!given("--log-level")) config.log_level = file_config.log_level;
    if (!given("--log-file")) config.log_file = file_config.log_file;
    if (!given("--allow-empty-tables")) config.allow_empty_tables = file_config.allow_empty_tables;
    if (!given("--stop-on-error")) config.stop_on_error = file_config.stop_on_error;

    config.table_specs.insert(config.table_specs.begin(),
                              file_config.table_specs.begin(), file_config.table_specs.end());
    return true;
}

bool create_tables(toydb::Engine& engine, const ShellConfig& config) {
    std::vector<toydb::shell::TableSpec> tables;

    if (!config.schema_file.empty()) {
        auto schema = toydb::shell::load_schema_file(config.schema_file);
        if (!schema) {
            std::cerr << "Error: " << schema.error().to_string() << std::endl;
            return false;
        }
        tables = std::move(*schema);
    }

    for (const auto& spec_text : config.table_specs) {
        auto spec = toydb::shell::parse_table_spec(spec_text);
        if (!spec) {
            std::cerr << "Error: " << spec.error().to_string() << std::endl;
            return false;
        }
        tables.push_back(std::move(*spec));
    }

    for (const auto& table : tables) {
        auto status = engine.create_table(table.name, table.columns);
        if (!status) {
            std::cerr << "Error: " << status.error().to_string() << std::endl;
            return false;
        }
    }

    return true;
}

} // anonymous namespace

// ============================================================================
// Entry Point
// ============================================================================
int main(int argc, char* argv[]) {
    ShellConfig config;
    std::string format_name = "table";

    CLI::App app{"ToyDB - in-memory SQL shell"};

    app.add_option("-s,--script", config.script_file,
        "Read statements from a file instead of stdin");

    app.add_option("--schema", config.schema_file,
        "JSON schema file: {\"tables\": {\"name\": [\"col\", ...]}}")
        ->envname("TOYDB_SCHEMA");

    app.add_option("-t,--table", config.table_specs,
        "Create a table before running (name:col1,col2,...)");

    app.add_option("-c,--config", config.config_file,
        "Configuration file path")
        ->envname("TOYDB_CONFIG");

    app.add_option("-f,--format", format_name,
        "Output format (table/json)")
        ->check(CLI::IsMember({"table", "json"}));

    // Logging options
    app.add_option("-l,--log-level", config.log_level,
        "Log level (trace/debug/info/warn/error)")
        ->envname("TOYDB_LOG_LEVEL");

    app.add_option("--log-file", config.log_file,
        "Log file path")
        ->envname("TOYDB_LOG_FILE");

    app.add_flag("--allow-empty-tables", config.allow_empty_tables,
        "Treat existing tables without rows as present for SELECT/UPDATE/DELETE");

    app.add_flag("--stop-on-error", config.stop_on_error,
        "Exit on the first failing statement");

    app.add_flag_callback("--version", []() {
        std::cout << "ToyDB version " << TOYDB_VERSION << std::endl;
        std::cout << "Build type: " << TOYDB_BUILD_TYPE << std::endl;
        std::cout << "Compiler: " << TOYDB_COMPILER << std::endl;
        std::exit(0);
    }, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (app.get_option("--format")->count() > 0) {
        config.format = *toydb::shell::parse_output_format(format_name);
    }

    if (!config.config_file.empty() && !merge_config_file(app, config)) {
        return EXIT_FAILURE;
    }

    Logger::init(config.log_file, toydb::parse_log_level(config.log_level));
    Logger::info("Starting ToyDB shell v{}", TOYDB_VERSION);

    toydb::Engine::Config engine_config;
    engine_config.empty_table_is_missing = !config.allow_empty_tables;
    toydb::Engine engine(engine_config);

    if (!create_tables(engine, config)) {
        Logger::shutdown();
        return EXIT_FAILURE;
    }

    toydb::shell::Shell shell(engine, config.format, std::cout, std::cerr);
    shell.set_stop_on_error(config.stop_on_error);

    bool completed = false;
    if (!config.script_file.empty()) {
        std::ifstream script(config.script_file);
        if (!script) {
            std::cerr << "Error: cannot open script '" << config.script_file << "'" << std::endl;
            Logger::shutdown();
            return EXIT_FAILURE;
        }
        completed = shell.run(script);
    } else {
        if (isatty(fileno(stdin))) {
            fmt::print("ToyDB {} - type .help for usage\n", TOYDB_VERSION);
            shell.set_prompt("toydb> ");
        }
        completed = shell.run(std::cin);
    }

    const auto& stats = shell.stats();
    Logger::info("Executed {} statements, {} failed", stats.executed, stats.failed);
    Logger::shutdown();

    return (completed && stats.failed == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
