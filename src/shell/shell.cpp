#include "shell/shell.hpp"
#include "shell/result_printer.hpp"
#include "utils/logger.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/core.h>

#include <sstream>

namespace toydb::shell {

namespace {

std::string trim(const std::string& str) {
    return boost::trim_copy_if(str, boost::is_any_of(" \t\r\n"));
}

} // anonymous namespace

Shell::Shell(Engine& engine, OutputFormat format, std::ostream& out, std::ostream& err)
    : engine_(engine), format_(format), out_(out), err_(err) {}

bool Shell::run(std::istream& in) {
    std::string line;

    while (!quit_) {
        if (!prompt_.empty()) {
            out_ << (pending_.empty() ? prompt_ : std::string("   ...> ")) << std::flush;
        }

        if (!std::getline(in, line)) break;

        std::string trimmed = trim(line);

        if (pending_.empty() && !trimmed.empty() && trimmed[0] == '.') {
            if (!execute_meta(trimmed)) {
                ++stats_.failed;
                if (stop_on_error_) return false;
            }
            continue;
        }

        if (trimmed.empty()) {
            if (!flush_pending() && stop_on_error_) return false;
            continue;
        }

        if (!pending_.empty()) pending_ += "\n";
        pending_ += line;

        if (trimmed.back() == ';') {
            if (!flush_pending() && stop_on_error_) return false;
        }
    }

    return flush_pending() || !stop_on_error_;
}

bool Shell::flush_pending() {
    if (trim(pending_).empty()) {
        pending_.clear();
        return true;
    }

    std::string statement = std::move(pending_);
    pending_.clear();
    return execute_statement(statement);
}

bool Shell::execute_statement(const std::string& text) {
    ++stats_.executed;

    auto result = engine_.execute(text);
    if (!result) {
        ++stats_.failed;
        print_error(result.error());
        return false;
    }

    const QueryOutput& output = *result;
    if (output) {
        out_ << render_rows(*output, format_);
    } else if (format_ == OutputFormat::TABLE) {
        out_ << "OK\n";
    }

    return true;
}

bool Shell::execute_meta(const std::string& line) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    boost::to_lower(command);

    if (command == ".quit" || command == ".exit") {
        quit_ = true;
        return true;
    }

    if (command == ".help") {
        print_help();
        return true;
    }

    if (command == ".tables") {
        for (const auto& name : engine_.list_tables()) {
            auto columns = engine_.table_columns(name);
            auto rows = engine_.row_count(name);
            std::string column_list;
            if (columns) {
                for (size_t i = 0; i < columns->size(); ++i) {
                    if (i > 0) column_list += ", ";
                    column_list += (*columns)[i];
                }
            }
            out_ << fmt::format("{} ({} rows): {}\n", name, rows ? *rows : 0, column_list);
        }
        return true;
    }

    if (command == ".create") {
        std::string name;
        iss >> name;
        std::string rest;
        std::getline(iss, rest);

        auto spec = parse_table_spec(name + ":" + rest);
        if (!spec) {
            print_error(spec.error());
            return false;
        }

        auto status = engine_.create_table(spec->name, spec->columns);
        if (!status) {
            print_error(status.error());
            return false;
        }
        if (format_ == OutputFormat::TABLE) {
            out_ << "OK\n";
        }
        return true;
    }

    print_error(Error(ErrorCode::InvalidArgument,
                      fmt::format("Unknown command '{}'. Try .help", command)));
    return false;
}

void Shell::print_error(const Error& error) {
    Logger::warn("{}", error.to_string());
    err_ << "Error: " << error.to_string() << "\n";
}

void Shell::print_help() {
    out_ << "Statements (end with ';' or a blank line):\n"
         << "  SELECT <cols|*> FROM <table> [WHERE <col> <op> <value>] [ORDER BY <col>];\n"
         << "  INSERT INTO <table> (<cols>) VALUES (<values>);\n"
         << "  UPDATE <table> SET <col>=<value>[, ...] [WHERE <col> <op> <value>];\n"
         << "  DELETE FROM <table> [WHERE <col> <op> <value>];\n"
         << "Commands:\n"
         << "  .create <table> <col1>,<col2>,...   create a table\n"
         << "  .tables                            list tables\n"
         << "  .help                              show this help\n"
         << "  .quit                              exit\n";
}

} // namespace toydb::shell
