#pragma once

#include "shell/shell_config.hpp"
#include "toydb/engine.h"

#include <istream>
#include <ostream>
#include <string>

namespace toydb::shell {

// Line-oriented front end for one Engine.
//
// A statement ends at a line whose last non-blank character is ';', at a
// blank line, or at end of input. Lines starting with '.' are meta-commands
// when no statement is pending.
class Shell {
public:
    struct Stats {
        size_t executed = 0;
        size_t failed = 0;
    };

    Shell(Engine& engine, OutputFormat format, std::ostream& out, std::ostream& err);

    void set_stop_on_error(bool stop) { stop_on_error_ = stop; }
    void set_prompt(std::string prompt) { prompt_ = std::move(prompt); }

    /// Processes the whole stream. Returns false if stopped by an error
    /// while stop-on-error is set.
    bool run(std::istream& in);

    /// Executes one statement and prints its result or error.
    bool execute_statement(const std::string& text);

    /// Handles ".create", ".tables", ".help" and ".quit".
    bool execute_meta(const std::string& line);

    bool quit_requested() const { return quit_; }
    const Stats& stats() const { return stats_; }

private:
    bool flush_pending();
    void print_error(const Error& error);
    void print_help();

    Engine& engine_;
    OutputFormat format_;
    std::ostream& out_;
    std::ostream& err_;

    std::string pending_;
    std::string prompt_;
    bool stop_on_error_{false};
    bool quit_{false};
    Stats stats_;
};

} // namespace toydb::shell
