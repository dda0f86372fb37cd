#pragma once

#include "shell/shell_config.hpp"
#include "toydb/row.h"

#include <string>
#include <vector>

namespace toydb::shell {

// Union of the rows' columns, in first-seen order
std::vector<std::string> collect_columns(const std::vector<Row>& rows);

// Fixed-width text table followed by "(N rows)"
std::string render_table(const std::vector<Row>& rows);

// One JSON array of row objects
std::string render_json(const std::vector<Row>& rows);

std::string render_rows(const std::vector<Row>& rows, OutputFormat format);

} // namespace toydb::shell
