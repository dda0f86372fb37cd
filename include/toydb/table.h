#pragma once

#include "toydb/row.h"

#include <string>
#include <vector>

namespace toydb {

class Table {
public:
    std::string name;
    std::vector<std::string> columns;  // declared at creation, never enforced
    std::vector<Row> rows;

    Table() = default;
    Table(std::string table_name, std::vector<std::string> cols)
        : name(std::move(table_name)), columns(std::move(cols)) {}

    bool empty() const { return rows.empty(); }
    size_t row_count() const { return rows.size(); }
};

} // namespace toydb
