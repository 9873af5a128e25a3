#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace pdpl {

/**
 * @brief Abstract source of schema facts
 *
 * Implementations query their database's catalog tables (information_schema,
 * pg_index, ...). Called at most once per table per cache lifetime.
 */
class ISchemaCatalog {
public:
    virtual ~ISchemaCatalog() = default;

    [[nodiscard]] virtual bool table_exists(const std::string& table) const = 0;

    /**
     * @brief Columns of an existing table with their constraints
     * @return Empty if the table has no columns or does not exist
     */
    [[nodiscard]] virtual std::vector<ColumnFacts> describe_table(const std::string& table) const = 0;
};

} // namespace pdpl
