#pragma once

#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pdpl {

class ISchemaCatalog;

/**
 * @brief Per-table schema facts, fetched once and shared (RCU)
 *
 * Readers load the current map with an atomic shared_ptr load and never
 * block. A miss takes the populate mutex, re-checks, asks the catalog, and
 * publishes a copy of the map that includes the new table. Entries are
 * immutable once published, so each table is described exactly once until
 * invalidate().
 *
 * Meant to live for one validation run; catalog exceptions propagate.
 */
class ConstraintCache {
public:
    using TableMap = std::unordered_map<std::string, std::shared_ptr<const TableFacts>>;

    explicit ConstraintCache(const ISchemaCatalog& catalog);

    /**
     * @brief Facts for a table, populating on first use
     * @return Never null; exists == false for unknown tables
     */
    [[nodiscard]] std::shared_ptr<const TableFacts> table(const std::string& name) const;

    [[nodiscard]] bool table_exists(const std::string& name) const;

    // nullopt when the table or the column is unknown
    [[nodiscard]] std::optional<ConstraintInfo> column_info(const std::string& table,
                                                            const std::string& column) const;

    // Drops every cached table; the next lookup goes back to the catalog
    void invalidate();

    [[nodiscard]] size_t table_count() const;

private:
    [[nodiscard]] std::shared_ptr<const TableFacts> populate(const std::string& name) const;

    const ISchemaCatalog& catalog_;

    // RCU: readers load this shared_ptr atomically
    mutable std::shared_ptr<const TableMap> tables_;

    // Serializes population and invalidation
    mutable std::mutex populate_mutex_;
};

} // namespace pdpl
