#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pdpl {

/**
 * @brief One row of one column, as read from the database
 */
struct Record {
    int64_t id = 0;
    std::optional<std::string> value;     // nullopt for SQL NULL
};

/**
 * @brief Row filter applied by sources and sinks
 *
 * Set only for tables that carry an organization_id column.
 */
struct RecordScope {
    std::optional<int64_t> organization_id;

    [[nodiscard]] bool scoped() const { return organization_id.has_value(); }
};

/**
 * @brief Abstract reader of column values, one page at a time
 *
 * Implementations own their connections and throw on I/O failure.
 */
class IRecordSource {
public:
    virtual ~IRecordSource() = default;

    /**
     * @brief Read up to limit records starting at offset
     * @return Fewer than limit records (possibly none) once the column is exhausted
     */
    [[nodiscard]] virtual std::vector<Record> fetch_page(const std::string& table,
                                                         const std::string& column,
                                                         size_t offset, size_t limit,
                                                         const RecordScope& scope) = 0;

    // Rows of table inside scope; what delete_rows would remove
    [[nodiscard]] virtual size_t count_rows(const std::string& table, const RecordScope& scope) = 0;
};

/**
 * @brief Abstract writer of anonymized values
 *
 * Never called in dry-run mode. Implementations throw on I/O failure.
 */
class IRecordSink {
public:
    virtual ~IRecordSink() = default;

    virtual void apply_update(const std::string& table, const std::string& column,
                              int64_t id, const std::string& value) = 0;

    // Sets the column to NULL
    virtual void apply_delete(const std::string& table, const std::string& column, int64_t id) = 0;

    /**
     * @brief Remove every row of table inside scope
     * @return Number of rows removed
     */
    virtual size_t delete_rows(const std::string& table, const RecordScope& scope) = 0;
};

} // namespace pdpl
