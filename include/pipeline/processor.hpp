#pragma once

#include "config/config_types.hpp"
#include "core/column_anonymizer.hpp"
#include "core/hasher.hpp"
#include "core/json_rewriter.hpp"
#include "core/types.hpp"
#include "pipeline/record_io.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pdpl {

class ConstraintCache;
class ISchemaCatalog;
class IRecordSource;
class IRecordSink;

struct DryRunEntry {
    int64_t id = 0;
    std::string original;
    std::optional<std::string> anonymized;    // nullopt: would be set to NULL
};

struct ColumnResult {
    std::string table;
    std::string column;
    StrategyKind strategy = StrategyKind::HASH;
    size_t records_processed = 0;
    size_t batches = 0;
    bool skipped = false;                     // table or column missing from the catalog
    std::vector<DryRunEntry> dry_run_entries;
};

struct TableActionResult {
    std::string table;
    std::string reason;
    std::string team;
    size_t records = 0;                       // deleted, or would be deleted in dry run
    bool skipped = false;                     // table or its organization_id column missing
};

struct ProcessingSummary {
    bool dry_run = false;
    std::vector<ColumnResult> columns;
    std::vector<TableActionResult> table_actions;

    [[nodiscard]] size_t total_records() const {
        size_t total = 0;
        for (const auto& c : columns) total += c.records_processed;
        return total;
    }
};

/**
 * @brief Batch orchestrator: validation gate, then page-by-page rewrite
 *
 * run() validates every configured column first and throws
 * ConfigurationError with the whole report if any is illegal; in that case
 * neither the record source nor the sink is touched.
 *
 * A column addressed by dot-path ("preferences.email") is processed as a
 * JSON column "preferences" with a single field rule for "email", anchored
 * at the document root.
 *
 * With processing.organization_id set, reads on tables that have an
 * organization_id column only see that organization's rows. Table actions
 * run after every column and delete (or, in dry run, count) those rows.
 */
class Processor {
public:
    Processor(const EngineConfig& config, const ISchemaCatalog& catalog,
              IRecordSource& source, IRecordSink& sink);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    /**
     * @brief Anonymize every configured column
     * @throws ConfigurationError if validation reports any violation
     */
    [[nodiscard]] ProcessingSummary run();

private:
    ColumnResult process_column(const ColumnSpec& spec, const ColumnSpec& effective,
                                const RecordScope& scope);
    TableActionResult process_table_action(const TableAction& action, const ConstraintCache& cache);
    [[nodiscard]] RecordScope scope_for(const std::string& table, const ConstraintCache& cache) const;

    const EngineConfig& config_;
    const ISchemaCatalog& catalog_;
    IRecordSource& source_;
    IRecordSink& sink_;

    DeterministicHasher hasher_;
    JsonRewriter rewriter_;
    ColumnAnonymizer anonymizer_;
};

} // namespace pdpl
