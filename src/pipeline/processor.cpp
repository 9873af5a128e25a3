#include "pipeline/processor.hpp"
#include "pipeline/record_io.hpp"
#include "schema/constraint_cache.hpp"
#include "schema/constraint_validator.hpp"
#include "schema/ischema_catalog.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace pdpl {

namespace {

constexpr const char* kOrganizationColumn = "organization_id";

/**
 * @brief Column rule as applied to the stored column
 *
 * "preferences.email" with HASH becomes "preferences" with JSON and a
 * single root-anchored field rule {"email": HASH}.
 */
ColumnSpec to_stored_column(const ColumnSpec& spec) {
    if (!spec.is_json_path()) return spec;

    const size_t dot = spec.column.find('.');
    FieldStrategy field(spec.column.substr(dot + 1), spec.kind);
    field.mask = spec.mask;

    auto json = std::make_shared<JsonConfig>();
    json->add_rooted(std::move(field));

    ColumnSpec stored;
    stored.table = spec.table;
    stored.column = spec.column.substr(0, dot);
    stored.kind = StrategyKind::JSON;
    stored.json = std::move(json);
    return stored;
}

} // anonymous namespace

Processor::Processor(const EngineConfig& config, const ISchemaCatalog& catalog,
                     IRecordSource& source, IRecordSink& sink)
    : config_(config),
      catalog_(catalog),
      source_(source),
      sink_(sink),
      hasher_(config.hashing.salt, config.hashing.namespace_uuid),
      rewriter_(hasher_, RewriteOptions{static_cast<size_t>(config.rewrite.max_depth)}),
      anonymizer_(hasher_, rewriter_) {
    utils::log::set_level(utils::log::parse_level(config.logging.level).value_or(utils::log::Level::INFO));
}

// ============================================================================
// Run
// ============================================================================

ProcessingSummary Processor::run() {
    const ConstraintCache cache(catalog_);
    const ConstraintValidator validator(cache, config_.validation.protected_columns);

    // All-or-nothing gate: nothing is read or written unless every column is legal
    const auto report = validator.validate(config_.columns);
    if (!report.ok()) {
        utils::log::error(std::format("Validation failed for {} column(s), no data touched",
                                      report.size()));
    }
    ConstraintValidator::ensure_valid(report);

    ProcessingSummary summary;
    summary.dry_run = config_.processing.dry_run;

    for (const auto& spec : config_.columns) {
        const auto stored = to_stored_column(spec);

        if (!cache.table_exists(stored.table)) {
            utils::log::warn(std::format("Skipping {}: table '{}' not found",
                                         spec.full_name(), stored.table));
            ColumnResult skipped{spec.table, spec.column, spec.kind};
            skipped.skipped = true;
            summary.columns.push_back(std::move(skipped));
            continue;
        }
        if (!cache.column_info(stored.table, stored.column)) {
            utils::log::warn(std::format("Skipping {}: column '{}' not found",
                                         spec.full_name(), stored.column));
            ColumnResult skipped{spec.table, spec.column, spec.kind};
            skipped.skipped = true;
            summary.columns.push_back(std::move(skipped));
            continue;
        }

        summary.columns.push_back(process_column(spec, stored, scope_for(stored.table, cache)));
    }

    for (const auto& action : config_.table_actions) {
        summary.table_actions.push_back(process_table_action(action, cache));
    }

    utils::log::info(std::format("Anonymization {}: {} records across {} columns, {} table action(s)",
        summary.dry_run ? "dry run finished" : "finished",
        summary.total_records(), summary.columns.size(), summary.table_actions.size()));
    return summary;
}

RecordScope Processor::scope_for(const std::string& table, const ConstraintCache& cache) const {
    RecordScope scope;
    if (config_.processing.organization_id && cache.column_info(table, kOrganizationColumn)) {
        scope.organization_id = config_.processing.organization_id;
    }
    return scope;
}

// ============================================================================
// Per-Column Batches
// ============================================================================

ColumnResult Processor::process_column(const ColumnSpec& spec, const ColumnSpec& stored,
                                       const RecordScope& scope) {
    ColumnResult result{spec.table, spec.column, spec.kind};
    const bool dry_run = config_.processing.dry_run;
    const auto batch_size = static_cast<size_t>(config_.processing.batch_size);

    utils::log::info(std::format("Anonymizing {} with strategy '{}'{}",
        spec.full_name(), strategy_kind_to_string(spec.kind), dry_run ? " (dry run)" : ""));
    utils::Timer timer;

    size_t offset = 0;
    while (true) {
        const auto page = source_.fetch_page(stored.table, stored.column, offset, batch_size, scope);
        if (page.empty()) break;
        ++result.batches;

        for (const auto& record : page) {
            if (!record.value) continue;

            auto anonymized = anonymizer_.anonymize(stored, *record.value);
            ++result.records_processed;

            if (dry_run) {
                result.dry_run_entries.push_back({record.id, *record.value, std::move(anonymized)});
                continue;
            }

            if (anonymized) {
                sink_.apply_update(stored.table, stored.column, record.id, *anonymized);
            } else if (stored.kind == StrategyKind::DELETE) {
                sink_.apply_delete(stored.table, stored.column, record.id);
            }
            // Blank value under a non-DELETE strategy: row left as is
        }

        utils::log::info(std::format("{}: batch {} done, {} records so far",
                                     spec.full_name(), result.batches, result.records_processed));

        if (page.size() < batch_size) break;
        offset += page.size();
    }

    utils::log::info(std::format("Completed {}: {} records in {} batches ({} ms)",
        spec.full_name(), result.records_processed, result.batches, timer.elapsed_ms().count()));
    return result;
}

// ============================================================================
// Table Actions
// ============================================================================

TableActionResult Processor::process_table_action(const TableAction& action,
                                                  const ConstraintCache& cache) {
    TableActionResult result{action.table, action.reason, action.team};

    if (!cache.table_exists(action.table)) {
        utils::log::warn(std::format("Skipping table action on '{}': table not found", action.table));
        result.skipped = true;
        return result;
    }

    const auto scope = scope_for(action.table, cache);
    if (!scope.scoped()) {
        utils::log::warn(std::format("Skipping table action on '{}': no {} column",
                                     action.table, kOrganizationColumn));
        result.skipped = true;
        return result;
    }

    if (config_.processing.dry_run) {
        result.records = source_.count_rows(action.table, scope);
        utils::log::info(std::format("Table '{}' would lose {} records of organization {} (dry run)",
            action.table, result.records, *scope.organization_id));
    } else {
        result.records = sink_.delete_rows(action.table, scope);
        utils::log::info(std::format("Deleted {} records of organization {} from '{}'",
            result.records, *scope.organization_id, action.table));
    }
    return result;
}

} // namespace pdpl
