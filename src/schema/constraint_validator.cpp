#include "schema/constraint_validator.hpp"
#include "schema/constraint_cache.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace pdpl {

namespace {

constexpr std::string_view kProtectedReason = "Protected system identifier cannot be anonymized";
constexpr std::string_view kNotNullReason = "Column has NOT NULL constraint";
constexpr std::string_view kUniqueReason = "Column has UNIQUE constraint";
constexpr std::string_view kPrimaryKeyReason = "Column is a primary key";
constexpr std::string_view kJsonPathReason = "Strategy is not applicable to a JSON field path";

// Bookkeeping columns never worth anonymizing
const std::unordered_set<std::string> kSystemColumns = {
    "id", "created_at", "updated_at", "organization_id",
};

bool legal_for_json_path(StrategyKind kind) {
    return kind == StrategyKind::HASH || kind == StrategyKind::MASK ||
           kind == StrategyKind::DELETE || kind == StrategyKind::KEEP;
}

// "preferences.email" → "preferences"
std::string base_column(const std::string& column) {
    return column.substr(0, column.find('.'));
}

ValidationIssue make_issue(const ColumnSpec& spec, std::string_view reason,
                           std::optional<StrategyKind> suggested) {
    ValidationIssue issue;
    issue.table = spec.table;
    issue.column = spec.column;
    issue.strategy = spec.kind;
    issue.reason = std::string(reason);
    issue.suggested_strategy = suggested;
    return issue;
}

} // anonymous namespace

ConstraintValidator::ConstraintValidator(const ConstraintCache& cache,
                                         std::vector<std::string> protected_columns)
    : cache_(cache) {
    for (const auto& column : protected_columns) {
        protected_columns_.insert(utils::to_lower(utils::trim(column)));
    }
}

bool ConstraintValidator::is_protected(const std::string& column) const {
    return protected_columns_.contains(utils::to_lower(utils::trim(column)));
}

// ============================================================================
// Rule Evaluation
// ============================================================================

std::optional<ValidationIssue> ConstraintValidator::check(const ColumnSpec& spec) const {
    if (is_protected(spec.column)) {
        return make_issue(spec, kProtectedReason, std::nullopt);
    }

    if (spec.is_json_path()) {
        if (legal_for_json_path(spec.kind)) return std::nullopt;
        return make_issue(spec, kJsonPathReason, StrategyKind::HASH);
    }

    const auto info = cache_.column_info(spec.table, spec.column);
    if (!info) {
        utils::log::warn(std::format(
            "No schema facts for {}, treating it as unconstrained", spec.full_name()));
        return std::nullopt;
    }

    if (spec.kind == StrategyKind::DELETE && !info->nullable) {
        return make_issue(spec, kNotNullReason, StrategyKind::HASH);
    }

    if (info->effectively_unique() && spec.kind != StrategyKind::HASH) {
        return make_issue(spec, info->is_primary_key ? kPrimaryKeyReason : kUniqueReason,
                          StrategyKind::HASH);
    }

    return std::nullopt;
}

ValidationReport ConstraintValidator::validate(const std::vector<ColumnSpec>& specs) const {
    ValidationReport report;
    for (const auto& spec : specs) {
        if (auto issue = check(spec)) {
            report.issues.push_back(std::move(*issue));
        }
    }
    return report;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<StrategyKind> ConstraintValidator::allowed_strategies(const std::string& table,
                                                                  const std::string& column) const {
    if (column.find('.') != std::string::npos) {
        return {StrategyKind::HASH, StrategyKind::MASK, StrategyKind::DELETE, StrategyKind::KEEP};
    }

    const auto info = cache_.column_info(table, column).value_or(ConstraintInfo{});
    if (info.effectively_unique()) {
        return {StrategyKind::HASH};
    }

    std::vector<StrategyKind> allowed = {StrategyKind::HASH, StrategyKind::MASK};
    if (info.nullable) {
        allowed.push_back(StrategyKind::DELETE);
    }
    return allowed;
}

StrategyKind ConstraintValidator::suggest_strategy(const std::string& /*table*/,
                                                   const std::string& /*column*/) {
    return StrategyKind::HASH;
}

std::vector<ColumnSuggestion> ConstraintValidator::suggest_unconfigured(
    const std::string& table, const std::vector<ColumnSpec>& configured) const {
    std::vector<ColumnSuggestion> suggestions;
    const auto facts = cache_.table(table);
    if (!facts->exists) return suggestions;

    std::unordered_set<std::string> covered;
    for (const auto& spec : configured) {
        if (spec.table == table) covered.insert(base_column(spec.column));
    }

    for (const auto& [column, info] : facts->columns) {
        const auto lowered = utils::to_lower(column);
        if (kSystemColumns.contains(lowered) || is_protected(column) || covered.contains(column)) {
            continue;
        }
        suggestions.push_back({column, suggest_strategy(table, column), column_constraints(table, column)});
    }

    std::sort(suggestions.begin(), suggestions.end(),
              [](const ColumnSuggestion& a, const ColumnSuggestion& b) { return a.column < b.column; });

    utils::log::info(std::format("{} unconfigured column(s) in table '{}'", suggestions.size(), table));
    return suggestions;
}

ColumnConstraints ConstraintValidator::column_constraints(const std::string& table,
                                                          const std::string& column) const {
    ColumnConstraints result;
    if (column.find('.') == std::string::npos) {
        const auto info = cache_.column_info(table, column).value_or(ConstraintInfo{});
        result.not_null = !info.nullable;
        result.unique = info.effectively_unique();
    }
    result.allowed_strategies = allowed_strategies(table, column);
    return result;
}

// ============================================================================
// Raising Checks
// ============================================================================

void ConstraintValidator::enforce(const ColumnSpec& spec) const {
    if (is_protected(spec.column)) {
        throw ConfigurationError(std::format("{}: {}", spec.full_name(), kProtectedReason));
    }

    if (!cache_.table_exists(spec.table)) {
        throw ModelNotFoundError(std::format("Table '{}' not found", spec.table));
    }

    if (spec.is_json_path()) {
        const auto column = base_column(spec.column);
        if (!cache_.column_info(spec.table, column)) {
            throw DataNotFoundError(std::format("Column '{}.{}' not found", spec.table, column));
        }
        if (!legal_for_json_path(spec.kind)) {
            throw ConstraintError(std::format("Cannot use '{}' strategy on {}: {}",
                strategy_kind_to_string(spec.kind), spec.full_name(), kJsonPathReason));
        }
        return;
    }

    const auto info = cache_.column_info(spec.table, spec.column);
    if (!info) {
        throw DataNotFoundError(std::format("Column '{}' not found", spec.full_name()));
    }

    if (spec.kind == StrategyKind::DELETE && !info->nullable) {
        throw NotNullConstraintError(spec.table, spec.column, spec.kind,
                                     suggest_strategy(spec.table, spec.column));
    }

    if (info->effectively_unique() && spec.kind != StrategyKind::HASH) {
        throw ConstraintError(std::format("Cannot use '{}' strategy on {}: {}. Suggested strategy: '{}'",
            strategy_kind_to_string(spec.kind), spec.full_name(),
            info->is_primary_key ? kPrimaryKeyReason : kUniqueReason,
            strategy_kind_to_string(suggest_strategy(spec.table, spec.column))));
    }
}

void ConstraintValidator::ensure_valid(const ValidationReport& report) {
    if (report.ok()) return;
    throw ConfigurationError(std::format(
        "Anonymization config has {} constraint violation(s):\n{}", report.size(), report.to_string()));
}

} // namespace pdpl
