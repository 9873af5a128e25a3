#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace pdpl {

class ConstraintCache;

/**
 * @brief Summary of what a column's constraints allow
 */
struct ColumnConstraints {
    bool not_null = false;
    bool unique = false;
    std::vector<StrategyKind> allowed_strategies;
};

/**
 * @brief Recommended strategy for a column no ColumnSpec covers yet
 */
struct ColumnSuggestion {
    std::string column;
    StrategyKind strategy = StrategyKind::HASH;
    ColumnConstraints constraints;
};

/**
 * @brief Decides which strategies a column's schema constraints allow
 *
 * Rules, first match wins:
 * 1. Protected identifier column → rejected, no suggestion
 * 2. DELETE on a NOT NULL column → invalid, suggest HASH
 * 3. Non-HASH on a UNIQUE / primary key column → invalid, suggest HASH
 * 4. Valid
 *
 * Dot-path columns ("preferences.email") address a field inside a JSON
 * column and skip rules 2-3: any of HASH, MASK, DELETE, KEEP is legal.
 * Columns the catalog does not know carry no constraints.
 *
 * Rule evaluation is pure; the only shared state is the ConstraintCache.
 */
class ConstraintValidator {
public:
    static constexpr const char* kDefaultProtectedColumn = "id";

    explicit ConstraintValidator(const ConstraintCache& cache,
                                 std::vector<std::string> protected_columns = {kDefaultProtectedColumn});

    /**
     * @brief Check one column
     * @return The violation, or nullopt if the strategy is legal
     */
    [[nodiscard]] std::optional<ValidationIssue> check(const ColumnSpec& spec) const;

    // Every column's outcome, in input order; never stops at the first failure
    [[nodiscard]] ValidationReport validate(const std::vector<ColumnSpec>& specs) const;

    [[nodiscard]] std::vector<StrategyKind> allowed_strategies(const std::string& table,
                                                               const std::string& column) const;

    // Conservative default for any column
    [[nodiscard]] static StrategyKind suggest_strategy(const std::string& table,
                                                       const std::string& column);

    [[nodiscard]] ColumnConstraints column_constraints(const std::string& table,
                                                       const std::string& column) const;

    /**
     * @brief Suggestions for columns of table that configured leaves out
     *
     * Protected and bookkeeping columns (id, created_at, updated_at,
     * organization_id) are never listed, nor are columns covered by a spec
     * for the same table, including through a dot-path. Sorted by column
     * name; empty for unknown tables.
     */
    [[nodiscard]] std::vector<ColumnSuggestion> suggest_unconfigured(
        const std::string& table, const std::vector<ColumnSpec>& configured) const;

    /**
     * @brief Strict single-column check
     * @throws ModelNotFoundError unknown table
     * @throws DataNotFoundError unknown column
     * @throws ConfigurationError protected identifier
     * @throws NotNullConstraintError DELETE on a NOT NULL column
     * @throws ConstraintError any other incompatibility
     */
    void enforce(const ColumnSpec& spec) const;

    // @throws ConfigurationError listing every violation if report is not ok
    static void ensure_valid(const ValidationReport& report);

    [[nodiscard]] bool is_protected(const std::string& column) const;

private:
    const ConstraintCache& cache_;
    std::unordered_set<std::string> protected_columns_;    // lowercase
};

} // namespace pdpl
