#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pdpl {

// ============================================================================
// Strategy Kinds
// ============================================================================

/**
 * @brief Closed set of anonymization strategies
 *
 * DELETE/HASH/MASK/KEEP are legal everywhere. NESTED only appears inside a
 * JsonConfig, JSON only at column level.
 */
enum class StrategyKind : uint8_t {
    DELETE,
    HASH,
    MASK,
    KEEP,
    NESTED,
    JSON
};

[[nodiscard]] std::string_view strategy_kind_to_string(StrategyKind kind);

// Case-insensitive; nullopt for unknown names
[[nodiscard]] std::optional<StrategyKind> strategy_kind_from_string(std::string_view name);

// ============================================================================
// Strategy Parameters
// ============================================================================

struct MaskParams {
    std::optional<std::string> pattern;     // e.g. "{first_2}***@{last_4}"
    char mask_char = '*';
};

class JsonConfig;

/**
 * @brief Strategy for one JSON field, addressed by dot-path or bare key
 */
struct FieldStrategy {
    std::string path;
    StrategyKind kind = StrategyKind::HASH;
    MaskParams mask;
    std::shared_ptr<const JsonConfig> sub_strategies;   // NESTED only, own scope

    FieldStrategy() = default;
    FieldStrategy(std::string p, StrategyKind k) : path(std::move(p)), kind(k) {}

    [[nodiscard]] bool is_dot_path() const {
        return path.find('.') != std::string::npos;
    }
};

/**
 * @brief Mapping path → FieldStrategy for one JSON document
 *
 * Keys containing '.' are dot-paths: resolved once, from the document root.
 * Bare keys are structural rules: applied wherever that key name occurs,
 * unless registered with add_rooted().
 * Dot-paths are kept sorted by segment count so ancestors come before
 * descendants.
 */
class JsonConfig {
public:
    JsonConfig() = default;

    // Replaces any strategy previously registered under the same path
    void add(FieldStrategy strategy);

    /**
     * @brief Register a path resolved from the document root only
     *
     * Same as add() for dot-paths; a bare key registered here fires on the
     * root object's own key instead of at every depth.
     */
    void add_rooted(FieldStrategy strategy);

    [[nodiscard]] const FieldStrategy* find_structural(std::string_view key) const;
    [[nodiscard]] const std::vector<FieldStrategy>& dot_paths() const { return dot_paths_; }
    [[nodiscard]] const std::unordered_map<std::string, FieldStrategy>& structural() const {
        return structural_;
    }

    [[nodiscard]] size_t size() const { return dot_paths_.size() + structural_.size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    std::vector<FieldStrategy> dot_paths_;
    std::unordered_map<std::string, FieldStrategy> structural_;
};

// ============================================================================
// Column-Level Configuration
// ============================================================================

/**
 * @brief Strategy for one database column
 *
 * A column name containing '.' addresses a field inside a JSON column
 * ("preferences.email"); such targets carry no schema constraints of their own.
 */
struct ColumnSpec {
    std::string table;
    std::string column;
    StrategyKind kind = StrategyKind::HASH;
    MaskParams mask;
    std::shared_ptr<const JsonConfig> json;     // JSON only

    [[nodiscard]] bool is_json_path() const {
        return column.find('.') != std::string::npos;
    }

    [[nodiscard]] std::string full_name() const {
        return table + "." + column;
    }
};

// ============================================================================
// Schema Facts
// ============================================================================

struct ConstraintInfo {
    bool nullable = true;
    bool unique = false;
    bool is_primary_key = false;

    // Primary keys are inherently unique
    [[nodiscard]] bool effectively_unique() const { return unique || is_primary_key; }
};

struct ColumnFacts {
    std::string name;
    ConstraintInfo constraints;
};

struct TableFacts {
    std::string name;
    bool exists = false;
    std::unordered_map<std::string, ConstraintInfo> columns;

    [[nodiscard]] const ConstraintInfo* find_column(const std::string& column) const {
        const auto it = columns.find(column);
        return it != columns.end() ? &it->second : nullptr;
    }
};

// ============================================================================
// Validation
// ============================================================================

struct ValidationIssue {
    std::string table;
    std::string column;
    StrategyKind strategy = StrategyKind::HASH;
    std::string reason;
    std::optional<StrategyKind> suggested_strategy;

    // "users.email: <reason>. Suggested: hash"
    [[nodiscard]] std::string to_string() const;
};

struct ValidationReport {
    std::vector<ValidationIssue> issues;

    [[nodiscard]] bool ok() const { return issues.empty(); }
    [[nodiscard]] size_t size() const { return issues.size(); }

    // One line per violation
    [[nodiscard]] std::string to_string() const;
};

} // namespace pdpl
