#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pdpl {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";     // info | warn | error
};

struct HashingConfig {
    std::string salt;
    std::string namespace_uuid = "5b2d9f3e-8c1a-4f6e-9d2b-7a4c3e1f0b6d";
};

struct RewriteConfig {
    int64_t max_depth = 64;
};

struct ProcessingConfig {
    int64_t batch_size = 10000;
    bool dry_run = false;
    std::optional<int64_t> organization_id;     // Scopes reads and table deletes when set
};

/**
 * @brief Whole-table action: delete every row of the configured organization
 */
struct TableAction {
    std::string table;
    std::string reason;
    std::string team;
};

struct ValidationConfig {
    std::vector<std::string> protected_columns = {"id"};
};

// ============================================================================
// EngineConfig - Complete parsed configuration
// ============================================================================

struct EngineConfig {
    LoggingConfig logging;
    HashingConfig hashing;
    RewriteConfig rewrite;
    ProcessingConfig processing;
    ValidationConfig validation;
    std::vector<ColumnSpec> columns;
    std::vector<TableAction> table_actions;
};

} // namespace pdpl
