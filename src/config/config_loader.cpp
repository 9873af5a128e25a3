#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/hasher.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace pdpl {

// Constexpr config keys (used 2+ times)
static constexpr std::string_view kStrategy = "strategy";
static constexpr std::string_view kFields   = "fields";
static constexpr std::string_view kPattern  = "pattern";
static constexpr std::string_view kMaskChar = "mask_char";

static constexpr size_t kMinReasonLength = 10;

namespace {

// ============================================================================
// Environment Expansion
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ============================================================================
// Strategy Extraction
// ============================================================================

// context names the owner in error messages, e.g. "users.preferences"
StrategyKind extract_kind(const toml::table& tbl, const std::string& context) {
    const auto name = tbl[kStrategy].value<std::string>();
    if (!name) {
        throw ConfigurationError(std::format("{}: missing 'strategy'", context));
    }
    const auto kind = strategy_kind_from_string(*name);
    if (!kind) {
        throw ConfigurationError(std::format("{}: unknown strategy '{}'", context, *name));
    }
    return *kind;
}

MaskParams extract_mask(const toml::table& tbl, const std::string& context) {
    MaskParams params;
    if (auto pattern = tbl[kPattern].value<std::string>(); pattern && !pattern->empty()) {
        params.pattern = std::move(*pattern);
    }
    if (const auto mask_char = tbl[kMaskChar].value<std::string>()) {
        if (mask_char->size() != 1) {
            throw ConfigurationError(std::format(
                "{}: mask_char must be exactly one character, got '{}'", context, *mask_char));
        }
        params.mask_char = (*mask_char)[0];
    }
    return params;
}

std::shared_ptr<const JsonConfig> extract_fields(const toml::table& fields, const std::string& owner) {
    auto config = std::make_shared<JsonConfig>();

    for (const auto& [key, node] : fields) {
        const std::string path(key.str());
        const std::string context = std::format("{} field '{}'", owner, path);

        const auto* tbl = node.as_table();
        if (!tbl) {
            throw ConfigurationError(std::format("{}: expected a table", context));
        }

        FieldStrategy strategy(path, extract_kind(*tbl, context));
        if (strategy.kind == StrategyKind::JSON) {
            throw ConfigurationError(std::format(
                "{}: 'json' is only valid at column level", context));
        }
        strategy.mask = extract_mask(*tbl, context);

        if (strategy.kind == StrategyKind::NESTED) {
            if (const auto* sub = (*tbl)[kFields].as_table()) {
                strategy.sub_strategies = extract_fields(*sub, context);
            }
        }

        config->add(std::move(strategy));
    }
    return config;
}

// ============================================================================
// Section Extraction
// ============================================================================

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    cfg.level = root["logging"]["level"].value_or(cfg.level);
    return cfg;
}

HashingConfig extract_hashing(const toml::table& root) {
    HashingConfig cfg;
    const auto hashing = root["hashing"];
    cfg.salt = hashing["salt"].value_or(""s);
    cfg.namespace_uuid = hashing["namespace"].value_or(cfg.namespace_uuid);
    return cfg;
}

RewriteConfig extract_rewrite(const toml::table& root) {
    RewriteConfig cfg;
    cfg.max_depth = root["rewrite"]["max_depth"].value_or(cfg.max_depth);
    return cfg;
}

ProcessingConfig extract_processing(const toml::table& root) {
    ProcessingConfig cfg;
    const auto processing = root["processing"];
    cfg.batch_size = processing["batch_size"].value_or(cfg.batch_size);
    cfg.dry_run = processing["dry_run"].value_or(cfg.dry_run);
    cfg.organization_id = processing["organization_id"].value<int64_t>();
    return cfg;
}

ValidationConfig extract_validation(const toml::table& root) {
    ValidationConfig cfg;
    if (const auto* arr = root["validation"]["protected_columns"].as_array()) {
        cfg.protected_columns.clear();
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                cfg.protected_columns.emplace_back(s->get());
            }
        }
    }
    return cfg;
}

std::vector<ColumnSpec> extract_columns(const toml::table& root) {
    std::vector<ColumnSpec> columns;
    const auto* arr = root["columns"].as_array();
    if (!arr) return columns;

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            throw ConfigurationError(std::format("columns[{}]: expected a table", i));
        }

        ColumnSpec spec;
        spec.table = (*tbl)["table"].value_or(""s);
        spec.column = (*tbl)["column"].value_or(""s);
        const std::string context = spec.table.empty() && spec.column.empty()
            ? std::format("columns[{}]", i)
            : spec.full_name();

        spec.kind = extract_kind(*tbl, context);
        if (spec.kind == StrategyKind::NESTED) {
            throw ConfigurationError(std::format(
                "{}: 'nested' is only valid inside fields", context));
        }
        spec.mask = extract_mask(*tbl, context);

        if (spec.kind == StrategyKind::JSON) {
            const auto* fields = (*tbl)[kFields].as_table();
            spec.json = fields ? extract_fields(*fields, context)
                               : std::shared_ptr<const JsonConfig>(std::make_shared<JsonConfig>());
        }

        columns.push_back(std::move(spec));
    }
    return columns;
}

std::vector<TableAction> extract_table_actions(const toml::table& root) {
    std::vector<TableAction> actions;
    const auto* arr = root["table_actions"].as_array();
    if (!arr) return actions;

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            throw ConfigurationError(std::format("table_actions[{}]: expected a table", i));
        }

        TableAction action;
        action.table = (*tbl)["table"].value_or(""s);
        action.reason = (*tbl)["reason"].value_or(""s);
        action.team = (*tbl)["team"].value_or(""s);
        actions.push_back(std::move(action));
    }
    return actions;
}

EngineConfig extract_all_sections(const toml::table& root) {
    EngineConfig config;
    config.logging = extract_logging(root);
    config.hashing = extract_hashing(root);
    config.rewrite = extract_rewrite(root);
    config.processing = extract_processing(root);
    config.validation = extract_validation(root);
    config.columns = extract_columns(root);
    config.table_actions = extract_table_actions(root);
    return config;
}

} // anonymous namespace

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }

    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of info, warn, error, got '{}'", config.logging.level));
    }

    if (utils::is_blank(config.hashing.salt)) {
        errors.push_back("hashing.salt must not be empty");
    }
    if (!DeterministicHasher::parse_uuid(config.hashing.namespace_uuid)) {
        errors.push_back(std::format(
            "hashing.namespace must be a UUID, got '{}'", config.hashing.namespace_uuid));
    }

    if (config.rewrite.max_depth <= 0) {
        errors.push_back(std::format(
            "rewrite.max_depth must be > 0, got {}", config.rewrite.max_depth));
    }
    if (config.processing.batch_size <= 0) {
        errors.push_back(std::format(
            "processing.batch_size must be > 0, got {}", config.processing.batch_size));
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.columns.size(); ++i) {
        const auto& spec = config.columns[i];
        if (spec.table.empty()) {
            errors.push_back(std::format("columns[{}].table must not be empty", i));
        }
        if (spec.column.empty()) {
            errors.push_back(std::format("columns[{}].column must not be empty", i));
        }
        if (!spec.table.empty() && !spec.column.empty() && !seen.insert(spec.full_name()).second) {
            errors.push_back(std::format("columns[{}]: duplicate column {}", i, spec.full_name()));
        }
    }

    if (!config.table_actions.empty() && !config.processing.organization_id) {
        errors.push_back("table_actions require processing.organization_id");
    }
    std::unordered_set<std::string> action_tables;
    for (size_t i = 0; i < config.table_actions.size(); ++i) {
        const auto& action = config.table_actions[i];
        if (action.table.empty()) {
            errors.push_back(std::format("table_actions[{}].table must not be empty", i));
        } else if (!action_tables.insert(action.table).second) {
            errors.push_back(std::format("table_actions[{}]: duplicate table {}", i, action.table));
        }
        if (utils::trim(action.reason).size() < kMinReasonLength) {
            errors.push_back(std::format(
                "table_actions[{}].reason must be at least {} characters", i, kMinReasonLength));
        }
    }

    return errors;
}

} // namespace pdpl
