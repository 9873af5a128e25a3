#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace pdpl {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML (toml++)
// ============================================================================

/**
 * @brief Loads an engine TOML file into an EngineConfig
 *
 * ${VAR} in any string value expands from the environment before
 * extraction. Strategy names are resolved to StrategyKind here, so an
 * unknown name fails the load instead of surfacing on first use.
 *
 * Never throws: every failure becomes LoadResult::error.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the engine .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on an extracted config
     * @return One message per problem; empty if the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    static LoadResult validate_and_return(EngineConfig config);
};

} // namespace pdpl
