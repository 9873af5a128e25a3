#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace pdpl {

/**
 * @brief Base class for every error raised by the engine
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Invalid configuration: unknown strategy kind, malformed config,
 * protected column, or a failed validation gate
 */
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Strategy is incompatible with a column's schema constraints
 */
class ConstraintError : public Error {
public:
    using Error::Error;
};

/**
 * @brief DELETE configured on a NOT NULL column
 *
 * Carries the column identity and the strategy that would be legal instead.
 */
class NotNullConstraintError : public ConstraintError {
public:
    NotNullConstraintError(std::string table, std::string column,
                           StrategyKind strategy,
                           std::optional<StrategyKind> suggested = std::nullopt);

    [[nodiscard]] const std::string& table() const { return table_; }
    [[nodiscard]] const std::string& column() const { return column_; }
    [[nodiscard]] StrategyKind strategy() const { return strategy_; }
    [[nodiscard]] std::optional<StrategyKind> suggested_strategy() const { return suggested_; }

private:
    std::string table_;
    std::string column_;
    StrategyKind strategy_;
    std::optional<StrategyKind> suggested_;
};

/**
 * @brief Configured table is unknown to the schema catalog
 */
class ModelNotFoundError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Configured column is unknown to the schema catalog
 */
class DataNotFoundError : public Error {
public:
    using Error::Error;
};

} // namespace pdpl
