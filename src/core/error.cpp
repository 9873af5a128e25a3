#include "core/error.hpp"

#include <format>

namespace pdpl {

namespace {

std::string not_null_message(const std::string& table, const std::string& column,
                             StrategyKind strategy, std::optional<StrategyKind> suggested) {
    std::string msg = std::format(
        "Cannot use '{}' strategy on {}.{}: Column has NOT NULL constraint.",
        strategy_kind_to_string(strategy), table, column);
    if (suggested) {
        msg += std::format(" Suggested strategy: '{}'", strategy_kind_to_string(*suggested));
    }
    return msg;
}

} // anonymous namespace

NotNullConstraintError::NotNullConstraintError(std::string table, std::string column,
                                               StrategyKind strategy,
                                               std::optional<StrategyKind> suggested)
    : ConstraintError(not_null_message(table, column, strategy, suggested)),
      table_(std::move(table)),
      column_(std::move(column)),
      strategy_(strategy),
      suggested_(suggested) {}

} // namespace pdpl
