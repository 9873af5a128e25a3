#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

namespace pdpl {

class DeterministicHasher;
class JsonRewriter;

/**
 * @brief Applies one FieldStrategy to one resolved JSON value
 *
 * - DELETE:  null, whatever the input
 * - HASH:    blank → null; array → each element hashed on its own;
 *            anything else → "HASH_<digest>" of its textual form
 * - MASK:    blank → null; array → each element masked on its own;
 *            anything else → MaskPatternCompiler output
 * - KEEP:    value unchanged
 * - NESTED:  blank → null; otherwise the rewriter runs on the value with the
 *            strategy's own sub_strategies (no fallback to the parent config)
 * - other:   treated as HASH
 *
 * Stateless; safe to call concurrently.
 */
class StrategyApplier {
public:
    StrategyApplier(const DeterministicHasher& hasher, const JsonRewriter& rewriter);

    [[nodiscard]] json::Json apply(const json::Json& value, const FieldStrategy& strategy) const;

private:
    [[nodiscard]] json::Json hash_value(const json::Json& value) const;
    [[nodiscard]] json::Json hash_scalar(const json::Json& value) const;
    [[nodiscard]] static json::Json mask_value(const json::Json& value, const MaskParams& params);
    [[nodiscard]] static json::Json mask_scalar(const json::Json& value, const MaskParams& params);

    const DeterministicHasher& hasher_;
    const JsonRewriter& rewriter_;
};

} // namespace pdpl
