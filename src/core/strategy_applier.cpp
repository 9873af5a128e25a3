#include "core/strategy_applier.hpp"
#include "core/hasher.hpp"
#include "core/json_rewriter.hpp"
#include "core/masking.hpp"

namespace pdpl {

StrategyApplier::StrategyApplier(const DeterministicHasher& hasher, const JsonRewriter& rewriter)
    : hasher_(hasher), rewriter_(rewriter) {}

json::Json StrategyApplier::apply(const json::Json& value, const FieldStrategy& strategy) const {
    switch (strategy.kind) {
        case StrategyKind::DELETE:
            return json::Json{};

        case StrategyKind::HASH:
            return hash_value(value);

        case StrategyKind::MASK:
            return mask_value(value, strategy.mask);

        case StrategyKind::KEEP:
            return value;

        case StrategyKind::NESTED:
            if (json::is_blank(value)) return json::Json{};
            if (!strategy.sub_strategies) return value;
            return rewriter_.rewrite_tree(value, *strategy.sub_strategies);

        case StrategyKind::JSON:
            break;
    }

    // Unrecognized at field level: never leak the raw value
    return hash_value(value);
}

// ============================================================================
// HASH
// ============================================================================

json::Json StrategyApplier::hash_value(const json::Json& value) const {
    if (json::is_blank(value)) return json::Json{};

    if (value.is_array()) {
        json::Json hashed = json::make_array();
        for (const auto& item : value) {
            hashed.push_back(hash_scalar(item));
        }
        return hashed;
    }
    return hash_scalar(value);
}

json::Json StrategyApplier::hash_scalar(const json::Json& value) const {
    if (json::is_blank(value)) return json::Json{};

    const auto hashed = hasher_.digest(json::to_text(value));
    if (!hashed) return json::Json{};
    return json::make_string(*hashed);
}

// ============================================================================
// MASK
// ============================================================================

json::Json StrategyApplier::mask_value(const json::Json& value, const MaskParams& params) {
    if (json::is_blank(value)) return json::Json{};

    if (value.is_array()) {
        json::Json masked = json::make_array();
        for (const auto& item : value) {
            masked.push_back(mask_scalar(item, params));
        }
        return masked;
    }
    return mask_scalar(value, params);
}

json::Json StrategyApplier::mask_scalar(const json::Json& value, const MaskParams& params) {
    if (value.is_null()) return json::Json{};
    return json::make_string(MaskPatternCompiler::mask(json::to_text(value), params));
}

} // namespace pdpl
