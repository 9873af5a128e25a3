#include "core/column_anonymizer.hpp"
#include "core/hasher.hpp"
#include "core/json_rewriter.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"

namespace pdpl {

namespace {

const JsonConfig& empty_json_config() {
    static const JsonConfig kEmpty;
    return kEmpty;
}

} // anonymous namespace

ColumnAnonymizer::ColumnAnonymizer(const DeterministicHasher& hasher, const JsonRewriter& rewriter)
    : hasher_(hasher), rewriter_(rewriter) {}

std::optional<std::string> ColumnAnonymizer::anonymize(const ColumnSpec& spec,
                                                       std::string_view raw) const {
    switch (spec.kind) {
        case StrategyKind::DELETE:
            return std::nullopt;

        case StrategyKind::HASH:
            return hasher_.name_uuid(raw);

        case StrategyKind::MASK:
            if (utils::is_blank(raw)) return std::nullopt;
            return MaskPatternCompiler::mask(raw, spec.mask);

        case StrategyKind::KEEP:
            return std::string(raw);

        case StrategyKind::JSON:
            return rewriter_.rewrite_text(raw, spec.json ? *spec.json : empty_json_config());

        case StrategyKind::NESTED:
            break;
    }

    // NESTED has no column-level meaning; hash rather than pass the value through
    return hasher_.name_uuid(raw);
}

} // namespace pdpl
