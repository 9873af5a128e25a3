#include "core/types.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace pdpl {

// ============================================================================
// StrategyKind
// ============================================================================

std::string_view strategy_kind_to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::DELETE: return "delete";
        case StrategyKind::HASH:   return "hash";
        case StrategyKind::MASK:   return "mask";
        case StrategyKind::KEEP:   return "keep";
        case StrategyKind::NESTED: return "nested";
        case StrategyKind::JSON:   return "json";
    }
    return "unknown";
}

std::optional<StrategyKind> strategy_kind_from_string(std::string_view name) {
    static const std::unordered_map<std::string, StrategyKind> lookup = {
        {"delete", StrategyKind::DELETE},
        {"hash",   StrategyKind::HASH},
        {"mask",   StrategyKind::MASK},
        {"keep",   StrategyKind::KEEP},
        {"nested", StrategyKind::NESTED},
        {"json",   StrategyKind::JSON},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(name)));
    if (it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// JsonConfig
// ============================================================================

namespace {

size_t segment_count(const std::string& path) {
    return static_cast<size_t>(std::count(path.begin(), path.end(), '.')) + 1;
}

} // anonymous namespace

void JsonConfig::add(FieldStrategy strategy) {
    if (!strategy.is_dot_path()) {
        auto key = strategy.path;
        structural_.insert_or_assign(std::move(key), std::move(strategy));
        return;
    }
    add_rooted(std::move(strategy));
}

void JsonConfig::add_rooted(FieldStrategy strategy) {
    std::erase_if(dot_paths_, [&](const FieldStrategy& s) { return s.path == strategy.path; });

    // Ancestors (fewer segments) before descendants, then lexicographic
    const auto pos = std::upper_bound(dot_paths_.begin(), dot_paths_.end(), strategy,
        [](const FieldStrategy& a, const FieldStrategy& b) {
            const size_t sa = segment_count(a.path);
            const size_t sb = segment_count(b.path);
            return sa != sb ? sa < sb : a.path < b.path;
        });
    dot_paths_.insert(pos, std::move(strategy));
}

const FieldStrategy* JsonConfig::find_structural(std::string_view key) const {
    const auto it = structural_.find(std::string(key));
    return it != structural_.end() ? &it->second : nullptr;
}

// ============================================================================
// Validation Report
// ============================================================================

std::string ValidationIssue::to_string() const {
    std::string line = std::format("{}.{}: {}", table, column, reason);
    if (suggested_strategy) {
        line += std::format(". Suggested: {}", strategy_kind_to_string(*suggested_strategy));
    }
    return line;
}

std::string ValidationReport::to_string() const {
    std::string out;
    for (const auto& issue : issues) {
        if (!out.empty()) out += '\n';
        out += issue.to_string();
    }
    return out;
}

} // namespace pdpl
