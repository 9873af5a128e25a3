#include "core/json_rewriter.hpp"
#include "core/hasher.hpp"
#include "core/path_resolver.hpp"
#include "core/utils.hpp"

#include <format>
#include <string>

namespace pdpl {

JsonRewriter::JsonRewriter(const DeterministicHasher& hasher, RewriteOptions options)
    : hasher_(hasher), options_(options), applier_(hasher, *this) {}

// ============================================================================
// Entry points
// ============================================================================

json::Json JsonRewriter::rewrite(json::Json document, const JsonConfig& config) const {
    if (json::depth_exceeds(document, options_.max_depth)) {
        utils::log::warn(std::format(
            "JSON document nests deeper than {} levels, replacing it with a digest",
            options_.max_depth));
        return digest_fallback(json::dump_iterative(document));
    }

    apply_dot_paths(document, config);
    apply_structural(document, config);
    return document;
}

std::optional<std::string> JsonRewriter::rewrite_text(std::string_view text,
                                                      const JsonConfig& config) const {
    if (utils::is_blank(text)) return std::nullopt;

    if (json::nesting_exceeds(text, options_.max_depth)) {
        utils::log::warn(std::format(
            "JSON value nests deeper than {} levels, replacing it with a digest",
            options_.max_depth));
        return hasher_.digest(text);
    }

    auto parsed = json::try_parse(std::string(text));
    if (!parsed) {
        utils::log::warn(std::format(
            "Value is not valid JSON ({} bytes), replacing it with a digest", text.size()));
        return hasher_.digest(text);
    }

    return json::dump(rewrite(std::move(*parsed), config));
}

json::Json JsonRewriter::rewrite_tree(const json::Json& value, const JsonConfig& config) const {
    json::Json copy = value;
    apply_dot_paths(copy, config);
    apply_structural(copy, config);
    return copy;
}

// ============================================================================
// Phase 1: dot-paths
// ============================================================================

void JsonRewriter::apply_dot_paths(json::Json& root, const JsonConfig& config) const {
    for (const auto& strategy : config.dot_paths()) {
        const auto segments = PathResolver::parse(strategy.path);
        const json::Json* found = PathResolver::get(root, segments);
        if (!found) continue;

        json::Json replacement = applier_.apply(*found, strategy);
        PathResolver::set(root, segments, std::move(replacement));
    }
}

// ============================================================================
// Phase 2: structural walk
// ============================================================================

void JsonRewriter::apply_structural(json::Json& node, const JsonConfig& config) const {
    if (config.structural().empty()) return;

    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto& child = it.value();
            if (const auto* strategy = config.find_structural(it.key())) {
                child = applier_.apply(child, *strategy);
            } else if (child.is_object() || child.is_array()) {
                apply_structural(child, config);
            }
        }
    } else if (node.is_array()) {
        for (auto& item : node) {
            if (item.is_object() || item.is_array()) {
                apply_structural(item, config);
            }
        }
    }
}

json::Json JsonRewriter::digest_fallback(std::string_view original) const {
    const auto hashed = hasher_.digest(original);
    if (!hashed) return json::Json{};
    return json::make_string(*hashed);
}

} // namespace pdpl
