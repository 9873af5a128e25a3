#pragma once

#include "core/json.hpp"
#include "core/strategy_applier.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pdpl {

class DeterministicHasher;

struct RewriteOptions {
    size_t max_depth = 64;     // Containers nested deeper than this are not walked
};

/**
 * @brief Rewrites a JSON document according to a JsonConfig
 *
 * Two phases over the document:
 * 1. Dot-paths, ancestors first: each is resolved once from the root and,
 *    when found, replaced by its strategy's result. A path that no longer
 *    resolves (e.g. an ancestor was deleted) is skipped.
 * 2. Structural walk: every object key with a bare-name rule has its value
 *    replaced; other containers are walked recursively. A bare-name rule
 *    therefore fires at every depth where the key occurs.
 *
 * Fail-soft: text that is not valid JSON, or that nests deeper than
 * max_depth, is replaced as a whole by a tagged digest of the original text.
 *
 * Holds no mutable state; one instance can serve many threads.
 */
class JsonRewriter {
public:
    explicit JsonRewriter(const DeterministicHasher& hasher, RewriteOptions options = {});

    // applier_ keeps a reference to *this
    JsonRewriter(const JsonRewriter&) = delete;
    JsonRewriter& operator=(const JsonRewriter&) = delete;

    /**
     * @brief Rewrite a parsed document
     * @return Rewritten document, or a digest string of the serialized input
     *         if it nests deeper than max_depth. The depth check and that
     *         serialization do not recurse, so any tree is accepted.
     */
    [[nodiscard]] json::Json rewrite(json::Json document, const JsonConfig& config) const;

    /**
     * @brief Rewrite the textual value of a JSON column
     * @return Serialized rewritten document; digest of text if it does not
     *         parse; nullopt if text is blank
     */
    [[nodiscard]] std::optional<std::string> rewrite_text(std::string_view text,
                                                          const JsonConfig& config) const;

    /**
     * @brief Both phases on a copy of value, without the depth pre-check
     *
     * Entry point for NESTED strategies, whose values sit inside a document
     * that has already passed the check.
     */
    [[nodiscard]] json::Json rewrite_tree(const json::Json& value, const JsonConfig& config) const;

    [[nodiscard]] size_t max_depth() const { return options_.max_depth; }

private:
    void apply_dot_paths(json::Json& root, const JsonConfig& config) const;
    void apply_structural(json::Json& node, const JsonConfig& config) const;
    [[nodiscard]] json::Json digest_fallback(std::string_view original) const;

    const DeterministicHasher& hasher_;
    RewriteOptions options_;
    StrategyApplier applier_;
};

} // namespace pdpl
