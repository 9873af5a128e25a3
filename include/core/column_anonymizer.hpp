#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pdpl {

class DeterministicHasher;
class JsonRewriter;

/**
 * @brief Applies a column-level strategy to one raw column value
 *
 * nullopt is the deletion marker: the column is to be set to NULL.
 *
 * - DELETE: nullopt
 * - HASH:   "UUID5_<uuid>" of the trimmed value
 * - MASK:   MaskPatternCompiler output
 * - KEEP:   raw value
 * - JSON:   JsonRewriter over the parsed value with the column's JsonConfig
 *
 * HASH, MASK and JSON map blank values to nullopt.
 */
class ColumnAnonymizer {
public:
    ColumnAnonymizer(const DeterministicHasher& hasher, const JsonRewriter& rewriter);

    [[nodiscard]] std::optional<std::string> anonymize(const ColumnSpec& spec,
                                                       std::string_view raw) const;

private:
    const DeterministicHasher& hasher_;
    const JsonRewriter& rewriter_;
};

} // namespace pdpl
