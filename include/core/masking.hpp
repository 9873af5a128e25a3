#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace pdpl {

/**
 * @brief Renders masked strings from a template or the default rule
 *
 * Default rule (no pattern):
 * - length <= 4:  value returned unchanged (too short to mask)
 * - otherwise:    first 2 + mask_char x (length - 4) + last 2
 *
 * Pattern tokens:
 * - {first_n}:  first n characters, or the whole value if shorter than n
 * - {last_n}:   last n characters, or the whole value if shorter than n
 * Everything else in the pattern is copied verbatim ("{first_2}***@{last_4}").
 *
 * Lengths count UTF-8 code points, never bytes.
 */
class MaskPatternCompiler {
public:
    static constexpr size_t kMinMaskableLength = 5;
    static constexpr size_t kVisiblePrefix = 2;
    static constexpr size_t kVisibleSuffix = 2;

    /**
     * @brief Mask a single value according to params
     *
     * Uses the pattern when present and non-empty, the default rule otherwise.
     */
    [[nodiscard]] static std::string mask(std::string_view value, const MaskParams& params);

    [[nodiscard]] static std::string default_mask(std::string_view value, char mask_char = '*');

    [[nodiscard]] static std::string render_pattern(std::string_view value, std::string_view pattern);
};

} // namespace pdpl
