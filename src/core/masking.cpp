#include "core/masking.hpp"
#include "core/utils.hpp"

#include <limits>
#include <optional>
#include <vector>

namespace pdpl {

static constexpr std::string_view kFirstToken = "first_";
static constexpr std::string_view kLastToken = "last_";

namespace {

struct PatternToken {
    bool from_end = false;
    size_t count = 0;
    size_t end = 0;         // Offset just past the closing brace
};

// Matches "{first_N}" / "{last_N}" starting at pattern[open] == '{'
std::optional<PatternToken> match_token(std::string_view pattern, size_t open) {
    std::string_view rest = pattern.substr(open + 1);

    PatternToken token;
    if (rest.starts_with(kFirstToken)) {
        rest.remove_prefix(kFirstToken.size());
    } else if (rest.starts_with(kLastToken)) {
        token.from_end = true;
        rest.remove_prefix(kLastToken.size());
    } else {
        return std::nullopt;
    }

    const size_t close = rest.find('}');
    if (close == std::string_view::npos) return std::nullopt;

    const std::string_view digits = rest.substr(0, close);
    if (!utils::is_all_digits(digits)) return std::nullopt;

    token.count = utils::try_parse_int<size_t>(digits)
        .value_or(std::numeric_limits<size_t>::max());
    token.end = static_cast<size_t>(rest.data() - pattern.data()) + close + 1;
    return token;
}

// Byte offset of the code point at char_index (value.size() past the end)
size_t byte_offset(std::string_view value, const std::vector<std::string_view>& chars,
                   size_t char_index) {
    if (char_index >= chars.size()) return value.size();
    return static_cast<size_t>(chars[char_index].data() - value.data());
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

std::string MaskPatternCompiler::mask(std::string_view value, const MaskParams& params) {
    if (params.pattern && !params.pattern->empty()) {
        return render_pattern(value, *params.pattern);
    }
    return default_mask(value, params.mask_char);
}

std::string MaskPatternCompiler::default_mask(std::string_view value, char mask_char) {
    const auto chars = utils::utf8_chars(value);
    const size_t len = chars.size();

    if (len < kMinMaskableLength) {
        return std::string(value);
    }

    const size_t middle = len - kVisiblePrefix - kVisibleSuffix;
    const size_t prefix_end = byte_offset(value, chars, kVisiblePrefix);
    const size_t suffix_start = byte_offset(value, chars, len - kVisibleSuffix);

    std::string result;
    result.reserve(prefix_end + middle + (value.size() - suffix_start));
    result.append(value.substr(0, prefix_end));
    result.append(middle, mask_char);
    result.append(value.substr(suffix_start));
    return result;
}

std::string MaskPatternCompiler::render_pattern(std::string_view value, std::string_view pattern) {
    const auto chars = utils::utf8_chars(value);

    std::string result;
    result.reserve(pattern.size() + value.size());

    size_t i = 0;
    while (i < pattern.size()) {
        if (pattern[i] == '{') {
            if (const auto token = match_token(pattern, i)) {
                if (chars.size() < token->count) {
                    // Shorter than requested: emit the whole value
                    result.append(value);
                } else if (token->from_end) {
                    result.append(value.substr(byte_offset(value, chars, chars.size() - token->count)));
                } else {
                    result.append(value.substr(0, byte_offset(value, chars, token->count)));
                }
                i = token->end;
                continue;
            }
        }
        result += pattern[i++];
    }
    return result;
}

} // namespace pdpl
