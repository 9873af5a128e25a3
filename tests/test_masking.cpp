#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"

#include <string>

using namespace pdpl;

// ============================================================================
// MaskPatternCompiler::default_mask tests
// ============================================================================

TEST_CASE("Masking: values of 4 characters or fewer pass through", "[masking]") {
    CHECK(MaskPatternCompiler::default_mask("").empty());
    CHECK(MaskPatternCompiler::default_mask("a") == "a");
    CHECK(MaskPatternCompiler::default_mask("abcd") == "abcd");
}

TEST_CASE("Masking: default keeps 2 characters on each side", "[masking]") {
    CHECK(MaskPatternCompiler::default_mask("abcde") == "ab*de");
    CHECK(MaskPatternCompiler::default_mask("john.doe@company.com") == "jo****************om");
}

TEST_CASE("Masking: default middle length is length minus 4", "[masking]") {
    for (const std::string s : {"12345", "hello world", "0123456789abcdef"}) {
        const auto masked = MaskPatternCompiler::default_mask(s);
        REQUIRE(masked.size() == s.size());
        CHECK(masked.substr(0, 2) == s.substr(0, 2));
        CHECK(masked.substr(s.size() - 2) == s.substr(s.size() - 2));
        CHECK(masked.substr(2, s.size() - 4) == std::string(s.size() - 4, '*'));
    }
}

TEST_CASE("Masking: custom mask_char", "[masking]") {
    CHECK(MaskPatternCompiler::default_mask("secret", '#') == "se##et");
}

TEST_CASE("Masking: lengths count code points", "[masking]") {
    // 5 code points, 10 bytes
    CHECK(MaskPatternCompiler::default_mask("ÄÖÜäö") == "ÄÖ*äö");
    // 4 code points: unchanged even though it is 8 bytes
    CHECK(MaskPatternCompiler::default_mask("ÄÖÜä") == "ÄÖÜä");
}

// ============================================================================
// MaskPatternCompiler::render_pattern tests
// ============================================================================

TEST_CASE("Masking: email pattern keeps prefix, literal and suffix", "[masking]") {
    const std::string input = "john.doe@company.com";
    const auto masked = MaskPatternCompiler::render_pattern(input, "{first_2}***@{last_4}");

    CHECK(masked == "jo***@.com");
    CHECK(masked.starts_with("jo"));
    CHECK(masked.ends_with(input.substr(input.size() - 4)));
    CHECK(masked.find("***@") == 2);
}

TEST_CASE("Masking: token longer than value emits the whole value", "[masking]") {
    CHECK(MaskPatternCompiler::render_pattern("abc", "{first_5}-{last_10}") == "abc-abc");
}

TEST_CASE("Masking: zero-length tokens emit nothing", "[masking]") {
    CHECK(MaskPatternCompiler::render_pattern("abc", "[{first_0}|{last_0}]") == "[|]");
}

TEST_CASE("Masking: unknown braces are copied verbatim", "[masking]") {
    CHECK(MaskPatternCompiler::render_pattern("abcdef", "{middle_2}{first_x}{last_2") ==
          "{middle_2}{first_x}{last_2");
}

TEST_CASE("Masking: pattern tokens respect code points", "[masking]") {
    CHECK(MaskPatternCompiler::render_pattern("Zoë Müller", "{first_3}…{last_3}") == "Zoë…ler");
}

// ============================================================================
// MaskPatternCompiler::mask tests
// ============================================================================

TEST_CASE("Masking: empty pattern falls back to default rule", "[masking]") {
    MaskParams params;
    params.pattern = "";
    params.mask_char = 'x';
    CHECK(MaskPatternCompiler::mask("abcdef", params) == "abxxef");
}

TEST_CASE("Masking: pattern wins over mask_char", "[masking]") {
    MaskParams params;
    params.pattern = "{last_4}";
    params.mask_char = 'x';
    CHECK(MaskPatternCompiler::mask("4111111111111111", params) == "1111");
}
