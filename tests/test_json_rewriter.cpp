#include <catch2/catch_test_macros.hpp>
#include "core/json_rewriter.hpp"
#include "core/hasher.hpp"
#include "core/path_resolver.hpp"

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace pdpl;

namespace {

std::string nested_arrays(size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

JsonConfig make_config(std::initializer_list<std::pair<const char*, StrategyKind>> rules) {
    JsonConfig config;
    for (const auto& [path, kind] : rules) {
        config.add(FieldStrategy(path, kind));
    }
    return config;
}

} // anonymous namespace

// ============================================================================
// Dot-paths
// ============================================================================

TEST_CASE("JsonRewriter: dot-path masks only the targeted value", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"options.user_email", StrategyKind::MASK}});

    const auto out = rewriter.rewrite(
        json::parse(R"({"options":{"user_email":"a@b.com","x":1}})"), config);

    CHECK(PathResolver::get(out, "options.user_email")->get<std::string>() == "a@***om");
    const auto* x = PathResolver::get(out, "options.x");
    REQUIRE(x != nullptr);
    CHECK(x->get<double>() == 1.0);
}

TEST_CASE("JsonRewriter: dot-path into an empty array is a no-op", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"employees.0.email", StrategyKind::HASH}});

    const std::string input = R"({"company":"Acme","employees":[]})";
    const auto out = rewriter.rewrite(json::parse(input), config);
    CHECK(json::dump(out) == input);
}

TEST_CASE("JsonRewriter: dot-path resolves only from the root", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"user.email", StrategyKind::DELETE}});

    const auto out = rewriter.rewrite(
        json::parse(R"({"inner":{"user":{"email":"deep"}},"user":{"email":"top"}})"), config);
    CHECK(json::dump(out) == R"({"inner":{"user":{"email":"deep"}},"user":{"email":null}})");
}

TEST_CASE("JsonRewriter: dot-path with array index on an array root", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"1.name", StrategyKind::DELETE}});

    const auto out = rewriter.rewrite(json::parse(R"([{"name":"a"},{"name":"b"}])"), config);
    CHECK(json::dump(out) == R"([{"name":"a"},{"name":null}])");
}

TEST_CASE("JsonRewriter: deleted ancestor makes descendant paths unresolved", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({
        {"profile.contact.email", StrategyKind::MASK},
        {"profile.contact", StrategyKind::DELETE},
    });

    const auto out = rewriter.rewrite(
        json::parse(R"({"profile":{"contact":{"email":"someone@example.com"},"name":"N"}})"), config);
    CHECK(json::dump(out) == R"({"profile":{"contact":null,"name":"N"}})");
}

// ============================================================================
// Structural rules
// ============================================================================

TEST_CASE("JsonRewriter: bare key fires at every depth", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"email", StrategyKind::HASH}});

    const auto out = rewriter.rewrite(json::parse(R"({
        "email": "a@x.com",
        "team": {"email": "b@x.com", "members": [{"email": "c@x.com"}, {"name": "d"}]}
    })"), config);

    CHECK(PathResolver::get(out, "email")->get<std::string>() == *hasher.digest("a@x.com"));
    CHECK(PathResolver::get(out, "team.email")->get<std::string>() == *hasher.digest("b@x.com"));
    CHECK(PathResolver::get(out, "team.members.0.email")->get<std::string>() == *hasher.digest("c@x.com"));
    CHECK(PathResolver::get(out, "team.members.1.name")->get<std::string>() == "d");
}

TEST_CASE("JsonRewriter: bare key on an array value hashes element-wise", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"phones", StrategyKind::HASH}});

    const auto out = rewriter.rewrite(json::parse(R"({"phones":["111","222"]})"), config);
    const auto* phones = PathResolver::get(out, "phones");
    REQUIRE(phones != nullptr);
    REQUIRE(phones->is_array());
    CHECK(phones->get<json::array_t>()[0].get<std::string>() == *hasher.digest("111"));
    CHECK(phones->get<json::array_t>()[1].get<std::string>() == *hasher.digest("222"));
}

TEST_CASE("JsonRewriter: dot-path runs before a bare key on the same location", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({
        {"user.email", StrategyKind::MASK},
        {"email", StrategyKind::HASH},
    });

    const auto out = rewriter.rewrite(json::parse(R"({"user":{"email":"someone@example.com"}})"), config);

    // Mask first, then the bare-key hash over the masked text
    const std::string masked = "so***************om";
    CHECK(PathResolver::get(out, "user.email")->get<std::string>() == *hasher.digest(masked));
}

TEST_CASE("JsonRewriter: nested scope does not inherit parent rules", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);

    auto sub = std::make_shared<JsonConfig>();
    sub->add(FieldStrategy("street", StrategyKind::DELETE));

    JsonConfig config;
    config.add(FieldStrategy("city", StrategyKind::DELETE));
    FieldStrategy address("address", StrategyKind::NESTED);
    address.sub_strategies = sub;
    config.add(std::move(address));

    const auto out = rewriter.rewrite(json::parse(R"({
        "address": {"city": "Jeddah", "street": "Tahlia"},
        "city": "Riyadh",
        "street": "Olaya"
    })"), config);

    CHECK(json::dump(out) ==
          R"({"address":{"city":"Jeddah","street":null},"city":null,"street":"Olaya"})");
}

TEST_CASE("JsonRewriter: empty config returns the document unchanged", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const std::string input = R"({"a":[{"b":"c"}],"d":null,"e":true})";
    CHECK(json::dump(rewriter.rewrite(json::parse(input), JsonConfig{})) == input);
}

TEST_CASE("JsonRewriter: rooted bare key fires only at the top level", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    JsonConfig config;
    config.add_rooted(FieldStrategy("email", StrategyKind::DELETE));

    const auto out = rewriter.rewrite(
        json::parse(R"({"email":"a","contacts":[{"email":"b"}],"team":{"email":"c"}})"), config);
    CHECK(json::dump(out) == R"({"email":null,"contacts":[{"email":"b"}],"team":{"email":"c"}})");
    CHECK(config.structural().empty());
}

TEST_CASE("JsonRewriter: untouched leaves keep their encoding and key order", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"x", StrategyKind::HASH}});

    const std::string big = R"({"z":9007199254740993,"a":1})";
    CHECK(rewriter.rewrite_text(big, config) == big);

    const std::string mixed = R"({"b":[-18446744073709551,18446744073709551615],"a":{"y":true,"x":null}})";
    CHECK(rewriter.rewrite_text(mixed, config) == mixed);
}

TEST_CASE("JsonRewriter: replaced values stay in place", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"ssn", StrategyKind::DELETE}, {"meta.tag", StrategyKind::DELETE}});

    const auto out = rewriter.rewrite_text(R"({"z":1,"ssn":"1","meta":{"tag":"t","id":2},"a":3})", config);
    CHECK(out == R"({"z":1,"ssn":null,"meta":{"tag":null,"id":2},"a":3})");
}

// ============================================================================
// Text entry point and fail-soft fallbacks
// ============================================================================

TEST_CASE("JsonRewriter: rewrite_text serializes the rewritten document", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"ssn", StrategyKind::DELETE}});

    const auto out = rewriter.rewrite_text(R"({"name":"N","ssn":"123-45-6789"})", config);
    REQUIRE(out.has_value());
    CHECK(*out == R"({"name":"N","ssn":null})");
}

TEST_CASE("JsonRewriter: malformed text becomes one digest", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({{"email", StrategyKind::MASK}});

    const std::string broken = R"({"email": "a@b.com", )";
    std::optional<std::string> out;
    REQUIRE_NOTHROW(out = rewriter.rewrite_text(broken, config));
    REQUIRE(out.has_value());
    CHECK(*out == *hasher.digest(broken));
}

TEST_CASE("JsonRewriter: blank text yields nullopt", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    CHECK_FALSE(rewriter.rewrite_text("", JsonConfig{}).has_value());
    CHECK_FALSE(rewriter.rewrite_text("  \n", JsonConfig{}).has_value());
}

TEST_CASE("JsonRewriter: text nested beyond max_depth becomes one digest", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher, RewriteOptions{16});

    const std::string deep = nested_arrays(10000);
    const auto out = rewriter.rewrite_text(deep, make_config({{"x", StrategyKind::HASH}}));
    REQUIRE(out.has_value());
    CHECK(*out == *hasher.digest(deep));

    // Right at the limit is still rewritten normally
    const std::string at_limit = nested_arrays(16);
    CHECK(rewriter.rewrite_text(at_limit, JsonConfig{}) == at_limit);
}

TEST_CASE("JsonRewriter: parsed document nested beyond max_depth becomes one digest", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher, RewriteOptions{8});

    const std::string text = nested_arrays(12);
    const auto out = rewriter.rewrite(json::parse(text), JsonConfig{});
    REQUIRE(out.is_string());
    CHECK(out.get<std::string>() == *hasher.digest(text));
}

TEST_CASE("JsonRewriter: built tree of any depth becomes one digest", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher, RewriteOptions{8});

    constexpr size_t kDepth = 50000;
    json::Json deep = json::make_array();
    for (size_t i = 1; i < kDepth; ++i) {
        json::Json outer = json::make_array();
        outer.push_back(std::move(deep));
        deep = std::move(outer);
    }

    const auto out = rewriter.rewrite(std::move(deep), JsonConfig{});
    REQUIRE(out.is_string());
    CHECK(out.get<std::string>() == *hasher.digest(nested_arrays(kDepth)));
}

TEST_CASE("JsonRewriter: brackets inside strings do not count as nesting", "[rewriter]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher, RewriteOptions{2});

    const std::string text = R"({"note":"[[[[[[{{{{"})";
    CHECK(rewriter.rewrite_text(text, JsonConfig{}) == text);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("JsonRewriter: concurrent rewrites share one instance", "[rewriter][concurrency]") {
    const DeterministicHasher hasher("rw");
    const JsonRewriter rewriter(hasher);
    const auto config = make_config({
        {"email", StrategyKind::HASH},
        {"profile.phone", StrategyKind::MASK},
    });

    const std::string input =
        R"({"email":"a@b.com","list":[{"email":"c@d.com"}],"profile":{"phone":"0551234567"}})";
    const auto expected = rewriter.rewrite_text(input, config);
    REQUIRE(expected.has_value());

    std::vector<int> mismatches(8, 0);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < mismatches.size(); ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 100; ++i) {
                if (rewriter.rewrite_text(input, config) != expected) ++mismatches[t];
            }
        });
    }
    for (auto& th : threads) th.join();

    for (const int m : mismatches) {
        CHECK(m == 0);
    }
}
