#include <catch2/catch_test_macros.hpp>
#include "core/column_anonymizer.hpp"
#include "core/hasher.hpp"
#include "core/json_rewriter.hpp"

#include <memory>
#include <string>

using namespace pdpl;

namespace {

struct AnonymizerFixture {
    DeterministicHasher hasher{"column-salt"};
    JsonRewriter rewriter{hasher};
    ColumnAnonymizer anonymizer{hasher, rewriter};

    std::optional<std::string> run(StrategyKind kind, std::string_view raw) const {
        ColumnSpec spec;
        spec.table = "users";
        spec.column = "field";
        spec.kind = kind;
        return anonymizer.anonymize(spec, raw);
    }
};

} // anonymous namespace

// ============================================================================
// Plain columns
// ============================================================================

TEST_CASE("ColumnAnonymizer: DELETE always yields the deletion marker", "[column]") {
    const AnonymizerFixture f;
    CHECK_FALSE(f.run(StrategyKind::DELETE, "someone@example.com").has_value());
    CHECK_FALSE(f.run(StrategyKind::DELETE, "").has_value());
}

TEST_CASE("ColumnAnonymizer: HASH yields the namespace UUID of the trimmed value", "[column]") {
    const AnonymizerFixture f;
    const auto out = f.run(StrategyKind::HASH, "  someone@example.com ");
    REQUIRE(out.has_value());
    CHECK(out->starts_with("UUID5_"));
    CHECK(out == f.hasher.name_uuid("someone@example.com"));
    CHECK(out == f.run(StrategyKind::HASH, "someone@example.com"));
}

TEST_CASE("ColumnAnonymizer: blank values become the deletion marker", "[column]") {
    const AnonymizerFixture f;
    for (const auto kind : {StrategyKind::HASH, StrategyKind::MASK, StrategyKind::JSON}) {
        CHECK_FALSE(f.run(kind, "").has_value());
        CHECK_FALSE(f.run(kind, " \t\n").has_value());
    }
}

TEST_CASE("ColumnAnonymizer: MASK uses the column's mask parameters", "[column]") {
    const AnonymizerFixture f;
    CHECK(f.run(StrategyKind::MASK, "0551234567") == "05******67");

    ColumnSpec spec;
    spec.table = "users";
    spec.column = "email";
    spec.kind = StrategyKind::MASK;
    spec.mask.pattern = "{first_2}***@{last_4}";
    CHECK(f.anonymizer.anonymize(spec, "john.doe@company.com") == "jo***@.com");
}

TEST_CASE("ColumnAnonymizer: KEEP returns the raw value", "[column]") {
    const AnonymizerFixture f;
    CHECK(f.run(StrategyKind::KEEP, "  as is ") == "  as is ");
}

TEST_CASE("ColumnAnonymizer: NESTED at column level falls back to HASH", "[column]") {
    const AnonymizerFixture f;
    CHECK(f.run(StrategyKind::NESTED, "value") == f.hasher.name_uuid("value"));
}

// ============================================================================
// JSON columns
// ============================================================================

TEST_CASE("ColumnAnonymizer: JSON rewrites the document with the column's rules", "[column]") {
    const AnonymizerFixture f;
    auto json = std::make_shared<JsonConfig>();
    json->add(FieldStrategy("ssn", StrategyKind::DELETE));

    ColumnSpec spec;
    spec.table = "users";
    spec.column = "preferences";
    spec.kind = StrategyKind::JSON;
    spec.json = json;

    CHECK(f.anonymizer.anonymize(spec, R"({"ssn":"1","n":12})") == R"({"ssn":null,"n":12})");
    CHECK(f.anonymizer.anonymize(spec, "not json") == f.hasher.digest("not json"));
}

TEST_CASE("ColumnAnonymizer: JSON without rules leaves the document as is", "[column]") {
    const AnonymizerFixture f;
    const std::string doc = R"({"b":1,"a":[true,null]})";
    CHECK(f.run(StrategyKind::JSON, doc) == doc);
}
