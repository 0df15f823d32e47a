#include <catch2/catch.hpp>
#include <vector>
#include <vt/veritas.hpp>

using namespace vt;

TEST_CASE("the first matching member wins", "[unions]") {
    auto id = Union(Int(), String().coerce());

    REQUIRE(id.parse(5).value() == Value(5));
    REQUIRE(id.parse("abc").value() == Value("abc"));
    // Int fails, the coercing string member takes it
    REQUIRE(id.parse(true).value() == Value("true"));
    REQUIRE(id.memberSchemas().size() == 2);
}

TEST_CASE("a failed union reports every branch", "[unions]") {
    auto id = Union(Int(), String().min(3));
    auto result = id.parse("ab");

    REQUIRE(result.issues().size() == 1);
    auto const& issue = result.issues()[0];
    REQUIRE(issue.code == IssueCode::InvalidUnion);
    REQUIRE(issue.message == "Invalid input");
    REQUIRE(issue.errors.size() == 2);
    REQUIRE(issue.errors[0][0].code == IssueCode::InvalidType);
    REQUIRE(issue.errors[1][0].code == IssueCode::TooSmall);

    SECTION("nested paths are kept inside branches") {
        auto wrapped = Object({{"id", id}});
        auto nested = wrapped.parse(Value::object({{"id", "ab"}}));
        REQUIRE(to_dot_path(nested.issues()[0].path) == "id");
        REQUIRE(to_dot_path(nested.issues()[0].errors[1][0].path) == "id");
    }
}

TEST_CASE("union members that are absent-tolerant", "[unions][absent]") {
    auto maybe = Union(Int(), String()).optional();
    REQUIRE(maybe.parse(Value()).value().isAbsent());
    REQUIRE(Union(Nil(), Int()).parse(Value()).ok());
    REQUIRE_THROWS_AS(UnionSchema(std::vector<SchemaPtr>{}), SchemaDefinitionError);
}

TEST_CASE("intersections merge both outputs", "[unions][intersection]") {
    auto named = Object({{"name", String()}});
    auto aged = Object({{"age", Int()}});
    auto both = Intersection(named, aged);

    auto result = both.parse(Value::object({{"name", "ada"}, {"age", 36}, {"extra", 1}}));
    REQUIRE(result.ok());
    REQUIRE(result.value() == Value::object({{"name", "ada"}, {"age", 36}}));

    SECTION("failures from both sides are collected") {
        auto failed = both.parse(Value::object());
        REQUIRE(failed.issues().size() == 2);
    }

    SECTION("conflicting outputs cannot be merged") {
        auto one = Int().transform([](const Value&, RefinementContext&) { return Value(1); });
        auto two = Int().transform([](const Value&, RefinementContext&) { return Value(2); });
        auto clash = Intersection(one, two).parse(0);
        REQUIRE(clash.issues().size() == 1);
        REQUIRE(clash.issues()[0].code == IssueCode::Custom);
        REQUIRE(clash.issues()[0].message == "Intersection results could not be merged");
    }

    SECTION("a reference comes back unchanged when nothing was stripped") {
        Value p = Value::ref(Value::object({{"name", "ada"}, {"age", 36}}));
        REQUIRE(both.parse(p).value() == p);
    }
}
