#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include <vt/veritas.hpp>

using namespace vt;

static ObjectSchema signup() {
    return Object({{"user", Object({{"name", String().min(2)}, {"age", Int().min(18)}})},
                   {"tags", Array(String())}})
            .refine([](const Value& v) { return v.at("tags").size() < 3; });
}

TEST_CASE("issues keep discovery order and full paths", "[issues]") {
    Value input = Value::object({{"user", Value::object({{"name", "a"}, {"age", 12}})},
                                 {"tags", Value::array({"x", 1, "y"})}});
    auto result = signup().parse(input);

    REQUIRE(result.issues().size() == 4);
    REQUIRE(to_dot_path(result.issues()[0].path) == "user.name");
    REQUIRE(to_dot_path(result.issues()[1].path) == "user.age");
    REQUIRE(to_dot_path(result.issues()[2].path) == "tags[1]");
    REQUIRE(result.issues()[3].path.empty());
    REQUIRE(result.issues()[3].code == IssueCode::Custom);
}

TEST_CASE("prettify and flatten", "[issues]") {
    Value input = Value::object({{"user", Value::object({{"name", "a"}, {"age", 30}})},
                                 {"tags", Value::array({"a", "b", "c"})}});
    auto result = signup().parse(input);
    const ValidationError& error = result.error();

    REQUIRE(error.prettify() ==
            "user.name: Too small: expected string to have >=2 characters; Invalid input");
    REQUIRE(std::string(error.what()) == error.prettify());

    FlattenedError flat = error.flatten();
    REQUIRE(flat.formErrors == std::vector<std::string>{"Invalid input"});
    REQUIRE(flat.fieldErrors.size() == 1);
    REQUIRE(flat.fieldErrors.at("user").size() == 1);

    REQUIRE(ValidationError(std::vector<Issue>{}).prettify() == "Validation failed");
}

TEST_CASE("results", "[issues][result]") {
    auto good = Int().parse(1);
    REQUIRE(good.ok());
    REQUIRE(static_cast<bool>(good));
    REQUIRE_THROWS_AS(good.error(), std::logic_error);

    auto bad = Int().parse("1");
    REQUIRE_FALSE(bad);
    REQUIRE_THROWS_AS(bad.value(), ValidationError);

    SECTION("mustParse throws the same error") {
        REQUIRE(Int().mustParse(3) == Value(3));
        try {
            Int().mustParse("3");
            FAIL("expected a ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.issues()[0].code == IssueCode::InvalidType);
        }
    }
}

TEST_CASE("value-set messages", "[issues][messages]") {
    REQUIRE(Literal("on").parse("off").issues()[0].message == "Invalid input: expected \"on\"");
    REQUIRE(Literal("on").parse("off").issues()[0].code == IssueCode::InvalidValue);

    auto colors = Enum({"red", "green"});
    REQUIRE(colors.parse("blue").issues()[0].message == "Invalid option: expected one of \"red\"|\"green\"");
    // absent input is a type failure, not a bad option
    REQUIRE(colors.parse(Value()).issues()[0].code == IssueCode::InvalidType);
}

TEST_CASE("refinements can report a bad element", "[issues][messages]") {
    auto evens = Array(Int()).superRefine([](const Value& v, RefinementContext& ctx) {
        for (int i = 0; i < static_cast<int>(v.size()); ++i) {
            if (v.at(i).asInt() % 2 == 0) continue;
            RawIssue issue;
            issue.code = IssueCode::InvalidElement;
            issue.properties["origin"] = "array";
            issue.path = {static_cast<int64_t>(i)};
            ctx.addIssue(std::move(issue));
        }
    });

    auto result = evens.parse(Value::array({2, 3, 4}));
    REQUIRE(result.issues().size() == 1);
    REQUIRE(result.issues()[0].code == IssueCode::InvalidElement);
    REQUIRE(result.issues()[0].message == "Invalid value in array");
    REQUIRE(to_dot_path(result.issues()[0].path) == "[1]");
    REQUIRE(to_string(IssueCode::InvalidElement) == "invalid_element");
}

TEST_CASE("issue code names", "[issues]") {
    REQUIRE(to_string(IssueCode::InvalidType) == "invalid_type");
    REQUIRE(to_string(IssueCode::UnrecognizedKeys) == "unrecognized_keys");
    REQUIRE(to_string(IssueCode::NotMultipleOf) == "not_multiple_of");
}
