#include <catch2/catch.hpp>
#include <cstdint>
#include <limits>
#include <vt/coerce.h>
#include <vt/veritas.hpp>

using namespace vt;

TEST_CASE("string coercion", "[coerce]") {
    REQUIRE(coerce_to_string(Value(12)).value() == Value("12"));
    REQUIRE(coerce_to_string(Value(false)).value() == Value("false"));
    REQUIRE(coerce_to_string(Value(2.5)).value() == Value("2.5"));
    REQUIRE(coerce_to_string(Value(0.1)).value() == Value("0.1"));
    REQUIRE_FALSE(coerce_to_string(Value::array()).has_value());
    REQUIRE_FALSE(coerce_to_string(Value()).has_value());
}

TEST_CASE("integer coercion", "[coerce]") {
    REQUIRE(coerce_to_int(Value(" 42 ")).value() == Value(42));
    REQUIRE(coerce_to_int(Value(-7)).value() == Value(-7));
    REQUIRE(coerce_to_int(Value(3.0)).value() == Value(3));
    REQUIRE(coerce_to_int(Value(true)).value() == Value(1));
    REQUIRE_FALSE(coerce_to_int(Value(3.5)).has_value());
    REQUIRE_FALSE(coerce_to_int(Value("")).has_value());
    REQUIRE_FALSE(coerce_to_int(Value("12abc")).has_value());
    REQUIRE_FALSE(coerce_to_int(Value("99999999999999999999")).has_value());
}

TEST_CASE("doubles outside the integer range do not coerce", "[coerce]") {
    REQUIRE_FALSE(coerce_to_int(Value(1e20)).has_value());
    REQUIRE_FALSE(coerce_to_int(Value(-1e20)).has_value());
    REQUIRE_FALSE(coerce_to_int(Value(9223372036854775808.0)).has_value());
    REQUIRE_FALSE(coerce_to_int(Value(std::numeric_limits<double>::infinity())).has_value());
    REQUIRE(coerce_to_int(Value(-9223372036854775808.0)).value() ==
            Value(std::numeric_limits<int64_t>::min()));

    auto result = Int().coerce().parse(1e20);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.issues()[0].code == IssueCode::InvalidType);
}

TEST_CASE("coerced doubles keep every digit", "[coerce]") {
    REQUIRE(String().coerce().parse(3.14159265).value() == Value("3.14159265"));
    REQUIRE(String().coerce().parse(0.1 + 0.2).value() == Value("0.30000000000000004"));
}

TEST_CASE("float coercion", "[coerce]") {
    REQUIRE(coerce_to_float(Value("1e3")).value() == Value(1000.0));
    REQUIRE(coerce_to_float(Value(2)).value() == Value(2.0));
    REQUIRE_FALSE(coerce_to_float(Value("pi")).has_value());
}

TEST_CASE("boolean coercion", "[coerce]") {
    REQUIRE(coerce_to_bool(Value("true")).value() == Value(true));
    REQUIRE(coerce_to_bool(Value("0")).value() == Value(false));
    REQUIRE(coerce_to_bool(Value(2)).value() == Value(true));
    REQUIRE_FALSE(coerce_to_bool(Value("yes")).has_value());
}

TEST_CASE("coercion reads through references", "[coerce]") {
    auto result = Int().coerce().parse(Value::ref("5"));
    REQUIRE(result.ok());
    REQUIRE(result.value() == Value(5));
}
