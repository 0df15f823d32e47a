#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <vt/veritas.hpp>

using namespace vt;

TEST_CASE("numbers", "[primitives][number]") {
    REQUIRE(Int().parse(-3).ok());
    REQUIRE_FALSE(Int().parse(1.5).ok());
    REQUIRE(Float().parse(1.5).ok());
    REQUIRE_FALSE(Float().parse(std::numeric_limits<double>::quiet_NaN()).ok());
    REQUIRE_FALSE(Float().parse("1.5").ok());
    REQUIRE(Int().kind() == TypeKind::Integer);
    REQUIRE(Float().kind() == TypeKind::Float);
}

TEST_CASE("booleans and strings", "[primitives]") {
    REQUIRE(Bool().parse(true).ok());
    REQUIRE(Bool().parse(1).issues()[0].message == "Invalid input: expected boolean, received integer");
    REQUIRE(String().nonempty().parse("a").ok());
    REQUIRE_FALSE(String().nonempty().parse("").ok());
}

TEST_CASE("literals", "[primitives][literal]") {
    auto yes = Literal(true);
    REQUIRE(yes.parse(true).ok());
    REQUIRE_FALSE(yes.parse(false).ok());
    REQUIRE(yes.values().size() == 1);

    auto small = Literal(std::vector<Value>{1, 2, 3});
    REQUIRE(small.parse(2).ok());
    REQUIRE(small.parse(4).issues()[0].message == "Invalid option: expected one of 1|2|3");

    REQUIRE_THROWS_AS(Literal(std::vector<Value>{}), SchemaDefinitionError);
}

TEST_CASE("enums", "[primitives][enum]") {
    auto size = Enum({"s", "m", "l"});
    REQUIRE(size.parse("m").ok());
    REQUIRE(size.options() == std::vector<std::string>{"s", "m", "l"});

    auto big = size.exclude({"s"});
    REQUIRE(big.options() == std::vector<std::string>{"m", "l"});
    REQUIRE_FALSE(big.parse("s").ok());

    auto tiny = size.extract({"s"});
    REQUIRE(tiny.parse("s").ok());
    REQUIRE_FALSE(tiny.parse("m").ok());

    REQUIRE_THROWS_AS(size.extract({"xl"}), SchemaDefinitionError);
    REQUIRE_THROWS_AS(size.exclude({"xl"}), SchemaDefinitionError);
    REQUIRE_THROWS_AS((size.exclude({"s", "m", "l"})), SchemaDefinitionError);
    REQUIRE_THROWS_AS(Enum({}), SchemaDefinitionError);

    SECTION("the source enum is unchanged") { REQUIRE(size.options().size() == 3); }
}

TEST_CASE("type kind names", "[primitives]") {
    REQUIRE(to_string(TypeKind::String) == "string");
    REQUIRE(to_string(TypeKind::DiscriminatedUnion) == "discriminated_union");
}
