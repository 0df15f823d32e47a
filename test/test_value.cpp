#include <catch2/catch.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vt/veritas.hpp>

using namespace vt;

TEST_CASE("Value basic operations", "[value]") {
    Value v;
    REQUIRE(v.isNull());

    v["name"] = "veritas";
    v["count"] = 3;

    REQUIRE(v.isObject());
    REQUIRE(v.size() == 2);
    REQUIRE(v.has("name"));
    REQUIRE_FALSE(v.has("missing"));
    REQUIRE(v.at("count").asInt() == 3);
    REQUIRE(v.at("name").asString() == "veritas");
    REQUIRE(v.keys() == std::vector<std::string>{"count", "name"});
    REQUIRE(v.items().size() == 2);
    REQUIRE_THROWS_AS(v.at("missing"), std::out_of_range);
    REQUIRE_THROWS_AS(v.asArray(), std::logic_error);
}

TEST_CASE("Value type names", "[value]") {
    REQUIRE(Value().typeName() == "null");
    REQUIRE(Value(true).typeName() == "boolean");
    REQUIRE(Value(1).typeName() == "integer");
    REQUIRE(Value(1.5).typeName() == "number");
    REQUIRE(Value("x").typeName() == "string");
    REQUIRE(Value::array().typeName() == "array");
    REQUIRE(Value::object().typeName() == "object");
    REQUIRE(Value::ref(Value("x")).typeName() == "string");
}

TEST_CASE("references compare by identity", "[value][reference]") {
    auto cell = std::make_shared<Value>("x");
    Value a(cell);
    Value b(cell);
    Value c = Value::ref("x");

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a.deref() == c.deref());

    SECTION("chains of references are followed") {
        Value chain = Value::ref(a);
        REQUIRE(chain.deref().asString() == "x");
        REQUIRE(chain.referent()->referent() == cell);
    }
}

TEST_CASE("dump stops at cycles", "[value][reference]") {
    auto node = std::make_shared<Value>(Value::object());
    (*node)["self"] = Value(node);

    REQUIRE(Value(node).dump() == "&{\"self\":<cycle>}");

    // break the ownership cycle
    (*node)["self"] = Value();
}

TEST_CASE("absent placeholders remember their kind", "[value]") {
    Value absent = Value::absent(TypeKind::String);
    REQUIRE(absent.isNull());
    REQUIRE(absent.isAbsent());
    REQUIRE(absent.absentKind().has_value());
    REQUIRE(*absent.absentKind() == TypeKind::String);
    REQUIRE_FALSE(Value().isAbsent());
}

TEST_CASE("value_cast extracts typed views", "[value]") {
    REQUIRE(value_cast<std::string>(Value::ref("hi")) == "hi");
    REQUIRE(value_cast<int64_t>(Value(7)) == 7);
    REQUIRE(value_cast<double>(Value(2)) == 2.0);
    REQUIRE_FALSE(value_cast<std::optional<int64_t>>(Value()).has_value());
    REQUIRE(value_cast<std::optional<int64_t>>(Value(4)).value() == 4);
    REQUIRE_THROWS_AS(value_cast<bool>(Value("no")), std::runtime_error);
}

TEST_CASE("function values can be called", "[value][function]") {
    Value twice = Value::function([](const std::vector<Value>& args) { return Value(args.at(0).asInt() * 2); });
    std::vector<Value> args{21};
    REQUIRE(twice.isFunction());
    REQUIRE(twice.call(args).asInt() == 42);
    REQUIRE(twice == twice);
    REQUIRE_THROWS_AS(Value(1).call(args), std::logic_error);
}

TEST_CASE("doubles dump without losing digits", "[value][dump]") {
    REQUIRE(Value(0.1).dump() == "0.1");
    REQUIRE(Value(2.5).dump() == "2.5");
    REQUIRE(Value(3.14159265).dump() == "3.14159265");
    REQUIRE(Value(1.0000001).dump() != Value(1.0000002).dump());
    REQUIRE(std::stod(Value(0.1 + 0.2).dump()) == 0.1 + 0.2);
}

TEST_CASE("a mutable list element can be replaced by index", "[value]") {
    Value list = Value::array({1, 2});
    list.at(0) = Value("one");
    REQUIRE(list.at(0) == Value("one"));
    REQUIRE(list.at(1) == Value(2));
    REQUIRE_THROWS_AS(list.at(2), std::out_of_range);
}
