#include <catch2/catch.hpp>
#include <memory>
#include <vt/veritas.hpp>

using namespace vt;

static SchemaPtr person() {
    static SchemaPtr schema = share(Object({
            {"name", String().min(1)},
            {"friends", Array(Lazy([]() { return person(); }))},
    }));
    return schema;
}

namespace {
// Two people who list each other as friends.
struct Friendship {
    std::shared_ptr<Value> alice = std::make_shared<Value>(Value::object());
    std::shared_ptr<Value> bob = std::make_shared<Value>(Value::object());

    Friendship() {
        (*alice)["name"] = "alice";
        (*bob)["name"] = "bob";
        (*alice)["friends"] = Value::array({Value(bob)});
        (*bob)["friends"] = Value::array({Value(alice)});
    }

    // break the ownership cycle
    ~Friendship() {
        (*alice)["friends"] = Value();
        (*bob)["friends"] = Value();
    }
};
}  // namespace

TEST_CASE("cyclic values terminate", "[circular]") {
    Friendship f;
    Value root(f.alice);

    auto result = person()->parse(root);
    REQUIRE(result.ok());
    REQUIRE(result.value() == root);
    REQUIRE(result.value().referent() == f.alice);
}

TEST_CASE("issues inside a cycle carry the path they were reached by", "[circular]") {
    Friendship f;
    (*f.bob)["name"] = "";

    auto result = person()->parse(Value(f.alice));
    REQUIRE(result.issues().size() == 1);
    REQUIRE(to_dot_path(result.issues()[0].path) == "friends[0].name");
    REQUIRE(result.issues()[0].code == IssueCode::TooSmall);
}

TEST_CASE("a shared node is validated once per schema", "[circular]") {
    int calls = 0;
    SchemaPtr counted = share(Object({{"n", Int()}}).refine([&calls](const Value&) {
        ++calls;
        return true;
    }));
    auto pair = Object({{"left", counted}, {"right", counted}});

    Value shared = Value::ref(Value::object({{"n", 1}}));
    Value input = Value::object({{"left", shared}, {"right", shared}});

    auto result = pair.parse(input);
    REQUIRE(result.ok());
    REQUIRE(calls == 1);
    REQUIRE(result.value().at("left") == shared);
    REQUIRE(result.value().at("right") == shared);
}

TEST_CASE("a shared node converted once is converted everywhere", "[circular]") {
    SECTION("defaults fill in every occurrence") {
        auto items = Array(Object({{"a", Int().withDefault(1)}}));
        Value p = Value::ref(Value::object());

        auto result = items.parse(Value::array({p, p}));
        REQUIRE(result.ok());
        const Value& out = result.value();
        REQUIRE(out.at(0).isReference());
        REQUIRE(out.at(0).deref().at("a") == Value(1));
        REQUIRE(out.at(1).deref().at("a") == Value(1));
        REQUIRE(out.at(0).referent() == out.at(1).referent());
        REQUIRE_FALSE(p.deref().has("a"));
    }

    SECTION("unknown keys are stripped from every occurrence") {
        auto items = Array(Object({{"a", Int()}}));
        Value q = Value::ref(Value::object({{"a", 2}, {"extra", true}}));

        auto result = items.parse(Value::array({q, q}));
        REQUIRE(result.ok());
        const Value& out = result.value();
        REQUIRE_FALSE(out.at(0).deref().has("extra"));
        REQUIRE_FALSE(out.at(1).deref().has("extra"));
        REQUIRE(out.at(1).deref().at("a") == Value(2));
        REQUIRE(q.deref().has("extra"));
    }
}
