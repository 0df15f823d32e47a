#include <catch2/catch.hpp>
#include <memory>
#include <string>
#include <vt/veritas.hpp>

using namespace vt;

namespace {
// Restores the process-wide configuration when a test case ends.
struct ConfigGuard {
    ~ConfigGuard() { resetConfig(); }
};
}  // namespace

TEST_CASE("message resolution order", "[config][messages]") {
    ConfigGuard guard;
    Config cfg;
    cfg.customError = [](const RawIssue& issue) {
        return issue.code == IssueCode::TooSmall ? std::string("custom: too small") : std::string();
    };
    cfg.localeError = [](const RawIssue&) { return std::string("locale"); };
    setConfig(cfg);

    SECTION("config resolvers apply when nothing closer answers") {
        REQUIRE(String().min(3).parse("a").issues()[0].message == "custom: too small");
        // custom declines, so the locale resolver answers
        REQUIRE(String().parse(1).issues()[0].message == "locale");
    }

    SECTION("the schema's resolver beats the config") {
        auto schema = String().min(3).error("schema says no");
        REQUIRE(schema.parse("a").issues()[0].message == "schema says no");
    }

    SECTION("the call's resolver beats the schema") {
        ParseContext ctx;
        ctx.error = [](const RawIssue&) { return std::string("call says no"); };
        auto schema = String().min(3).error("schema says no");
        REQUIRE(schema.parse("a", ctx).issues()[0].message == "call says no");
    }

    SECTION("a check's own message beats everything") {
        ParseContext ctx;
        ctx.error = [](const RawIssue&) { return std::string("call says no"); };
        CheckParams params;
        params.message = "check says no";
        auto schema = String().min(3, params).error("schema says no");
        REQUIRE(schema.parse("a", ctx).issues()[0].message == "check says no");
    }

    SECTION("an empty answer defers to the next resolver") {
        ParseContext ctx;
        ctx.error = [](const RawIssue&) { return std::string(); };
        auto schema = String().min(3).error([](const RawIssue&) { return std::string(); });
        REQUIRE(schema.parse("a", ctx).issues()[0].message == "custom: too small");
    }
}

TEST_CASE("the English default is the last resort", "[config][messages]") {
    ConfigGuard guard;
    resetConfig();
    REQUIRE_FALSE(config()->customError);
    REQUIRE(String().parse(1).issues()[0].message == "Invalid input: expected string, received integer");
}

TEST_CASE("a context can carry its own configuration", "[config]") {
    ConfigGuard guard;
    Config global;
    global.customError = [](const RawIssue&) { return std::string("global"); };
    setConfig(global);

    auto local = std::make_shared<Config>();
    local->customError = [](const RawIssue&) { return std::string("local"); };
    ParseContext ctx;
    ctx.config = local;

    REQUIRE(Int().parse("x", ctx).issues()[0].message == "local");
    REQUIRE(Int().parse("x").issues()[0].message == "global");
}

TEST_CASE("schema resolvers reach nested issues", "[config][messages]") {
    auto schema = Object({{"age", Int().error("age must be a whole number")}});
    auto result = schema.parse(Value::object({{"age", 1.5}}));
    REQUIRE(result.error().prettify() == "age: age must be a whole number");
}

TEST_CASE("inputs are only reported on request", "[config]") {
    auto plain = Int().parse("x");
    REQUIRE_FALSE(plain.issues()[0].input.has_value());

    ParseContext ctx;
    ctx.reportInput = true;
    auto reported = Int().parse("x", ctx);
    REQUIRE(reported.issues()[0].input.has_value());
    REQUIRE(*reported.issues()[0].input == Value("x"));
}
