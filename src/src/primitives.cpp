#include "vt/primitives.h"

#include <algorithm>
#include <cmath>

#include "vt/coerce.h"
#include "vt/engine.h"

namespace vt {

StringSchema::StringSchema() { m_internals.kind = TypeKind::String; }

void StringSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "string";
    hooks.accepts = [](const Value& v) { return v.isString(); };
    hooks.coerce = coerce_to_string;
    parse_with(*this, hooks, payload);
}

IntSchema::IntSchema() { m_internals.kind = TypeKind::Integer; }

void IntSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "integer";
    hooks.accepts = [](const Value& v) { return v.isInt(); };
    hooks.coerce = coerce_to_int;
    parse_with(*this, hooks, payload);
}

FloatSchema::FloatSchema() { m_internals.kind = TypeKind::Float; }

void FloatSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "number";
    hooks.accepts = [](const Value& v) { return v.isInt() || (v.isDouble() && !std::isnan(v.asDouble())); };
    hooks.coerce = coerce_to_float;
    parse_with(*this, hooks, payload);
}

BoolSchema::BoolSchema() { m_internals.kind = TypeKind::Bool; }

void BoolSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "boolean";
    hooks.accepts = [](const Value& v) { return v.isBool(); };
    hooks.coerce = coerce_to_bool;
    parse_with(*this, hooks, payload);
}

NilSchema::NilSchema() { m_internals.kind = TypeKind::Nil; }

void NilSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "null";
    hooks.accepts = [](const Value& v) { return v.isNull(); };
    parse_with(*this, hooks, payload);
}

AnySchema::AnySchema(TypeKind kind) { m_internals.kind = kind; }

void AnySchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = to_string(m_internals.kind);
    hooks.accepts = [](const Value&) { return true; };
    parse_with(*this, hooks, payload);
}

NeverSchema::NeverSchema() { m_internals.kind = TypeKind::Never; }

void NeverSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "never";
    hooks.accepts = [](const Value&) { return false; };
    parse_with(*this, hooks, payload);
}

static RawIssue invalid_value(const Value& input, const std::vector<Value>& legal) {
    RawIssue issue;
    issue.code = IssueCode::InvalidValue;
    issue.input = input;
    issue.properties["values"] = Value::array(legal);
    return issue;
}

LiteralSchema::LiteralSchema(std::vector<Value> values) {
    if (values.empty()) throw SchemaDefinitionError("literal schema needs at least one value");
    m_internals.kind = TypeKind::Literal;
    m_internals.values = std::move(values);
}

void LiteralSchema::run(ParsePayload& payload) const {
    const std::vector<Value>& legal = m_internals.values;
    ParseHooks hooks;
    hooks.expected = "literal";
    hooks.accepts = [&legal](const Value& v) { return std::find(legal.begin(), legal.end(), v) != legal.end(); };
    hooks.mismatch = [&legal](const Value& v) { return invalid_value(v, legal); };
    parse_with(*this, hooks, payload);
}

EnumSchema::EnumSchema(std::vector<std::string> options) {
    if (options.empty()) throw SchemaDefinitionError("enum schema needs at least one option");
    m_internals.kind = TypeKind::Enum;
    for (auto& option : options) m_internals.values.push_back(Value(std::move(option)));
}

void EnumSchema::run(ParsePayload& payload) const {
    const std::vector<Value>& legal = m_internals.values;
    ParseHooks hooks;
    hooks.expected = "string";
    hooks.accepts = [&legal](const Value& v) {
        return v.isString() && std::find(legal.begin(), legal.end(), v) != legal.end();
    };
    hooks.mismatch = [&legal](const Value& v) { return invalid_value(v, legal); };
    parse_with(*this, hooks, payload);
}

std::vector<std::string> EnumSchema::options() const {
    std::vector<std::string> out;
    for (auto const& v : m_internals.values) out.push_back(v.asString());
    return out;
}

EnumSchema EnumSchema::extract(const std::vector<std::string>& keep) const {
    std::vector<std::string> have = options();
    for (auto const& k : keep) {
        if (std::find(have.begin(), have.end(), k) == have.end())
            throw SchemaDefinitionError("enum has no option \"" + k + "\"");
    }
    return withInternals([&keep](TypeInternals& in) {
        in.values.clear();
        for (auto const& k : keep) in.values.push_back(Value(k));
    });
}

EnumSchema EnumSchema::exclude(const std::vector<std::string>& drop) const {
    std::vector<std::string> have = options();
    std::vector<std::string> keep;
    for (auto const& option : have) {
        if (std::find(drop.begin(), drop.end(), option) == drop.end()) keep.push_back(option);
    }
    for (auto const& d : drop) {
        if (std::find(have.begin(), have.end(), d) == have.end())
            throw SchemaDefinitionError("enum has no option \"" + d + "\"");
    }
    if (keep.empty()) throw SchemaDefinitionError("excluding every option leaves an empty enum");
    return extract(keep);
}

}  // namespace vt
