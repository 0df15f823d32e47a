#include "vt/schema.h"

#include <cstdlib>
#include <iostream>

#include "vt/engine.h"

namespace vt {

Result<Value> Schema::parse(const Value& input, const ParseContext* ctx) const {
    if (std::getenv("VT_PARSE_DEBUG")) {
        std::cerr << "parse enter: kind=" << to_string(kind()) << " input=" << input.dump() << "\n";
    }
    ParsePayload payload(input);
    run(payload);
    if (payload.issues.empty()) return payload.value;
    if (std::getenv("VT_PARSE_DEBUG")) {
        std::cerr << "parse failed: kind=" << to_string(kind()) << " issues=" << payload.issues.size() << "\n";
    }
    return make_validation_error(payload.issues, ctx);
}

Value Schema::mustParse(const Value& input, const ParseContext* ctx) const { return parse(input, ctx).value(); }

std::vector<Value> legal_values(const Schema& schema) {
    if (!schema.internals().values.empty()) return schema.internals().values;
    if (SchemaPtr inner = schema.unwrapped()) return legal_values(*inner);
    std::vector<Value> out;
    for (auto const& member : schema.memberSchemas()) {
        for (auto const& v : legal_values(*member)) out.push_back(v);
    }
    return out;
}

ErasedSchema::ErasedSchema(SchemaPtr inner) : m_inner(std::move(inner)) {
    if (!m_inner) throw SchemaDefinitionError("erased schema has no target");
    m_internals.kind = m_inner->kind();
    m_internals.optional = m_inner->internals().optional;
    m_internals.nilable = m_inner->internals().nilable;
    m_internals.values = m_inner->internals().values;
}

void ErasedSchema::run(ParsePayload& payload) const {
    size_t before = payload.issues.size();
    m_inner->run(payload);
    if (payload.issues.size() == before) run_own_checks(*this, payload);
}

}  // namespace vt
