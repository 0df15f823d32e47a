#include "vt/discriminated_union.h"

#include <cstdlib>
#include <iostream>

#include "vt/engine.h"
#include "vt/unions.h"

namespace vt {

std::vector<Value> discriminator_values(const Schema& schema, const std::string& key) {
    for (auto const& field : schema.shapeFields())
        if (field.name == key) return legal_values(*field.schema);
    if (SchemaPtr inner = schema.unwrapped()) return discriminator_values(*inner, key);
    std::vector<Value> out;
    for (auto const& member : schema.memberSchemas()) {
        for (auto const& v : discriminator_values(*member, key)) out.push_back(v);
    }
    return out;
}

DiscriminatedUnionSchema::DiscriminatedUnionSchema(std::string discriminator, std::vector<SchemaPtr> members)
    : m_discriminator(std::move(discriminator)), m_members(std::move(members)) {
    m_internals.kind = TypeKind::DiscriminatedUnion;
    if (m_members.empty())
        throw SchemaDefinitionError("discriminated union on '" + m_discriminator + "' has no members");
    for (size_t i = 0; i < m_members.size(); ++i) {
        const SchemaPtr& member = m_members[i];
        if (!member) throw SchemaDefinitionError("discriminated union member " + std::to_string(i) + " is null");
        std::vector<Value> values = discriminator_values(*member, m_discriminator);
        if (values.empty()) {
            throw SchemaDefinitionError("discriminated union member " + std::to_string(i) +
                                        " declares no literal value for '" + m_discriminator + "'");
        }
        for (auto const& v : values) {
            std::string key = v.dump();
            if (m_index.count(key)) {
                throw SchemaDefinitionError("duplicate discriminator value " + key + " for '" + m_discriminator +
                                            "'");
            }
            m_index[key] = m_entries.size();
            m_entries.emplace_back(v, member);
        }
    }
    if (std::getenv("VT_PARSE_DEBUG")) {
        std::cerr << "discriminated union on '" << m_discriminator << "': " << m_entries.size()
                  << " value(s) over " << m_members.size() << " member(s)\n";
    }
}

void DiscriminatedUnionSchema::run(ParsePayload& payload) const {
    if (settle_absent(*this, payload)) return;
    const Value& target = payload.value.deref();
    if (!target.isObject()) {
        RawIssue issue = invalid_type("object", payload.value);
        issue.schemaError = m_internals.error;
        payload.addIssue(std::move(issue));
        return;
    }
    if (!target.has(m_discriminator)) {
        undispatched(payload, "missing");
        return;
    }
    std::string key = target.at(m_discriminator).deref().dump();
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        undispatched(payload, "unknown value " + key);
        return;
    }
    if (std::getenv("VT_PARSE_DEBUG")) {
        std::cerr << "discriminated union: '" << m_discriminator << "'=" << key << " -> member "
                  << it->second << "\n";
    }
    size_t before = payload.issues.size();
    m_entries[it->second].second->run(payload);
    if (payload.issues.size() == before) run_own_checks(*this, payload);
}

void DiscriminatedUnionSchema::undispatched(ParsePayload& payload, const std::string& why) const {
    if (m_fallback) {
        if (std::getenv("VT_PARSE_DEBUG")) {
            std::cerr << "discriminated union: '" << m_discriminator << "' " << why << ", trying every member\n";
        }
        std::vector<std::vector<RawIssue> > branches;
        if (try_members(m_members, payload, branches)) {
            run_own_checks(*this, payload);
            return;
        }
        RawIssue issue;
        issue.code = IssueCode::InvalidUnion;
        issue.input = payload.value;
        issue.errors = std::move(branches);
        issue.schemaError = m_internals.error;
        payload.addIssue(std::move(issue));
        return;
    }
    std::vector<Value> legal;
    for (auto const& entry : m_entries) legal.push_back(entry.first);
    RawIssue issue;
    issue.code = IssueCode::InvalidUnion;
    issue.input = payload.value;
    issue.path = {m_discriminator};
    issue.properties["discriminator"] = m_discriminator;
    issue.properties["values"] = Value::array(std::move(legal));
    issue.properties["note"] = why;
    issue.schemaError = m_internals.error;
    payload.addIssue(std::move(issue));
}

}  // namespace vt
