#include "vt/unions.h"

#include "vt/engine.h"

namespace vt {

bool try_members(const std::vector<SchemaPtr>& members, ParsePayload& payload,
                 std::vector<std::vector<RawIssue> >& branch_issues) {
    if (!payload.state) payload.state = std::make_shared<ParseState>();
    for (auto const& member : members) {
        // a failed branch must not leave visited marks behind
        ParsePayload attempt = payload.attempt(payload.value);
        attempt.state = std::make_shared<ParseState>(*payload.state);
        member->run(attempt);
        if (attempt.issues.empty()) {
            payload.value = std::move(attempt.value);
            *payload.state = std::move(*attempt.state);
            return true;
        }
        branch_issues.push_back(std::move(attempt.issues));
    }
    return false;
}

UnionSchema::UnionSchema(std::vector<SchemaPtr> members) : m_members(std::move(members)) {
    if (m_members.empty()) throw SchemaDefinitionError("union needs at least one member");
    for (auto const& m : m_members)
        if (!m) throw SchemaDefinitionError("union member is null");
    m_internals.kind = TypeKind::Union;
}

void UnionSchema::run(ParsePayload& payload) const {
    if (settle_absent(*this, payload)) return;
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
}

IntersectionSchema::IntersectionSchema(SchemaPtr left, SchemaPtr right)
    : m_left(std::move(left)), m_right(std::move(right)) {
    if (!m_left || !m_right) throw SchemaDefinitionError("intersection needs two schemas");
    m_internals.kind = TypeKind::Intersection;
}

static bool merge_values(const Value& a, const Value& b, Value& out) {
    if (a == b) {
        out = a;
        return true;
    }
    const Value& x = a.deref();
    const Value& y = b.deref();
    if (x == y) {
        out = x;
        return true;
    }
    if (x.isObject() && y.isObject()) {
        std::map<std::string, Value> merged = x.asObject();
        for (auto const& kv : y.asObject()) {
            auto it = merged.find(kv.first);
            if (it == merged.end()) {
                merged.emplace(kv.first, kv.second);
                continue;
            }
            Value sub;
            if (!merge_values(it->second, kv.second, sub)) return false;
            it->second = std::move(sub);
        }
        out = Value(std::move(merged));
        return true;
    }
    if (x.isArray() && y.isArray() && x.size() == y.size()) {
        std::vector<Value> merged;
        for (int i = 0; i < x.size(); ++i) {
            Value sub;
            if (!merge_values(x.at(i), y.at(i), sub)) return false;
            merged.push_back(std::move(sub));
        }
        out = Value(std::move(merged));
        return true;
    }
    if (x.isNumber() && y.isNumber() && x.asDouble() == y.asDouble()) {
        out = x;
        return true;
    }
    return false;
}

void IntersectionSchema::run(ParsePayload& payload) const {
    if (settle_absent(*this, payload)) return;
    ParsePayload left = payload.attempt(payload.value);
    ParsePayload right = payload.attempt(payload.value);
    m_left->run(left);
    m_right->run(right);
    bool failed = left.failed() || right.failed();
    payload.absorb(left);
    payload.absorb(right);
    if (failed) return;

    Value merged;
    if (!merge_values(left.value, right.value, merged)) {
        RawIssue issue;
        issue.code = IssueCode::Custom;
        issue.input = payload.value;
        issue.properties["intersection"] = "unmergeable";
        issue.schemaError = m_internals.error;
        payload.addIssue(std::move(issue));
        return;
    }
    if (payload.value.isReference() && !merged.isReference())
        merged = merged == payload.value.deref() ? payload.value : Value::ref(merged);
    payload.value = std::move(merged);
    run_own_checks(*this, payload);
}

}  // namespace vt
