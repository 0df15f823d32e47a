#include "vt/engine.h"

namespace vt {

RawIssue invalid_type(const std::string& expected, const Value& input) {
    RawIssue issue;
    issue.code = IssueCode::InvalidType;
    issue.input = input;
    issue.properties["expected"] = expected;
    issue.properties["received"] = input.typeName();
    return issue;
}

static void reject(const Schema& schema, const ParseHooks& hooks, ParsePayload& payload) {
    // absent input is always a type failure, whatever the schema's own rejection looks like
    bool typed = hooks.mismatch && !payload.value.isNull();
    RawIssue issue = typed ? hooks.mismatch(payload.value) : invalid_type(hooks.expected, payload.value);
    if (!issue.schemaError) issue.schemaError = schema.internals().error;
    payload.addIssue(std::move(issue));
}

void run_own_checks(const Schema& schema, ParsePayload& payload) {
    if (schema.internals().checks.empty()) return;
    if (!payload.value.isReference()) {
        run_checks(schema.internals(), payload);
        return;
    }
    ParsePayload view = payload.attempt(payload.value.deref());
    run_checks(schema.internals(), view);
    payload.absorb(view);
}

bool settle_absent(const Schema& schema, ParsePayload& payload) {
    if (!payload.value.isNull()) return false;
    const TypeInternals& in = schema.internals();
    if (!in.nilable && !in.optional) return false;
    payload.value = Value::absent(schema.valueKind());
    return true;
}

static void accept_direct(const Schema& schema, const ParseHooks& hooks, ParsePayload& payload) {
    if (hooks.descend) hooks.descend(payload);
    run_own_checks(schema, payload);
}

static void accept_reference(const Schema& schema, const ParseHooks& hooks, ParsePayload& payload) {
    const Value original = payload.value;
    const Value& target = original.deref();
    const std::pair<const Value*, const Schema*> key(&target, &schema);
    if (hooks.descend) {
        if (!payload.state) payload.state = std::make_shared<ParseState>();
        auto seen = payload.state->visited.find(key);
        if (seen != payload.state->visited.end()) {
            // still open means a cycle: hand the node back untouched
            if (seen->second.done) payload.value = seen->second.output;
            return;
        }
        payload.state->visited.emplace(key, Visit());
    }
    ParsePayload inner = payload.attempt(target);
    if (hooks.descend) hooks.descend(inner);
    run_own_checks(schema, inner);
    payload.absorb(inner);
    if (!hooks.descend) return;
    if (inner.value != target) payload.value = Value::ref(std::move(inner.value));
    // a union branch may have swapped the map underneath, so look the key up again
    Visit& visit = payload.state->visited[key];
    visit.done = true;
    visit.output = payload.value;
}

void parse_with(const Schema& schema, const ParseHooks& hooks, ParsePayload& payload) {
    if (payload.value.isNull()) {
        if (settle_absent(schema, payload)) return;
        if (!hooks.accepts(payload.value)) {
            reject(schema, hooks, payload);
            return;
        }
    }
    if (hooks.accepts(payload.value)) {
        accept_direct(schema, hooks, payload);
        return;
    }
    if (payload.value.isReference() && hooks.accepts(payload.value.deref())) {
        accept_reference(schema, hooks, payload);
        return;
    }
    if (schema.internals().coerce && hooks.coerce) {
        std::optional<Value> converted = hooks.coerce(payload.value.deref());
        if (converted && hooks.accepts(*converted)) {
            payload.value = std::move(*converted);
            accept_direct(schema, hooks, payload);
            return;
        }
    }
    reject(schema, hooks, payload);
}

}  // namespace vt
