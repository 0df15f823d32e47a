#include "vt/lazy.h"

#include <cstdlib>
#include <iostream>

#include "vt/engine.h"

namespace vt {

LazySchema::LazySchema(Getter getter) : m_state(std::make_shared<State>()) {
    if (!getter) throw SchemaDefinitionError("lazy schema needs a getter");
    m_state->getter = std::move(getter);
    m_internals.kind = TypeKind::Lazy;
}

SchemaPtr LazySchema::resolve() const {
    State& state = *m_state;
    std::call_once(state.once, [&state]() {
        if (std::getenv("VT_PARSE_DEBUG")) std::cerr << "lazy: resolving\n";
        try {
            SchemaPtr schema = state.getter();
            if (schema)
                state.slot = Resolved{std::move(schema)};
            else
                state.slot = Failed{"lazy getter returned no schema"};
        } catch (const std::exception& e) {
            state.slot = Failed{std::string("lazy getter threw: ") + e.what()};
        }
        state.getter = nullptr;
        state.done.store(true);
        if (std::getenv("VT_PARSE_DEBUG") && std::holds_alternative<Failed>(state.slot))
            std::cerr << "lazy: " << std::get<Failed>(state.slot).reason << "\n";
    });
    if (auto r = std::get_if<Resolved>(&state.slot)) return r->schema;
    return nullptr;
}

bool LazySchema::resolved() const { return m_state->done.load(); }

std::string LazySchema::failure() const {
    if (!m_state->done.load()) return "";
    if (auto f = std::get_if<Failed>(&m_state->slot)) return f->reason;
    return "";
}

void LazySchema::run(ParsePayload& payload) const {
    // absent input never forces the getter
    if (settle_absent(*this, payload)) return;
    SchemaPtr schema = resolve();
    if (!schema) {
        RawIssue issue = invalid_type("lazy", payload.value);
        issue.properties["reason"] = failure();
        issue.schemaError = m_internals.error;
        payload.addIssue(std::move(issue));
        return;
    }
    size_t before = payload.issues.size();
    schema->run(payload);
    if (payload.issues.size() == before) run_own_checks(*this, payload);
}

}  // namespace vt
