#include "vt/modifiers.h"

namespace vt {

TransformSchema::TransformSchema(TransformFn fn) : m_fn(std::make_shared<const TransformFn>(std::move(fn))) {
    m_internals.kind = TypeKind::Transform;
}

void TransformSchema::run(ParsePayload& payload) const {
    size_t before = payload.issues.size();
    RefinementContext ctx(payload);
    Value out = (*m_fn)(payload.value, ctx);
    if (payload.issues.size() != before) return;
    payload.value = std::move(out);
    run_own_checks(*this, payload);
}

}  // namespace vt
