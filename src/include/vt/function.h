#pragma once

#include <vector>

#include "vt/modifiers.h"
#include "vt/schema.h"

namespace vt {

// Accepts function values. When argument or return schemas are given the output
// is a wrapper that validates both on every call, throwing ValidationError.
class FunctionSchema : public BasicSchema<FunctionSchema> {
  public:
    using output_type = Value;

    FunctionSchema() { m_internals.kind = TypeKind::Function; }

    void run(ParsePayload& payload) const override;

    // Copy with its argument list described by args.
    FunctionSchema input(std::vector<SchemaPtr> args) const;
    FunctionSchema output(SchemaPtr result) const;

    // Validated wrapper around fn.
    Value implement(Callable fn) const;

    const std::vector<SchemaPtr>& inputs() const { return m_inputs; }
    const SchemaPtr& returns() const { return m_output; }

  private:
    Value wrap(const Value& fn) const;

    std::vector<SchemaPtr> m_inputs;
    bool m_has_inputs = false;
    SchemaPtr m_output;
};

inline FunctionSchema Function() { return FunctionSchema(); }

}  // namespace vt
