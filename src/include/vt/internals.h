#pragma once

#include <memory>
#include <vector>

#include "vt/check.h"
#include "vt/issues.h"
#include "vt/type_kind.h"
#include "vt/value.h"

namespace vt {

// State every schema carries. Copied whenever a schema is copied, never shared.
struct TypeInternals {
    TypeKind kind = TypeKind::Any;
    std::vector<CheckPtr> checks;
    bool optional = false;
    bool nilable = false;
    bool coerce = false;
    // resolver for issues this schema raises itself
    std::shared_ptr<const ErrorMap> error;
    // legal values of literal and enum schemas
    std::vector<Value> values;
    // description, coerce flag and any other annotations
    Value bag = Value::object();
};

}  // namespace vt
