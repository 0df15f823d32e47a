#pragma once

#include <optional>

#include "vt/value.h"

namespace vt {

// Conversions used by schemas with coercion enabled. std::nullopt means the
// value has no sensible reading as the target type.
std::optional<Value> coerce_to_string(const Value& v);
std::optional<Value> coerce_to_int(const Value& v);
std::optional<Value> coerce_to_float(const Value& v);
std::optional<Value> coerce_to_bool(const Value& v);

}  // namespace vt
