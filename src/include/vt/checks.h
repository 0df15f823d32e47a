#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "vt/check.h"

namespace vt {
namespace checks {

// Length of strings (in code points), arrays and objects.
CheckPtr min_length(int64_t n, CheckParams params = {});
CheckPtr max_length(int64_t n, CheckParams params = {});
CheckPtr length(int64_t n, CheckParams params = {});

CheckPtr greater_than(Value bound, bool inclusive, CheckParams params = {});
CheckPtr less_than(Value bound, bool inclusive, CheckParams params = {});
CheckPtr multiple_of(Value divisor, CheckParams params = {});

// Throws SchemaDefinitionError when pattern does not compile.
CheckPtr regex(const std::string& pattern, CheckParams params = {});
CheckPtr starts_with(std::string prefix, CheckParams params = {});
CheckPtr ends_with(std::string suffix, CheckParams params = {});
CheckPtr includes(std::string needle, CheckParams params = {});

CheckPtr refine(std::function<bool(const Value&)> pred, CheckParams params = {});
CheckPtr super_refine(std::function<void(const Value&, RefinementContext&)> fn, CheckParams params = {});

}  // namespace checks
}  // namespace vt
