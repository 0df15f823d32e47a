#pragma once

#include <functional>
#include <optional>
#include <string>

#include "vt/context.h"
#include "vt/schema.h"

namespace vt {

// What a concrete schema tells the generic parse routine about its type.
struct ParseHooks {
    // type name reported in invalid_type issues
    std::string expected;
    // direct-type test
    std::function<bool(const Value&)> accepts;
    // opt-in conversion, consulted only when coercion is enabled
    std::function<std::optional<Value>(const Value&)> coerce;
    // composites validate their children here and may replace payload.value
    std::function<void(ParsePayload&)> descend;
    // issue raised when the value is rejected; invalid_type when empty
    std::function<RawIssue(const Value&)> mismatch;
};

// Absent handling, direct match, reference match (returning the caller's
// reference when nothing changed), coercion, then checks.
void parse_with(const Schema& schema, const ParseHooks& hooks, ParsePayload& payload);

RawIssue invalid_type(const std::string& expected, const Value& input);

// Runs the schema's own checks against the (dereferenced) output in payload.
void run_own_checks(const Schema& schema, ParsePayload& payload);

// Returns true when absent input was settled by the nilable/optional flags.
bool settle_absent(const Schema& schema, ParsePayload& payload);

}  // namespace vt
