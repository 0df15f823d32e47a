#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "vt/context.h"
#include "vt/issues.h"

namespace vt {

struct TypeInternals;

// One named validation step attached to a schema.
struct Check {
    std::string name;
    // Inspects payload.value and adds issues to the payload when it fails.
    std::function<void(ParsePayload&)> fn;
    // a failing abort check stops the rest of the list for this value
    bool abort = false;
    ErrorMap error;
    // the check is skipped when this returns false
    std::function<bool(const ParsePayload&)> when;
    // minimum, maximum, pattern, ... for external translators
    Value params = Value::object();
};

using CheckPtr = std::shared_ptr<const Check>;

// Options shared by every check factory.
struct CheckParams {
    std::string message;
    ErrorMap error;
    bool abort = false;
    // where refine() reports its issue, relative to the checked value
    Path path;
};

// Runs the schema's checks, in order, against payload.value, which must not be a reference.
void run_checks(const TypeInternals& internals, ParsePayload& payload);

}  // namespace vt
