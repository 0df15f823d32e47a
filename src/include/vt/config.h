#pragma once

#include <memory>

#include "vt/issues.h"

namespace vt {

// Process-wide message resolution. Consulted after the per-call and per-schema
// resolvers have declined an issue.
struct Config {
    ErrorMap customError;
    ErrorMap localeError;
};

// Snapshot of the current process-wide configuration.
std::shared_ptr<const Config> config();
void setConfig(Config c);
void resetConfig();

}  // namespace vt
