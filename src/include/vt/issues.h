#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "vt/value.h"

namespace vt {

enum class IssueCode {
    InvalidType,
    InvalidValue,
    InvalidFormat,
    InvalidUnion,
    InvalidKey,
    // for refinements reporting a bad collection element; built-in schemas never raise it
    InvalidElement,
    TooBig,
    TooSmall,
    NotMultipleOf,
    UnrecognizedKeys,
    Custom
};

std::string to_string(IssueCode code);

using PathSegment = std::variant<std::string, int64_t>;
using Path = std::vector<PathSegment>;

// "friends[0].name"
std::string to_dot_path(const Path& path);

struct RawIssue;

// Resolves the message for an issue. An empty result defers to the next resolver.
using ErrorMap = std::function<std::string(const RawIssue&)>;

// An issue as raised during parsing, before any message is chosen.
struct RawIssue {
    IssueCode code = IssueCode::Custom;
    Value input;
    Path path;
    // expected, received, origin, minimum, maximum, inclusive, format, values, keys, ...
    Value properties = Value::object();
    // set by a check's own error override; wins over every other resolver
    std::string message;
    // resolver of the schema that raised the issue
    std::shared_ptr<const ErrorMap> schemaError;
    // per-branch issues of a failed union, or the issues of a rejected record key
    std::vector<std::vector<RawIssue> > errors;

    Value property(const std::string& key) const {
        return properties.has(key) ? properties.at(key) : Value();
    }
};

struct Issue {
    IssueCode code = IssueCode::Custom;
    Path path;
    std::string message;
    // only filled in when the caller asked for inputs to be reported
    std::optional<Value> input;
    Value properties = Value::object();
    std::vector<std::vector<Issue> > errors;
};

// Built-in English text for an issue.
std::string default_message(const RawIssue& issue);

}  // namespace vt
