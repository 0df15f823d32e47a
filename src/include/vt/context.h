#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "vt/config.h"
#include "vt/issues.h"

namespace vt {

class Schema;

struct ParseContext {
    // per-call resolver, consulted before the schema's own
    ErrorMap error;
    bool reportInput = false;
    // falls back to vt::config() when empty
    std::shared_ptr<const Config> config;
};

// A referent entered through a reference under one schema.
struct Visit {
    // false while the referent is still being parsed; meeting it again then means a cycle
    bool done = false;
    // the value handed back for every later occurrence once done
    Value output;
};

// State shared by every payload of one top-level parse call.
struct ParseState {
    std::map<std::pair<const Value*, const Schema*>, Visit> visited;
};

struct ParsePayload {
    Value value;
    Path path;
    std::vector<RawIssue> issues;
    std::shared_ptr<ParseState> state;

    ParsePayload() = default;
    // Root payload of a parse call; owns the state its children share.
    explicit ParsePayload(Value v) : value(std::move(v)), state(std::make_shared<ParseState>()) {}

    // Payload for a nested value one segment below this one.
    ParsePayload child(Value v, PathSegment segment) const {
        ParsePayload out;
        out.value = std::move(v);
        out.path = path;
        out.path.push_back(std::move(segment));
        out.state = state;
        return out;
    }

    // Payload for another attempt at the same position (union branches, checks).
    ParsePayload attempt(Value v) const {
        ParsePayload out;
        out.value = std::move(v);
        out.path = path;
        out.state = state;
        return out;
    }

    // The issue's path is taken as relative to this payload.
    void addIssue(RawIssue issue) {
        Path full = path;
        full.insert(full.end(), issue.path.begin(), issue.path.end());
        issue.path = std::move(full);
        issues.push_back(std::move(issue));
    }

    void absorb(ParsePayload& other) {
        for (auto& issue : other.issues) issues.push_back(std::move(issue));
        other.issues.clear();
    }

    bool failed() const { return !issues.empty(); }
};

// Handed to refinements and transforms so they can report issues of their own.
class RefinementContext {
  public:
    explicit RefinementContext(ParsePayload& payload) : m_payload(payload) {}

    const Value& value() const { return m_payload.value; }
    const Path& path() const { return m_payload.path; }

    void addIssue(std::string message, Path path = {}) {
        RawIssue issue;
        issue.code = IssueCode::Custom;
        issue.input = m_payload.value;
        issue.message = std::move(message);
        issue.path = std::move(path);
        m_payload.addIssue(std::move(issue));
    }

    void addIssue(RawIssue issue) {
        if (issue.input.isNull()) issue.input = m_payload.value;
        m_payload.addIssue(std::move(issue));
    }

  private:
    ParsePayload& m_payload;
};

}  // namespace vt
