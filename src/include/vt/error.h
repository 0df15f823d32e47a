#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "vt/config.h"
#include "vt/context.h"
#include "vt/issues.h"

namespace vt {

// Thrown while a schema is being built, never while parsing.
class SchemaDefinitionError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

struct FlattenedError {
    std::vector<std::string> formErrors;
    std::map<std::string, std::vector<std::string> > fieldErrors;
};

// The one error a failed parse produces: every issue found, in discovery order.
class ValidationError : public std::runtime_error {
  public:
    explicit ValidationError(std::vector<Issue> issues);

    const std::vector<Issue>& issues() const noexcept { return m_issues; }

    // "path: message; path: message"
    std::string prettify() const;

    // Issues at the root become form errors, the rest are grouped by top-level key.
    FlattenedError flatten() const;

  private:
    std::vector<Issue> m_issues;
};

// Resolves the message of one raw issue.
// Precedence: check override, ctx->error, schema resolver, config custom, config locale, English.
Issue finalize_issue(const RawIssue& raw, const ParseContext* ctx, const Config& cfg);

ValidationError make_validation_error(const std::vector<RawIssue>& raw, const ParseContext* ctx);

template <typename T>
class Result {
  public:
    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(ValidationError error) : m_state(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return m_state.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const {
        if (!ok()) throw std::get<1>(m_state);
        return std::get<0>(m_state);
    }

    const ValidationError& error() const {
        if (ok()) throw std::logic_error("result holds a value, not an error");
        return std::get<1>(m_state);
    }

    const std::vector<Issue>& issues() const { return error().issues(); }

  private:
    std::variant<T, ValidationError> m_state;
};

}  // namespace vt
