#include "vt/error.h"

#include <sstream>

namespace vt {

std::string to_string(IssueCode code) {
    switch (code) {
        case IssueCode::InvalidType:
            return "invalid_type";
        case IssueCode::InvalidValue:
            return "invalid_value";
        case IssueCode::InvalidFormat:
            return "invalid_format";
        case IssueCode::InvalidUnion:
            return "invalid_union";
        case IssueCode::InvalidKey:
            return "invalid_key";
        case IssueCode::InvalidElement:
            return "invalid_element";
        case IssueCode::TooBig:
            return "too_big";
        case IssueCode::TooSmall:
            return "too_small";
        case IssueCode::NotMultipleOf:
            return "not_multiple_of";
        case IssueCode::UnrecognizedKeys:
            return "unrecognized_keys";
        case IssueCode::Custom:
            return "custom";
    }
    return "custom";
}

std::string to_dot_path(const Path& path) {
    std::ostringstream ss;
    bool first = true;
    for (auto const& seg : path) {
        if (std::holds_alternative<int64_t>(seg)) {
            ss << '[' << std::get<int64_t>(seg) << ']';
        } else {
            if (!first) ss << '.';
            ss << std::get<std::string>(seg);
        }
        first = false;
    }
    return ss.str();
}

Issue finalize_issue(const RawIssue& raw, const ParseContext* ctx, const Config& cfg) {
    std::string message = raw.message;
    if (message.empty() && ctx && ctx->error) message = ctx->error(raw);
    if (message.empty() && raw.schemaError && *raw.schemaError) message = (*raw.schemaError)(raw);
    if (message.empty() && cfg.customError) message = cfg.customError(raw);
    if (message.empty() && cfg.localeError) message = cfg.localeError(raw);
    if (message.empty()) message = default_message(raw);

    Issue issue;
    issue.code = raw.code;
    issue.path = raw.path;
    issue.message = std::move(message);
    issue.properties = raw.properties;
    if (ctx && ctx->reportInput) issue.input = raw.input;
    for (auto const& branch : raw.errors) {
        std::vector<Issue> finalized;
        finalized.reserve(branch.size());
        for (auto const& nested : branch) finalized.push_back(finalize_issue(nested, ctx, cfg));
        issue.errors.push_back(std::move(finalized));
    }
    return issue;
}

ValidationError make_validation_error(const std::vector<RawIssue>& raw, const ParseContext* ctx) {
    std::shared_ptr<const Config> cfg = (ctx && ctx->config) ? ctx->config : config();
    std::vector<Issue> issues;
    issues.reserve(raw.size());
    for (auto const& r : raw) issues.push_back(finalize_issue(r, ctx, *cfg));
    return ValidationError(std::move(issues));
}

static std::string prettify_issues(const std::vector<Issue>& issues) {
    if (issues.empty()) return "Validation failed";
    std::ostringstream ss;
    bool first = true;
    for (auto const& issue : issues) {
        if (!first) ss << "; ";
        first = false;
        if (!issue.path.empty()) ss << to_dot_path(issue.path) << ": ";
        ss << issue.message;
    }
    return ss.str();
}

ValidationError::ValidationError(std::vector<Issue> issues)
    : std::runtime_error(prettify_issues(issues)), m_issues(std::move(issues)) {}

std::string ValidationError::prettify() const { return prettify_issues(m_issues); }

FlattenedError ValidationError::flatten() const {
    FlattenedError out;
    for (auto const& issue : m_issues) {
        if (issue.path.empty()) {
            out.formErrors.push_back(issue.message);
            continue;
        }
        auto const& head = issue.path.front();
        std::string key = std::holds_alternative<int64_t>(head) ? std::to_string(std::get<int64_t>(head))
                                                                : std::get<std::string>(head);
        out.fieldErrors[key].push_back(issue.message);
    }
    return out;
}

}  // namespace vt
