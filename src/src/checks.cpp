#include "vt/checks.h"

#include <cmath>
#include <regex>

#include "vt/error.h"
#include "vt/internals.h"

namespace vt {

void run_checks(const TypeInternals& internals, ParsePayload& payload) {
    for (auto const& check : internals.checks) {
        if (check->when && !check->when(payload)) continue;
        size_t before = payload.issues.size();
        check->fn(payload);
        if (payload.issues.size() == before) continue;
        for (size_t i = before; i < payload.issues.size(); ++i) {
            RawIssue& issue = payload.issues[i];
            if (issue.message.empty() && check->error) issue.message = check->error(issue);
            if (!issue.schemaError) issue.schemaError = internals.error;
        }
        if (check->abort) break;
    }
}

namespace checks {

static ErrorMap error_of(const CheckParams& params) {
    if (params.error) return params.error;
    if (!params.message.empty()) {
        std::string message = params.message;
        return [message](const RawIssue&) { return message; };
    }
    return nullptr;
}

static CheckPtr make_check(std::string name, Value described, std::function<void(ParsePayload&)> fn,
                           const CheckParams& params) {
    auto check = std::make_shared<Check>();
    check->name = std::move(name);
    check->fn = std::move(fn);
    check->abort = params.abort;
    check->error = error_of(params);
    check->params = std::move(described);
    return check;
}

static int64_t count_code_points(const std::string& s) {
    int64_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80) ++n;
    return n;
}

// Size and origin of a sizable value; false for anything else.
static bool size_of(const Value& v, int64_t& size, std::string& origin) {
    if (v.isString()) {
        size = count_code_points(v.asString());
        origin = "string";
        return true;
    }
    if (v.isArray()) {
        size = v.size();
        origin = "array";
        return true;
    }
    if (v.isObject()) {
        size = v.size();
        origin = "object";
        return true;
    }
    return false;
}

static RawIssue bound_issue(IssueCode code, const Value& input, const std::string& origin, const Value& limit,
                            bool inclusive) {
    RawIssue issue;
    issue.code = code;
    issue.input = input;
    issue.properties["origin"] = origin;
    issue.properties[code == IssueCode::TooBig ? "maximum" : "minimum"] = limit;
    issue.properties["inclusive"] = inclusive;
    return issue;
}

CheckPtr min_length(int64_t n, CheckParams params) {
    Value described = Value::object({{"minimum", n}, {"inclusive", true}});
    return make_check("min_length", described, [n](ParsePayload& payload) {
        int64_t size = 0;
        std::string origin;
        if (!size_of(payload.value, size, origin)) return;
        if (size < n) payload.addIssue(bound_issue(IssueCode::TooSmall, payload.value, origin, n, true));
    }, params);
}

CheckPtr max_length(int64_t n, CheckParams params) {
    Value described = Value::object({{"maximum", n}, {"inclusive", true}});
    return make_check("max_length", described, [n](ParsePayload& payload) {
        int64_t size = 0;
        std::string origin;
        if (!size_of(payload.value, size, origin)) return;
        if (size > n) payload.addIssue(bound_issue(IssueCode::TooBig, payload.value, origin, n, true));
    }, params);
}

CheckPtr length(int64_t n, CheckParams params) {
    Value described = Value::object({{"length", n}});
    return make_check("length_equals", described, [n](ParsePayload& payload) {
        int64_t size = 0;
        std::string origin;
        if (!size_of(payload.value, size, origin)) return;
        if (size < n) payload.addIssue(bound_issue(IssueCode::TooSmall, payload.value, origin, n, true));
        if (size > n) payload.addIssue(bound_issue(IssueCode::TooBig, payload.value, origin, n, true));
    }, params);
}

// -1, 0 or 1; integers compare exactly, anything else as doubles.
static int compare_numbers(const Value& a, const Value& b) {
    if (a.isInt() && b.isInt()) {
        if (a.asInt() < b.asInt()) return -1;
        return a.asInt() > b.asInt() ? 1 : 0;
    }
    double x = a.asDouble();
    double y = b.asDouble();
    if (x < y) return -1;
    return x > y ? 1 : 0;
}

CheckPtr greater_than(Value bound, bool inclusive, CheckParams params) {
    if (!bound.isNumber()) throw SchemaDefinitionError("greater_than bound must be a number");
    Value described = Value::object({{"minimum", bound}, {"inclusive", inclusive}});
    return make_check(inclusive ? "greater_than_or_equal" : "greater_than", described,
                      [bound, inclusive](ParsePayload& payload) {
                          if (!payload.value.isNumber()) return;
                          int c = compare_numbers(payload.value, bound);
                          if (c > 0 || (inclusive && c == 0)) return;
                          payload.addIssue(bound_issue(IssueCode::TooSmall, payload.value, "number", bound, inclusive));
                      },
                      params);
}

CheckPtr less_than(Value bound, bool inclusive, CheckParams params) {
    if (!bound.isNumber()) throw SchemaDefinitionError("less_than bound must be a number");
    Value described = Value::object({{"maximum", bound}, {"inclusive", inclusive}});
    return make_check(inclusive ? "less_than_or_equal" : "less_than", described,
                      [bound, inclusive](ParsePayload& payload) {
                          if (!payload.value.isNumber()) return;
                          int c = compare_numbers(payload.value, bound);
                          if (c < 0 || (inclusive && c == 0)) return;
                          payload.addIssue(bound_issue(IssueCode::TooBig, payload.value, "number", bound, inclusive));
                      },
                      params);
}

CheckPtr multiple_of(Value divisor, CheckParams params) {
    if (!divisor.isNumber() || divisor.asDouble() == 0.0)
        throw SchemaDefinitionError("multiple_of divisor must be a non-zero number");
    Value described = Value::object({{"divisor", divisor}});
    return make_check("multiple_of", described, [divisor](ParsePayload& payload) {
        const Value& v = payload.value;
        if (!v.isNumber()) return;
        bool ok = false;
        if (v.isInt() && divisor.isInt()) {
            int64_t d = divisor.asInt();
            // INT64_MIN % -1 traps
            ok = d == 1 || d == -1 || v.asInt() % d == 0;
        } else {
            double rem = std::remainder(v.asDouble(), divisor.asDouble());
            ok = std::fabs(rem) <= 1e-9 * std::fmax(1.0, std::fabs(v.asDouble()));
        }
        if (ok) return;
        RawIssue issue;
        issue.code = IssueCode::NotMultipleOf;
        issue.input = v;
        issue.properties["divisor"] = divisor;
        payload.addIssue(std::move(issue));
    }, params);
}

static RawIssue format_issue(const Value& input, const std::string& format) {
    RawIssue issue;
    issue.code = IssueCode::InvalidFormat;
    issue.input = input;
    issue.properties["origin"] = "string";
    issue.properties["format"] = format;
    return issue;
}

CheckPtr regex(const std::string& pattern, CheckParams params) {
    std::shared_ptr<const std::regex> re;
    try {
        re = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw SchemaDefinitionError("invalid regex '" + pattern + "': " + e.what());
    }
    Value described = Value::object({{"format", "regex"}, {"pattern", pattern}});
    return make_check("regex", described, [re, pattern](ParsePayload& payload) {
        if (!payload.value.isString()) return;
        if (std::regex_search(payload.value.asString(), *re)) return;
        RawIssue issue = format_issue(payload.value, "regex");
        issue.properties["pattern"] = pattern;
        payload.addIssue(std::move(issue));
    }, params);
}

CheckPtr starts_with(std::string prefix, CheckParams params) {
    Value described = Value::object({{"format", "starts_with"}, {"prefix", prefix}});
    return make_check("starts_with", described, [prefix](ParsePayload& payload) {
        if (!payload.value.isString()) return;
        if (payload.value.asString().compare(0, prefix.size(), prefix) == 0) return;
        RawIssue issue = format_issue(payload.value, "starts_with");
        issue.properties["prefix"] = prefix;
        payload.addIssue(std::move(issue));
    }, params);
}

CheckPtr ends_with(std::string suffix, CheckParams params) {
    Value described = Value::object({{"format", "ends_with"}, {"suffix", suffix}});
    return make_check("ends_with", described, [suffix](ParsePayload& payload) {
        if (!payload.value.isString()) return;
        const std::string& s = payload.value.asString();
        if (s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) return;
        RawIssue issue = format_issue(payload.value, "ends_with");
        issue.properties["suffix"] = suffix;
        payload.addIssue(std::move(issue));
    }, params);
}

CheckPtr includes(std::string needle, CheckParams params) {
    Value described = Value::object({{"format", "includes"}, {"includes", needle}});
    return make_check("includes", described, [needle](ParsePayload& payload) {
        if (!payload.value.isString()) return;
        if (payload.value.asString().find(needle) != std::string::npos) return;
        RawIssue issue = format_issue(payload.value, "includes");
        issue.properties["includes"] = needle;
        payload.addIssue(std::move(issue));
    }, params);
}

CheckPtr refine(std::function<bool(const Value&)> pred, CheckParams params) {
    Path where = params.path;
    return make_check("refine", Value::object(), [pred, where](ParsePayload& payload) {
        if (pred(payload.value)) return;
        RawIssue issue;
        issue.code = IssueCode::Custom;
        issue.input = payload.value;
        issue.path = where;
        payload.addIssue(std::move(issue));
    }, params);
}

CheckPtr super_refine(std::function<void(const Value&, RefinementContext&)> fn, CheckParams params) {
    return make_check("super_refine", Value::object(), [fn](ParsePayload& payload) {
        RefinementContext ctx(payload);
        fn(payload.value, ctx);
    }, params);
}

}  // namespace checks
}  // namespace vt
