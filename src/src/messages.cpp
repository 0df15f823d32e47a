#include "vt/issues.h"

#include <sstream>

namespace vt {

static std::string join_values(const Value& values, const std::string& sep) {
    std::ostringstream ss;
    bool first = true;
    for (auto const& v : values.asArray()) {
        if (!first) ss << sep;
        first = false;
        ss << v.dump();
    }
    return ss.str();
}

static std::string size_unit(const std::string& origin) {
    if (origin == "string") return "characters";
    if (origin == "array") return "items";
    if (origin == "object" || origin == "record") return "keys";
    return "";
}

static std::string bound_text(const RawIssue& issue, const std::string& limit_key, bool upper) {
    bool inclusive = issue.property("inclusive").isBool() ? issue.property("inclusive").asBool() : true;
    std::string op = upper ? (inclusive ? "<=" : "<") : (inclusive ? ">=" : ">");
    std::string origin = issue.property("origin").isString() ? issue.property("origin").asString() : "value";
    std::string limit = issue.property(limit_key).dump();
    std::string unit = size_unit(origin);
    if (!unit.empty()) return "expected " + origin + " to have " + op + limit + " " + unit;
    return "expected " + origin + " to be " + op + limit;
}

std::string default_message(const RawIssue& issue) {
    switch (issue.code) {
        case IssueCode::InvalidType: {
            if (issue.property("reason").isString()) return "Invalid input: " + issue.property("reason").asString();
            std::string expected = issue.property("expected").isString() ? issue.property("expected").asString() : "value";
            std::string received = issue.property("received").isString() ? issue.property("received").asString()
                                                                          : issue.input.typeName();
            return "Invalid input: expected " + expected + ", received " + received;
        }
        case IssueCode::InvalidValue: {
            Value values = issue.property("values");
            if (values.isArray() && values.size() == 1) return "Invalid input: expected " + values.at(0).dump();
            if (values.isArray()) return "Invalid option: expected one of " + join_values(values, "|");
            return "Invalid input";
        }
        case IssueCode::InvalidFormat: {
            std::string format = issue.property("format").isString() ? issue.property("format").asString() : "";
            if (format == "starts_with")
                return "Invalid string: must start with \"" + issue.property("prefix").asString() + "\"";
            if (format == "ends_with")
                return "Invalid string: must end with \"" + issue.property("suffix").asString() + "\"";
            if (format == "includes")
                return "Invalid string: must include \"" + issue.property("includes").asString() + "\"";
            if (format == "regex")
                return "Invalid string: must match pattern " + issue.property("pattern").asString();
            return "Invalid " + (format.empty() ? std::string("format") : format);
        }
        case IssueCode::InvalidUnion:
            if (issue.property("discriminator").isString()) {
                std::string text = "Invalid input: no matching discriminator for \"" +
                                   issue.property("discriminator").asString() + "\"";
                if (issue.property("values").isArray())
                    text += ", expected one of " + join_values(issue.property("values"), "|");
                return text;
            }
            return "Invalid input";
        case IssueCode::InvalidKey: {
            std::string origin = issue.property("origin").isString() ? issue.property("origin").asString() : "object";
            return "Invalid key in " + origin;
        }
        case IssueCode::InvalidElement: {
            std::string origin = issue.property("origin").isString() ? issue.property("origin").asString() : "array";
            return "Invalid value in " + origin;
        }
        case IssueCode::TooBig:
            return "Too big: " + bound_text(issue, "maximum", true);
        case IssueCode::TooSmall:
            return "Too small: " + bound_text(issue, "minimum", false);
        case IssueCode::NotMultipleOf:
            return "Invalid number: must be a multiple of " + issue.property("divisor").dump();
        case IssueCode::UnrecognizedKeys: {
            Value keys = issue.property("keys");
            std::string plural = keys.size() > 1 ? "s" : "";
            std::ostringstream ss;
            bool first = true;
            for (auto const& k : keys.asArray()) {
                if (!first) ss << ", ";
                first = false;
                ss << k.dump();
            }
            return "Unrecognized key" + plural + ": " + ss.str();
        }
        case IssueCode::Custom:
            if (issue.property("intersection").isString()) return "Intersection results could not be merged";
            return "Invalid input";
    }
    return "Invalid input";
}

}  // namespace vt
