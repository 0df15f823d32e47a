#include "vt/coerce.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace vt {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<Value> coerce_to_string(const Value& v) {
    if (v.isString()) return v;
    if (v.isInt()) return Value(std::to_string(v.asInt()));
    if (v.isDouble()) return Value(format_double(v.asDouble()));
    if (v.isBool()) return Value(v.asBool() ? "true" : "false");
    return std::nullopt;
}

std::optional<Value> coerce_to_int(const Value& v) {
    if (v.isInt()) return v;
    if (v.isBool()) return Value(v.asBool() ? 1 : 0);
    if (v.isDouble()) {
        double x = v.asDouble();
        if (!std::isfinite(x) || std::trunc(x) != x) return std::nullopt;
        // 2^63 is the first double past the int64 range
        if (x < -9223372036854775808.0 || x >= 9223372036854775808.0) return std::nullopt;
        return Value(static_cast<int64_t>(x));
    }
    if (v.isString()) {
        std::string s = trim(v.asString());
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long n = std::strtoll(s.c_str(), &end, 10);
        if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
        return Value(static_cast<int64_t>(n));
    }
    return std::nullopt;
}

std::optional<Value> coerce_to_float(const Value& v) {
    if (v.isDouble()) return v;
    if (v.isInt()) return Value(v.asDouble());
    if (v.isBool()) return Value(v.asBool() ? 1.0 : 0.0);
    if (v.isString()) {
        std::string s = trim(v.asString());
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        double x = std::strtod(s.c_str(), &end);
        if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
        return Value(x);
    }
    return std::nullopt;
}

std::optional<Value> coerce_to_bool(const Value& v) {
    if (v.isBool()) return v;
    if (v.isNumber()) return Value(v.asDouble() != 0.0);
    if (v.isString()) {
        std::string s = trim(v.asString());
        if (s == "true" || s == "1") return Value(true);
        if (s == "false" || s == "0") return Value(false);
    }
    return std::nullopt;
}

}  // namespace vt
