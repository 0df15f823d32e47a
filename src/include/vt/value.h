#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "vt/type_kind.h"

namespace vt {

struct Value;

using Callable = std::function<Value(const std::vector<Value>&)>;

// Dynamic runtime value that schemas validate. References share their referent
// and compare by identity; everything else compares by content.
struct Value {
    enum TYPE { Null, Boolean, Integer, Double, String, Array, Object, Reference, Function };

  private:
    TYPE my_type = Null;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    std::string m_string;
    std::vector<Value> m_array;
    std::map<std::string, Value> m_object;
    std::shared_ptr<Value> m_ref;
    std::shared_ptr<const Callable> m_fn;
    std::optional<TypeKind> m_absent;

  public:
    Value() = default;
    Value(std::nullptr_t) {}

    Value(bool b) : my_type(Boolean), m_bool(b) {}

    template <typename T,
              std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
    Value(T n) : my_type(Integer), m_int(static_cast<int64_t>(n)) {}

    Value(double x) : my_type(Double), m_double(x) {}

    Value(const char* s) : my_type(String), m_string(s) {}
    Value(std::string s) : my_type(String), m_string(std::move(s)) {}

    Value(std::vector<Value> v) : my_type(Array), m_array(std::move(v)) {}
    Value(std::map<std::string, Value> m) : my_type(Object), m_object(std::move(m)) {}

    explicit Value(std::shared_ptr<Value> target) : my_type(Reference), m_ref(std::move(target)) {
        if (!m_ref) throw std::logic_error("reference to nothing");
    }

    static Value array(std::vector<Value> v = {}) { return Value(std::move(v)); }
    static Value object(std::map<std::string, Value> m = {}) { return Value(std::move(m)); }

    // Fresh heap cell holding v, returned as a reference to it.
    static Value ref(Value v) { return Value(std::make_shared<Value>(std::move(v))); }

    static Value function(Callable fn) {
        Value v;
        v.my_type = Function;
        v.m_fn = std::make_shared<const Callable>(std::move(fn));
        return v;
    }

    // Null that remembers which kind of value it stands in for.
    static Value absent(TypeKind kind) {
        Value v;
        v.m_absent = kind;
        return v;
    }

    TYPE type() const { return my_type; }

    bool isNull() const { return my_type == Null; }
    bool isAbsent() const { return my_type == Null && m_absent.has_value(); }
    std::optional<TypeKind> absentKind() const { return m_absent; }
    bool isBool() const { return my_type == Boolean; }
    bool isInt() const { return my_type == Integer; }
    bool isDouble() const { return my_type == Double; }
    bool isNumber() const { return my_type == Integer || my_type == Double; }
    bool isString() const { return my_type == String; }
    bool isArray() const { return my_type == Array; }
    bool isObject() const { return my_type == Object; }
    bool isReference() const { return my_type == Reference; }
    bool isFunction() const { return my_type == Function; }

    bool asBool() const {
        if (my_type == Boolean) return m_bool;
        throw std::runtime_error("not a bool");
    }

    int64_t asInt() const {
        if (my_type == Integer) return m_int;
        if (my_type == Double) return static_cast<int64_t>(m_double);
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == Double) return m_double;
        if (my_type == Integer) return static_cast<double>(m_int);
        throw std::runtime_error("not a double");
    }

    const std::string& asString() const {
        if (my_type == String) return m_string;
        throw std::runtime_error("not a string");
    }

    const std::vector<Value>& asArray() const {
        if (my_type == Array) return m_array;
        throw std::logic_error("Not a list");
    }

    std::vector<Value>& asArray() {
        if (my_type == Array) return m_array;
        throw std::logic_error("Not a list");
    }

    const std::map<std::string, Value>& asObject() const {
        if (my_type == Object) return m_object;
        throw std::logic_error("Not an object");
    }

    std::map<std::string, Value>& asObject() {
        if (my_type == Object) return m_object;
        throw std::logic_error("Not an object");
    }

    const std::shared_ptr<Value>& referent() const {
        if (my_type == Reference) return m_ref;
        throw std::logic_error("Not a reference");
    }

    // Follows a chain of references down to the first non-reference value.
    const Value& deref() const;

    Value call(const std::vector<Value>& args) const {
        if (my_type != Function) throw std::logic_error("Not a function");
        return (*m_fn)(args);
    }

    Value& operator[](const std::string& key) {
        if (my_type == Null) {
            my_type = Object;
            m_absent.reset();
        }
        if (my_type != Object) throw std::logic_error("Not an object");
        return m_object[key];
    }

    const Value& at(const std::string& key) const;
    Value& at(const std::string& key);
    const Value& at(int index) const;
    Value& at(int index);

    bool has(const std::string& key) const noexcept {
        return my_type == Object && m_object.count(key) == 1;
    }

    std::vector<std::string> keys() const {
        if (my_type != Object) return {};
        std::vector<std::string> out;
        out.reserve(m_object.size());
        for (auto const& p : m_object) out.push_back(p.first);
        return out;
    }

    std::vector<std::pair<std::string, Value> > items() const {
        if (my_type != Object) throw std::logic_error("Cannot get items of non-object type");
        return {m_object.begin(), m_object.end()};
    }

    int size() const noexcept {
        switch (my_type) {
            case Array:
                return static_cast<int>(m_array.size());
            case Object:
                return static_cast<int>(m_object.size());
            default:
                return 0;
        }
    }

    Value& push_back(Value v) {
        if (my_type == Null) my_type = Array;
        if (my_type != Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(v));
        return *this;
    }

    // Name used in issues: "string", "integer", "number", "array", ...
    // References report the name of what they point at.
    std::string typeName() const;

    // Compact JSON-like rendering. Cycles through references print as <cycle>.
    std::string dump() const;

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }
};

template <typename T>
struct ValueCast;

template <>
struct ValueCast<Value> {
    static Value from(const Value& v) { return v; }
};

template <>
struct ValueCast<std::string> {
    static std::string from(const Value& v) { return v.deref().asString(); }
};

template <>
struct ValueCast<int64_t> {
    static int64_t from(const Value& v) { return v.deref().asInt(); }
};

template <>
struct ValueCast<double> {
    static double from(const Value& v) { return v.deref().asDouble(); }
};

template <>
struct ValueCast<bool> {
    static bool from(const Value& v) { return v.deref().asBool(); }
};

template <>
struct ValueCast<std::vector<Value> > {
    static std::vector<Value> from(const Value& v) { return v.deref().asArray(); }
};

template <>
struct ValueCast<std::map<std::string, Value> > {
    static std::map<std::string, Value> from(const Value& v) { return v.deref().asObject(); }
};

template <typename U>
struct ValueCast<std::optional<U> > {
    static std::optional<U> from(const Value& v) {
        if (v.deref().isNull()) return std::nullopt;
        return ValueCast<U>::from(v);
    }
};

// Shortest decimal text that reads back as exactly x.
std::string format_double(double x);

// Typed view of a validated value; throws std::runtime_error on a shape mismatch.
template <typename T>
T value_cast(const Value& v) {
    return ValueCast<T>::from(v);
}

}  // namespace vt
