#include "vt/value.h"

#include <cstdlib>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace vt {

std::string to_string(TypeKind kind) {
    switch (kind) {
        case TypeKind::String:
            return "string";
        case TypeKind::Integer:
            return "integer";
        case TypeKind::Float:
            return "number";
        case TypeKind::Bool:
            return "boolean";
        case TypeKind::Nil:
            return "null";
        case TypeKind::Any:
            return "any";
        case TypeKind::Unknown:
            return "unknown";
        case TypeKind::Never:
            return "never";
        case TypeKind::Literal:
            return "literal";
        case TypeKind::Enum:
            return "enum";
        case TypeKind::Array:
            return "array";
        case TypeKind::Record:
            return "record";
        case TypeKind::Object:
            return "object";
        case TypeKind::Union:
            return "union";
        case TypeKind::Intersection:
            return "intersection";
        case TypeKind::DiscriminatedUnion:
            return "discriminated_union";
        case TypeKind::Lazy:
            return "lazy";
        case TypeKind::Function:
            return "function";
        case TypeKind::Optional:
            return "optional";
        case TypeKind::Nilable:
            return "nilable";
        case TypeKind::Default:
            return "default";
        case TypeKind::Prefault:
            return "prefault";
        case TypeKind::Transform:
            return "transform";
        case TypeKind::Pipe:
            return "pipe";
    }
    return "unknown";
}

const Value& Value::deref() const {
    const Value* cur = this;
    // a reference can be made to point back at itself
    std::set<const Value*> seen;
    while (cur->my_type == Reference) {
        if (!seen.insert(cur).second) throw std::logic_error("reference chain loops back on itself");
        cur = cur->m_ref.get();
    }
    return *cur;
}

const Value& Value::at(const std::string& key) const {
    if (my_type == Object) {
        auto it = m_object.find(key);
        if (it != m_object.end()) return it->second;
    }
    std::ostringstream ss;
    ss << "Could not find key <" << key << "> available options are: ";
    bool first = true;
    for (auto const& p : m_object) {
        if (!first) ss << ",";
        first = false;
        ss << '"' << p.first << '"';
    }
    throw std::out_of_range(ss.str());
}

Value& Value::at(const std::string& key) {
    return const_cast<Value&>(static_cast<const Value&>(*this).at(key));
}

const Value& Value::at(int index) const {
    if (my_type != Array) throw std::logic_error("Not a list");
    if (index < 0) throw std::logic_error("Negative index");
    if (static_cast<size_t>(index) >= m_array.size()) {
        throw std::out_of_range("index " + std::to_string(index) + " out of range for list of size " +
                                std::to_string(m_array.size()));
    }
    return m_array[static_cast<size_t>(index)];
}

Value& Value::at(int index) { return const_cast<Value&>(static_cast<const Value&>(*this).at(index)); }

std::string Value::typeName() const {
    switch (my_type) {
        case Null:
            return "null";
        case Boolean:
            return "boolean";
        case Integer:
            return "integer";
        case Double:
            return "number";
        case String:
            return "string";
        case Array:
            return "array";
        case Object:
            return "object";
        case Reference:
            return deref().typeName();
        case Function:
            return "function";
    }
    return "unknown";
}

static std::string escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                result.push_back(c);
                break;
        }
    }
    result.push_back('"');
    return result;
}

std::string format_double(double x) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::digits10) << x;
    // fall back to the full width when the short form does not read back exactly
    if (std::strtod(out.str().c_str(), nullptr) != x) {
        out.str("");
        out << std::setprecision(std::numeric_limits<double>::max_digits10) << x;
    }
    return out.str();
}

static void dump_into(const Value& v, std::ostringstream& out, std::set<const Value*>& open) {
    switch (v.type()) {
        case Value::Null:
            out << "null";
            return;
        case Value::Boolean:
            out << (v.asBool() ? "true" : "false");
            return;
        case Value::Integer:
            out << v.asInt();
            return;
        case Value::Double:
            out << format_double(v.asDouble());
            return;
        case Value::String:
            out << escape_string(v.asString());
            return;
        case Value::Array: {
            out << '[';
            bool first = true;
            for (auto const& el : v.asArray()) {
                if (!first) out << ",";
                first = false;
                dump_into(el, out, open);
            }
            out << ']';
            return;
        }
        case Value::Object: {
            out << '{';
            bool first = true;
            for (auto const& p : v.asObject()) {
                if (!first) out << ",";
                first = false;
                out << escape_string(p.first) << ':';
                dump_into(p.second, out, open);
            }
            out << '}';
            return;
        }
        case Value::Reference: {
            const Value* target = v.referent().get();
            if (open.count(target)) {
                out << "<cycle>";
                return;
            }
            open.insert(target);
            out << '&';
            dump_into(*target, out, open);
            open.erase(target);
            return;
        }
        case Value::Function:
            out << "<function>";
            return;
    }
}

std::string Value::dump() const {
    std::ostringstream out;
    std::set<const Value*> open;
    dump_into(*this, out, open);
    return out.str();
}

bool Value::operator==(const Value& rhs) const {
    if (my_type != rhs.my_type) return false;
    switch (my_type) {
        case Null:
            return true;
        case Boolean:
            return m_bool == rhs.m_bool;
        case Integer:
            return m_int == rhs.m_int;
        case Double:
            return m_double == rhs.m_double;
        case String:
            return m_string == rhs.m_string;
        case Array:
            return m_array == rhs.m_array;
        case Object:
            return m_object == rhs.m_object;
        case Reference:
            return m_ref == rhs.m_ref;
        case Function:
            return m_fn == rhs.m_fn;
    }
    return false;
}

}  // namespace vt
