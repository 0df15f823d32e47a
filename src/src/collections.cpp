#include "vt/collections.h"

#include <algorithm>
#include <set>

#include "vt/engine.h"

namespace vt {

ArraySchema::ArraySchema(SchemaPtr element) : m_element(std::move(element)) {
    if (!m_element) throw SchemaDefinitionError("array schema has no element schema");
    m_internals.kind = TypeKind::Array;
}

void ArraySchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "array";
    hooks.accepts = [](const Value& v) { return v.isArray(); };
    hooks.descend = [this](ParsePayload& p) {
        const std::vector<Value>& items = p.value.asArray();
        std::vector<Value> out;
        out.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            ParsePayload child = p.child(items[i], static_cast<int64_t>(i));
            m_element->run(child);
            p.absorb(child);
            out.push_back(std::move(child.value));
        }
        p.value = Value(std::move(out));
    };
    parse_with(*this, hooks, payload);
}

RecordSchema::RecordSchema(SchemaPtr key, SchemaPtr value) : m_key(std::move(key)), m_value(std::move(value)) {
    if (!m_key || !m_value) throw SchemaDefinitionError("record schema needs a key and a value schema");
    m_internals.kind = TypeKind::Record;
}

void RecordSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "record";
    hooks.accepts = [](const Value& v) { return v.isObject(); };
    hooks.descend = [this](ParsePayload& p) {
        std::map<std::string, Value> out;
        for (auto const& kv : p.value.asObject()) {
            ParsePayload key = p.child(Value(kv.first), kv.first);
            m_key->run(key);
            if (key.failed()) {
                RawIssue issue;
                issue.code = IssueCode::InvalidKey;
                issue.input = Value(kv.first);
                issue.path = {kv.first};
                issue.properties["origin"] = "record";
                issue.errors.push_back(std::move(key.issues));
                issue.schemaError = m_internals.error;
                p.addIssue(std::move(issue));
                continue;
            }
            const Value& k = key.value.deref();
            std::string name = k.isString() ? k.asString() : k.dump();
            ParsePayload child = p.child(kv.second, kv.first);
            m_value->run(child);
            p.absorb(child);
            out[name] = std::move(child.value);
        }
        p.value = Value(std::move(out));
    };
    parse_with(*this, hooks, payload);
}

ObjectSchema::ObjectSchema(std::vector<Field> shape) : m_shape(std::move(shape)) {
    m_internals.kind = TypeKind::Object;
    std::set<std::string> seen;
    for (auto const& field : m_shape) {
        if (!field.schema) throw SchemaDefinitionError("field '" + field.name + "' has no schema");
        if (!seen.insert(field.name).second) throw SchemaDefinitionError("duplicate field '" + field.name + "'");
    }
}

void ObjectSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "object";
    hooks.accepts = [](const Value& v) { return v.isObject(); };
    hooks.descend = [this](ParsePayload& p) {
        const std::map<std::string, Value>& in = p.value.asObject();
        std::map<std::string, Value> out;
        std::set<std::string> known;
        for (auto const& field : m_shape) {
            known.insert(field.name);
            auto it = in.find(field.name);
            // a missing optional field stays missing
            if (it == in.end() && field.schema->internals().optional) continue;
            ParsePayload child = p.child(it == in.end() ? Value() : it->second, field.name);
            field.schema->run(child);
            p.absorb(child);
            out[field.name] = std::move(child.value);
        }

        std::vector<Value> unrecognized;
        for (auto const& kv : in) {
            if (known.count(kv.first)) continue;
            if (m_catchall) {
                ParsePayload child = p.child(kv.second, kv.first);
                m_catchall->run(child);
                p.absorb(child);
                out[kv.first] = std::move(child.value);
                continue;
            }
            switch (m_unknown) {
                case UnknownKeys::Passthrough:
                    out[kv.first] = kv.second;
                    break;
                case UnknownKeys::Strict:
                    unrecognized.push_back(Value(kv.first));
                    break;
                case UnknownKeys::Strip:
                    break;
            }
        }
        if (!unrecognized.empty()) {
            RawIssue issue;
            issue.code = IssueCode::UnrecognizedKeys;
            issue.input = p.value;
            issue.properties["keys"] = Value::array(std::move(unrecognized));
            issue.schemaError = m_internals.error;
            p.addIssue(std::move(issue));
        }
        p.value = Value(std::move(out));
    };
    parse_with(*this, hooks, payload);
}

SchemaPtr ObjectSchema::field(const std::string& name) const {
    for (auto const& f : m_shape)
        if (f.name == name) return f.schema;
    return nullptr;
}

ObjectSchema ObjectSchema::strict() const {
    ObjectSchema copy = *this;
    copy.m_unknown = UnknownKeys::Strict;
    return copy;
}

ObjectSchema ObjectSchema::strip() const {
    ObjectSchema copy = *this;
    copy.m_unknown = UnknownKeys::Strip;
    return copy;
}

ObjectSchema ObjectSchema::passthrough() const {
    ObjectSchema copy = *this;
    copy.m_unknown = UnknownKeys::Passthrough;
    return copy;
}

ObjectSchema ObjectSchema::extend(std::vector<Field> more) const {
    ObjectSchema copy = *this;
    for (auto& f : more) {
        auto it = std::find_if(copy.m_shape.begin(), copy.m_shape.end(),
                               [&f](const Field& have) { return have.name == f.name; });
        if (it != copy.m_shape.end())
            it->schema = std::move(f.schema);
        else
            copy.m_shape.push_back(std::move(f));
    }
    return copy;
}

static void require_fields(const ObjectSchema& schema, const std::vector<std::string>& names) {
    for (auto const& n : names)
        if (!schema.field(n)) throw SchemaDefinitionError("object has no field '" + n + "'");
}

ObjectSchema ObjectSchema::pick(const std::vector<std::string>& names) const {
    require_fields(*this, names);
    ObjectSchema copy = *this;
    copy.m_shape.clear();
    for (auto const& f : m_shape)
        if (std::find(names.begin(), names.end(), f.name) != names.end()) copy.m_shape.push_back(f);
    return copy;
}

ObjectSchema ObjectSchema::omit(const std::vector<std::string>& names) const {
    require_fields(*this, names);
    ObjectSchema copy = *this;
    copy.m_shape.clear();
    for (auto const& f : m_shape)
        if (std::find(names.begin(), names.end(), f.name) == names.end()) copy.m_shape.push_back(f);
    return copy;
}

ObjectSchema ObjectSchema::partial() const {
    ObjectSchema copy = *this;
    for (auto& f : copy.m_shape) {
        if (f.schema->internals().optional) continue;
        f.schema = share(erase(f.schema).optional());
    }
    return copy;
}

}  // namespace vt
