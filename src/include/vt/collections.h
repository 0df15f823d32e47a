#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "vt/modifiers.h"
#include "vt/schema.h"

namespace vt {

class ArraySchema : public BasicSchema<ArraySchema> {
  public:
    using output_type = std::vector<Value>;

    explicit ArraySchema(SchemaPtr element);

    void run(ParsePayload& payload) const override;

    const SchemaPtr& element() const { return m_element; }

    ArraySchema min(int64_t n, CheckParams params = {}) const { return check(checks::min_length(n, std::move(params))); }
    ArraySchema max(int64_t n, CheckParams params = {}) const { return check(checks::max_length(n, std::move(params))); }
    ArraySchema length(int64_t n, CheckParams params = {}) const { return check(checks::length(n, std::move(params))); }
    ArraySchema nonempty(CheckParams params = {}) const { return min(1, std::move(params)); }

  private:
    SchemaPtr m_element;
};

// Objects whose keys all satisfy one schema and whose values all satisfy another.
class RecordSchema : public BasicSchema<RecordSchema> {
  public:
    using output_type = std::map<std::string, Value>;

    RecordSchema(SchemaPtr key, SchemaPtr value);

    void run(ParsePayload& payload) const override;

    const SchemaPtr& keySchema() const { return m_key; }
    const SchemaPtr& valueSchema() const { return m_value; }

  private:
    SchemaPtr m_key;
    SchemaPtr m_value;
};

enum class UnknownKeys { Strip, Strict, Passthrough };

class ObjectSchema : public BasicSchema<ObjectSchema> {
  public:
    using output_type = std::map<std::string, Value>;

    explicit ObjectSchema(std::vector<Field> shape);

    void run(ParsePayload& payload) const override;

    std::vector<Field> shapeFields() const override { return m_shape; }
    const std::vector<Field>& shape() const { return m_shape; }
    SchemaPtr field(const std::string& name) const;

    ObjectSchema strict() const;
    ObjectSchema strip() const;
    ObjectSchema passthrough() const;
    template <typename S>
    ObjectSchema catchall(S schema) const {
        ObjectSchema copy = *this;
        copy.m_catchall = share(std::move(schema));
        return copy;
    }

    // Fields of more replace fields of the same name.
    ObjectSchema extend(std::vector<Field> more) const;
    ObjectSchema pick(const std::vector<std::string>& names) const;
    ObjectSchema omit(const std::vector<std::string>& names) const;
    // Every field made optional.
    ObjectSchema partial() const;

    UnknownKeys unknownKeys() const { return m_unknown; }

  private:
    std::vector<Field> m_shape;
    UnknownKeys m_unknown = UnknownKeys::Strip;
    SchemaPtr m_catchall;
};

template <typename S>
ArraySchema Array(S element) {
    return ArraySchema(share(std::move(element)));
}

template <typename K, typename V>
RecordSchema Record(K key, V value) {
    return RecordSchema(share(std::move(key)), share(std::move(value)));
}

inline ObjectSchema Object(std::vector<Field> shape) { return ObjectSchema(std::move(shape)); }

}  // namespace vt
