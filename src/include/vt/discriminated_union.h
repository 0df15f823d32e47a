#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "vt/modifiers.h"
#include "vt/schema.h"

namespace vt {

// Union that picks its member by the value of one field. The value to member
// map is built once, when the schema is constructed.
class DiscriminatedUnionSchema : public BasicSchema<DiscriminatedUnionSchema> {
  public:
    using output_type = Value;

    // Throws SchemaDefinitionError when a member declares no literal value for
    // the discriminator, or when two members claim the same value.
    DiscriminatedUnionSchema(std::string discriminator, std::vector<SchemaPtr> members);

    void run(ParsePayload& payload) const override;

    const std::string& discriminator() const { return m_discriminator; }
    // (value, member) pairs in member order.
    const std::vector<std::pair<Value, SchemaPtr> >& discriminatorMap() const { return m_entries; }
    std::vector<SchemaPtr> memberSchemas() const override { return m_members; }

    // With fallback on, an absent or unknown discriminator tries every member in order.
    DiscriminatedUnionSchema fallback(bool on = true) const {
        DiscriminatedUnionSchema copy = *this;
        copy.m_fallback = on;
        return copy;
    }
    bool hasFallback() const { return m_fallback; }

  private:
    void undispatched(ParsePayload& payload, const std::string& why) const;

    std::string m_discriminator;
    std::vector<SchemaPtr> m_members;
    std::vector<std::pair<Value, SchemaPtr> > m_entries;
    // Value::dump() of each discriminator value, to its index in m_entries
    std::map<std::string, size_t> m_index;
    bool m_fallback = false;
};

// Legal values a schema declares for field key, looking through wrappers,
// unions and nested discriminated unions.
std::vector<Value> discriminator_values(const Schema& schema, const std::string& key);

template <typename... S>
DiscriminatedUnionSchema DiscriminatedUnion(std::string discriminator, S... members) {
    return DiscriminatedUnionSchema(std::move(discriminator), {share(std::move(members))...});
}

}  // namespace vt
