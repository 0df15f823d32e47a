#pragma once

#include <vector>

#include "vt/modifiers.h"
#include "vt/schema.h"

namespace vt {

// Tries members in order against payload; the first success wins and its state
// is kept. On failure every member's issues are returned through branch_issues.
bool try_members(const std::vector<SchemaPtr>& members, ParsePayload& payload,
                 std::vector<std::vector<RawIssue> >& branch_issues);

class UnionSchema : public BasicSchema<UnionSchema> {
  public:
    using output_type = Value;

    explicit UnionSchema(std::vector<SchemaPtr> members);

    void run(ParsePayload& payload) const override;

    std::vector<SchemaPtr> memberSchemas() const override { return m_members; }

  private:
    std::vector<SchemaPtr> m_members;
};

// Both sides must accept the value; their outputs are merged.
class IntersectionSchema : public BasicSchema<IntersectionSchema> {
  public:
    using output_type = Value;

    IntersectionSchema(SchemaPtr left, SchemaPtr right);

    void run(ParsePayload& payload) const override;

    const SchemaPtr& left() const { return m_left; }
    const SchemaPtr& right() const { return m_right; }

  private:
    SchemaPtr m_left;
    SchemaPtr m_right;
};

template <typename... S>
UnionSchema Union(S... members) {
    return UnionSchema({share(std::move(members))...});
}

template <typename L, typename R>
IntersectionSchema Intersection(L left, R right) {
    return IntersectionSchema(share(std::move(left)), share(std::move(right)));
}

}  // namespace vt
