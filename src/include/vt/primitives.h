#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vt/modifiers.h"
#include "vt/schema.h"

namespace vt {

class StringSchema : public BasicSchema<StringSchema> {
  public:
    using output_type = std::string;

    StringSchema();

    void run(ParsePayload& payload) const override;

    StringSchema min(int64_t n, CheckParams params = {}) const { return check(checks::min_length(n, std::move(params))); }
    StringSchema max(int64_t n, CheckParams params = {}) const { return check(checks::max_length(n, std::move(params))); }
    StringSchema length(int64_t n, CheckParams params = {}) const { return check(checks::length(n, std::move(params))); }
    StringSchema nonempty(CheckParams params = {}) const { return min(1, std::move(params)); }
    StringSchema regex(const std::string& pattern, CheckParams params = {}) const {
        return check(checks::regex(pattern, std::move(params)));
    }
    StringSchema startsWith(std::string prefix, CheckParams params = {}) const {
        return check(checks::starts_with(std::move(prefix), std::move(params)));
    }
    StringSchema endsWith(std::string suffix, CheckParams params = {}) const {
        return check(checks::ends_with(std::move(suffix), std::move(params)));
    }
    StringSchema includes(std::string needle, CheckParams params = {}) const {
        return check(checks::includes(std::move(needle), std::move(params)));
    }
};

// Bound checks shared by the integer and float schemas.
template <typename Derived>
class NumericSchema : public BasicSchema<Derived> {
  public:
    Derived min(Value bound, CheckParams params = {}) const {
        return this->check(checks::greater_than(std::move(bound), true, std::move(params)));
    }
    Derived max(Value bound, CheckParams params = {}) const {
        return this->check(checks::less_than(std::move(bound), true, std::move(params)));
    }
    Derived gt(Value bound, CheckParams params = {}) const {
        return this->check(checks::greater_than(std::move(bound), false, std::move(params)));
    }
    Derived lt(Value bound, CheckParams params = {}) const {
        return this->check(checks::less_than(std::move(bound), false, std::move(params)));
    }
    Derived positive(CheckParams params = {}) const { return gt(0, std::move(params)); }
    Derived negative(CheckParams params = {}) const { return lt(0, std::move(params)); }
    Derived nonnegative(CheckParams params = {}) const { return min(0, std::move(params)); }
    Derived nonpositive(CheckParams params = {}) const { return max(0, std::move(params)); }
    Derived multipleOf(Value divisor, CheckParams params = {}) const {
        return this->check(checks::multiple_of(std::move(divisor), std::move(params)));
    }
};

class IntSchema : public NumericSchema<IntSchema> {
  public:
    using output_type = int64_t;

    IntSchema();

    void run(ParsePayload& payload) const override;
};

// Integers are accepted as numbers and returned unchanged.
class FloatSchema : public NumericSchema<FloatSchema> {
  public:
    using output_type = double;

    FloatSchema();

    void run(ParsePayload& payload) const override;
};

class BoolSchema : public BasicSchema<BoolSchema> {
  public:
    using output_type = bool;

    BoolSchema();

    void run(ParsePayload& payload) const override;
};

// Accepts only absent input.
class NilSchema : public BasicSchema<NilSchema> {
  public:
    using output_type = Value;

    NilSchema();

    void run(ParsePayload& payload) const override;
};

// Any and Unknown accept every value, absent input included.
class AnySchema : public BasicSchema<AnySchema> {
  public:
    using output_type = Value;

    explicit AnySchema(TypeKind kind = TypeKind::Any);

    void run(ParsePayload& payload) const override;
};

class NeverSchema : public BasicSchema<NeverSchema> {
  public:
    using output_type = Value;

    NeverSchema();

    void run(ParsePayload& payload) const override;
};

class LiteralSchema : public BasicSchema<LiteralSchema> {
  public:
    using output_type = Value;

    explicit LiteralSchema(std::vector<Value> values);

    void run(ParsePayload& payload) const override;

    const std::vector<Value>& values() const { return m_internals.values; }
};

class EnumSchema : public BasicSchema<EnumSchema> {
  public:
    using output_type = std::string;

    explicit EnumSchema(std::vector<std::string> options);

    void run(ParsePayload& payload) const override;

    std::vector<std::string> options() const;
    // Throws SchemaDefinitionError for an option this enum does not have.
    EnumSchema extract(const std::vector<std::string>& keep) const;
    EnumSchema exclude(const std::vector<std::string>& drop) const;
};

inline StringSchema String() { return StringSchema(); }
inline IntSchema Int() { return IntSchema(); }
inline FloatSchema Float() { return FloatSchema(); }
inline BoolSchema Bool() { return BoolSchema(); }
inline NilSchema Nil() { return NilSchema(); }
inline AnySchema Any() { return AnySchema(TypeKind::Any); }
inline AnySchema Unknown() { return AnySchema(TypeKind::Unknown); }
inline NeverSchema Never() { return NeverSchema(); }
inline LiteralSchema Literal(Value v) { return LiteralSchema({std::move(v)}); }
inline LiteralSchema Literal(std::vector<Value> values) { return LiteralSchema(std::move(values)); }
inline EnumSchema Enum(std::vector<std::string> options) { return EnumSchema(std::move(options)); }

}  // namespace vt
