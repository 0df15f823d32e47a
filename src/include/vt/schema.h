#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "vt/check.h"
#include "vt/checks.h"
#include "vt/context.h"
#include "vt/error.h"
#include "vt/internals.h"
#include "vt/value.h"

namespace vt {

class Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

struct Field;

// Capability every schema implements. Schemas are immutable once built and may
// be shared freely between threads.
class Schema {
  public:
    virtual ~Schema() = default;

    Result<Value> parse(const Value& input, const ParseContext* ctx = nullptr) const;
    Result<Value> parse(const Value& input, const ParseContext& ctx) const { return parse(input, &ctx); }

    // Same as parse() but throws ValidationError.
    Value mustParse(const Value& input, const ParseContext* ctx = nullptr) const;

    // Validates payload.value in place: the output replaces it, issues are appended.
    virtual void run(ParsePayload& payload) const = 0;

    const TypeInternals& internals() const { return m_internals; }
    TypeKind kind() const { return m_internals.kind; }

    // Kind of the value this schema finally produces, seen through wrappers.
    virtual TypeKind valueKind() const { return m_internals.kind; }

    // Introspection for translators and for discriminator extraction.
    virtual std::vector<Field> shapeFields() const;
    virtual std::vector<SchemaPtr> memberSchemas() const { return {}; }
    virtual SchemaPtr unwrapped() const { return nullptr; }

  protected:
    TypeInternals m_internals;
};

inline SchemaPtr share(SchemaPtr s) { return s; }

template <typename S, typename = std::enable_if_t<std::is_base_of<Schema, S>::value> >
SchemaPtr share(S s) {
    return std::make_shared<const S>(std::move(s));
}

struct Field {
    std::string name;
    SchemaPtr schema;

    Field(std::string n, SchemaPtr s) : name(std::move(n)), schema(std::move(s)) {}

    template <typename S, typename = std::enable_if_t<std::is_base_of<Schema, S>::value> >
    Field(std::string n, S s) : name(std::move(n)), schema(share(std::move(s))) {}
};

inline std::vector<Field> Schema::shapeFields() const { return {}; }

// Literal and enum values a schema admits, looking through wrappers and unions.
std::vector<Value> legal_values(const Schema& schema);

using TransformFn = std::function<Value(const Value&, RefinementContext&)>;

template <typename S>
class OptionalSchema;
template <typename S>
class NilableSchema;
template <typename S>
class DefaultSchema;
template <typename S>
class PrefaultSchema;
template <typename A, typename B>
class PipeSchema;
class TransformSchema;

// Modifier methods shared by every concrete schema. Each returns a new schema;
// the receiver is never changed.
template <typename Derived>
class BasicSchema : public Schema {
  public:
    OptionalSchema<Derived> optional() const;
    NilableSchema<Derived> nilable() const;
    OptionalSchema<NilableSchema<Derived> > nullish() const;

    DefaultSchema<Derived> withDefault(Value v) const;
    DefaultSchema<Derived> defaultFunc(std::function<Value()> f) const;
    PrefaultSchema<Derived> prefault(Value v) const;
    PrefaultSchema<Derived> prefaultFunc(std::function<Value()> f) const;

    PipeSchema<Derived, TransformSchema> transform(TransformFn f) const;

    template <typename Out>
    PipeSchema<Derived, Out> pipe(Out out) const;

    Derived check(CheckPtr c) const {
        Derived copy = self();
        copy.m_internals.checks.push_back(std::move(c));
        return copy;
    }

    Derived refine(std::function<bool(const Value&)> pred, CheckParams params = {}) const {
        return check(checks::refine(std::move(pred), std::move(params)));
    }

    Derived superRefine(std::function<void(const Value&, RefinementContext&)> fn) const {
        return check(checks::super_refine(std::move(fn)));
    }

    Derived describe(std::string text) const {
        Derived copy = self();
        copy.m_internals.bag["description"] = std::move(text);
        return copy;
    }

    Derived error(ErrorMap map) const {
        Derived copy = self();
        copy.m_internals.error = std::make_shared<const ErrorMap>(std::move(map));
        return copy;
    }

    Derived error(std::string message) const {
        return error([message](const RawIssue&) { return message; });
    }

    // Accept values convertible to this schema's type.
    Derived coerce() const {
        Derived copy = self();
        copy.m_internals.coerce = true;
        copy.m_internals.bag["coerce"] = true;
        return copy;
    }

    // Copy of this schema with its internals edited.
    Derived withInternals(const std::function<void(TypeInternals&)>& edit) const {
        Derived copy = self();
        edit(copy.m_internals);
        return copy;
    }

    auto parseTyped(const Value& input, const ParseContext* ctx = nullptr) const {
        using T = typename Derived::output_type;
        Result<Value> raw = parse(input, ctx);
        if (!raw.ok()) return Result<T>(raw.error());
        return Result<T>(value_cast<T>(raw.value()));
    }

  protected:
    const Derived& self() const { return static_cast<const Derived&>(*this); }
};

// Type-erased handle so schemas of unknown static type can still take modifiers.
class ErasedSchema : public BasicSchema<ErasedSchema> {
  public:
    using output_type = Value;

    explicit ErasedSchema(SchemaPtr inner);

    void run(ParsePayload& payload) const override;
    TypeKind valueKind() const override { return m_inner->valueKind(); }
    std::vector<Field> shapeFields() const override { return m_inner->shapeFields(); }
    std::vector<SchemaPtr> memberSchemas() const override { return m_inner->memberSchemas(); }
    SchemaPtr unwrapped() const override { return m_inner; }

  private:
    SchemaPtr m_inner;
};

inline ErasedSchema erase(SchemaPtr s) { return ErasedSchema(std::move(s)); }

}  // namespace vt
