#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "vt/engine.h"
#include "vt/schema.h"

namespace vt {

// Absent input succeeds with an absent placeholder; anything else goes to the inner schema.
template <typename S>
class OptionalSchema : public BasicSchema<OptionalSchema<S> > {
  public:
    using output_type = std::optional<typename S::output_type>;

    explicit OptionalSchema(S inner) : m_inner(std::make_shared<const S>(std::move(inner))) {
        this->m_internals.kind = TypeKind::Optional;
        this->m_internals.optional = true;
        this->m_internals.nilable = m_inner->internals().nilable;
    }

    void run(ParsePayload& payload) const override {
        if (payload.value.isNull()) {
            payload.value = Value::absent(m_inner->valueKind());
            return;
        }
        size_t before = payload.issues.size();
        m_inner->run(payload);
        if (payload.issues.size() == before) run_own_checks(*this, payload);
    }

    TypeKind valueKind() const override { return m_inner->valueKind(); }
    SchemaPtr unwrapped() const override { return m_inner; }
    const S& unwrap() const { return *m_inner; }

  private:
    std::shared_ptr<const S> m_inner;
};

// Like OptionalSchema, but also marks the inner schema nilable so it builds the
// absent placeholder itself wherever it is reached directly.
template <typename S>
class NilableSchema : public BasicSchema<NilableSchema<S> > {
  public:
    using output_type = std::optional<typename S::output_type>;

    explicit NilableSchema(const S& inner)
        : m_inner(std::make_shared<const S>(inner.withInternals([](TypeInternals& in) { in.nilable = true; }))) {
        this->m_internals.kind = TypeKind::Nilable;
        this->m_internals.nilable = true;
    }

    void run(ParsePayload& payload) const override {
        if (payload.value.isNull()) {
            payload.value = Value::absent(m_inner->valueKind());
            return;
        }
        size_t before = payload.issues.size();
        m_inner->run(payload);
        if (payload.issues.size() == before) run_own_checks(*this, payload);
    }

    TypeKind valueKind() const override { return m_inner->valueKind(); }
    SchemaPtr unwrapped() const override { return m_inner; }
    const S& unwrap() const { return *m_inner; }

  private:
    std::shared_ptr<const S> m_inner;
};

// Absent input is replaced before the inner schema runs, so the substitute is validated.
template <typename S>
class DefaultSchema : public BasicSchema<DefaultSchema<S> > {
  public:
    using output_type = typename S::output_type;

    DefaultSchema(S inner, std::function<Value()> factory)
        : m_inner(std::make_shared<const S>(std::move(inner))), m_factory(std::move(factory)) {
        this->m_internals.kind = TypeKind::Default;
    }

    void run(ParsePayload& payload) const override {
        if (payload.value.isNull()) payload.value = m_factory();
        size_t before = payload.issues.size();
        m_inner->run(payload);
        if (payload.issues.size() == before) run_own_checks(*this, payload);
    }

    Value defaultValue() const { return m_factory(); }

    TypeKind valueKind() const override { return m_inner->valueKind(); }
    SchemaPtr unwrapped() const override { return m_inner; }
    const S& unwrap() const { return *m_inner; }

  private:
    std::shared_ptr<const S> m_inner;
    std::function<Value()> m_factory;
};

// The inner schema always runs first; when it fails the fallback is returned as is.
template <typename S>
class PrefaultSchema : public BasicSchema<PrefaultSchema<S> > {
  public:
    using output_type = Value;

    PrefaultSchema(S inner, std::function<Value()> factory)
        : m_inner(std::make_shared<const S>(std::move(inner))), m_factory(std::move(factory)) {
        this->m_internals.kind = TypeKind::Prefault;
    }

    void run(ParsePayload& payload) const override {
        ParsePayload attempt = payload.attempt(payload.value);
        m_inner->run(attempt);
        if (attempt.issues.empty()) {
            payload.value = std::move(attempt.value);
            run_own_checks(*this, payload);
            return;
        }
        payload.value = m_factory();
    }

    TypeKind valueKind() const override { return m_inner->valueKind(); }
    SchemaPtr unwrapped() const override { return m_inner; }
    const S& unwrap() const { return *m_inner; }

  private:
    std::shared_ptr<const S> m_inner;
    std::function<Value()> m_factory;
};

// Second stage of transform(): maps an already validated value to a new one.
class TransformSchema : public BasicSchema<TransformSchema> {
  public:
    using output_type = Value;

    explicit TransformSchema(TransformFn fn);

    void run(ParsePayload& payload) const override;

  private:
    std::shared_ptr<const TransformFn> m_fn;
};

// Output of A feeds B. B never runs when A fails.
template <typename A, typename B>
class PipeSchema : public BasicSchema<PipeSchema<A, B> > {
  public:
    using output_type = typename B::output_type;

    PipeSchema(A in, B out)
        : m_in(std::make_shared<const A>(std::move(in))), m_out(std::make_shared<const B>(std::move(out))) {
        this->m_internals.kind = m_out->kind() == TypeKind::Transform ? TypeKind::Transform : TypeKind::Pipe;
        this->m_internals.optional = m_in->internals().optional;
    }

    void run(ParsePayload& payload) const override {
        size_t before = payload.issues.size();
        m_in->run(payload);
        if (payload.issues.size() != before) return;
        m_out->run(payload);
        if (payload.issues.size() == before) run_own_checks(*this, payload);
    }

    TypeKind valueKind() const override { return m_out->valueKind(); }
    SchemaPtr unwrapped() const override { return m_in; }
    const A& in() const { return *m_in; }
    const B& out() const { return *m_out; }

  private:
    std::shared_ptr<const A> m_in;
    std::shared_ptr<const B> m_out;
};

template <typename Derived>
OptionalSchema<Derived> BasicSchema<Derived>::optional() const {
    return OptionalSchema<Derived>(self());
}

template <typename Derived>
NilableSchema<Derived> BasicSchema<Derived>::nilable() const {
    return NilableSchema<Derived>(self());
}

template <typename Derived>
OptionalSchema<NilableSchema<Derived> > BasicSchema<Derived>::nullish() const {
    return nilable().optional();
}

template <typename Derived>
DefaultSchema<Derived> BasicSchema<Derived>::withDefault(Value v) const {
    return DefaultSchema<Derived>(self(), [v]() { return v; });
}

template <typename Derived>
DefaultSchema<Derived> BasicSchema<Derived>::defaultFunc(std::function<Value()> f) const {
    return DefaultSchema<Derived>(self(), std::move(f));
}

template <typename Derived>
PrefaultSchema<Derived> BasicSchema<Derived>::prefault(Value v) const {
    return PrefaultSchema<Derived>(self(), [v]() { return v; });
}

template <typename Derived>
PrefaultSchema<Derived> BasicSchema<Derived>::prefaultFunc(std::function<Value()> f) const {
    return PrefaultSchema<Derived>(self(), std::move(f));
}

template <typename Derived>
PipeSchema<Derived, TransformSchema> BasicSchema<Derived>::transform(TransformFn f) const {
    return PipeSchema<Derived, TransformSchema>(self(), TransformSchema(std::move(f)));
}

template <typename Derived>
template <typename Out>
PipeSchema<Derived, Out> BasicSchema<Derived>::pipe(Out out) const {
    return PipeSchema<Derived, Out>(self(), std::move(out));
}

}  // namespace vt
