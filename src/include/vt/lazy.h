#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

#include "vt/modifiers.h"
#include "vt/schema.h"

namespace vt {

// Defers building a schema until it is first needed, so schemas can refer to
// themselves. The getter runs at most once; copies share the result.
class LazySchema : public BasicSchema<LazySchema> {
  public:
    using output_type = Value;
    using Getter = std::function<SchemaPtr()>;

    explicit LazySchema(Getter getter);

    void run(ParsePayload& payload) const override;

    // Forces resolution. Returns nullptr when the getter failed.
    SchemaPtr resolve() const;
    bool resolved() const;
    // Why resolution failed, empty when it has not.
    std::string failure() const;

    SchemaPtr unwrapped() const override { return resolve(); }

  private:
    struct Pending {};
    struct Resolved {
        SchemaPtr schema;
    };
    struct Failed {
        std::string reason;
    };
    struct State {
        Getter getter;
        std::once_flag once;
        std::variant<Pending, Resolved, Failed> slot;
        // set after the slot is written, read without forcing
        std::atomic<bool> done{false};
    };

    std::shared_ptr<State> m_state;
};

inline LazySchema Lazy(LazySchema::Getter getter) { return LazySchema(std::move(getter)); }

}  // namespace vt
