#pragma once

#include <string>

namespace vt {

// Closed set of schema kinds. Generic code branches on this only where it has to
// know the concrete shape of a schema (absent placeholders, discriminator walks).
enum class TypeKind {
    String,
    Integer,
    Float,
    Bool,
    Nil,
    Any,
    Unknown,
    Never,
    Literal,
    Enum,
    Array,
    Record,
    Object,
    Union,
    Intersection,
    DiscriminatedUnion,
    Lazy,
    Function,
    Optional,
    Nilable,
    Default,
    Prefault,
    Transform,
    Pipe
};

std::string to_string(TypeKind kind);

}  // namespace vt
