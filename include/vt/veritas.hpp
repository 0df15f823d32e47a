// Public header for the veritas schema library
#pragma once

#include "vt/collections.h"
#include "vt/discriminated_union.h"
#include "vt/error.h"
#include "vt/function.h"
#include "vt/lazy.h"
#include "vt/modifiers.h"
#include "vt/primitives.h"
#include "vt/unions.h"
