// src/common/Compiler.h
//
// Build-wide checking macro for rocketrun, prefixed with ROCKETRUN_ to avoid
// collisions.

#pragma once

// ROCKETRUN_VERIFY is always on. A failed check is a programmer error
// (bad coordinates, corrupt map, resolution-order bug): it is logged at
// critical level and the process aborts.
#include "core/Fatal.h"

#define ROCKETRUN_VERIFY(expr, msg)                                              \
    do {                                                                         \
        if (!(expr)) {                                                           \
            ::rocketrun::core::FatalError(#expr, __FILE__, __LINE__, (msg));     \
        }                                                                        \
    } while (false)
