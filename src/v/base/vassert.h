/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#pragma once

#include "base/likely.h"

#include <fmt/format.h>

#include <string>

namespace detail {
[[noreturn]] void vassert_hook(std::string msg);
}

// Checks a host invariant. Failure logs the message with a backtrace and
// traps, it is never used for errors that a module can cause.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define vassert(x, msg, args...)                                               \
    /* NOLINTNEXTLINE(cppcoreguidelines-avoid-do-while) */                     \
    do {                                                                       \
        if (unlikely(!(x))) {                                                  \
            ::detail::vassert_hook(fmt::format(                                \
              "Assert failure: ({}:{}) '{}' " msg,                             \
              __FILE__,                                                        \
              __LINE__,                                                        \
              #x,                                                              \
              ##args));                                                        \
        }                                                                      \
    } while (0)
