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
#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <absl/hash/hash.h>

#include <string_view>
#include <type_traits>

// Heterogeneous hashing so that sstring keyed absl containers can be probed
// with a std::string_view.
struct sstring_hash {
    using is_transparent = std::true_type;

    size_t operator()(std::string_view v) const {
        return absl::Hash<std::string_view>{}(v);
    }
};

struct sstring_eq {
    using is_transparent = std::true_type;

    bool operator()(std::string_view lhs, std::string_view rhs) const {
        return lhs == rhs;
    }
};
