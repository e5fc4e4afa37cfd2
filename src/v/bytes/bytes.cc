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
#include "bytes/bytes.h"

#include <ostream>

std::string_view as_string_view(bytes_view v) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char*>(v.data()), v.size()};
}

ss::sstring to_hex(bytes_view b) {
    static constexpr std::string_view digits{"0123456789abcdef"};
    ss::sstring out = ss::uninitialized_string(b.size() * 2);
    for (size_t i = 0; i != b.size(); ++i) {
        out[i * 2] = digits[b[i] >> 4];
        out[i * 2 + 1] = digits[b[i] & 0xf];
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const bytes& b) {
    return os << to_hex(b);
}
