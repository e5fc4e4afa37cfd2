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
#include "modhost/sandbox.h"

#include <absl/algorithm/container.h>

namespace modhost::sandbox {

std::ostream& operator<<(std::ostream& o, extern_kind k) {
    switch (k) {
    case extern_kind::function:
        return o << "function";
    case extern_kind::memory:
        return o << "memory";
    case extern_kind::table:
        return o << "table";
    case extern_kind::global:
        return o << "global";
    }
    return o << "unknown";
}

const module_export*
module_declarations::find_export(std::string_view name) const {
    auto it = absl::c_find_if(exports, [name](const module_export& e) {
        return std::string_view(e.item_name) == name;
    });
    return it == exports.end() ? nullptr : &*it;
}

} // namespace modhost::sandbox
