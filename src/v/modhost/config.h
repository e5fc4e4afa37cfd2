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

#include "base/fmt.h"
#include "base/seastarx.h"
#include "base/units.h"
#include "modhost/capability.h"

#include <seastar/core/sstring.hh>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace modhost {

struct runtime_config {
    // Per instance limit on linear memory pages, unset is unbounded.
    std::optional<uint32_t> max_memory_pages;
    // Fuel given to every call into a module, unset disables fuel metering.
    std::optional<uint64_t> fuel_per_invocation;
    // Maximum stack the guest may use.
    size_t max_wasm_stack = 512_KiB;
    // Spend more time compiling for faster code.
    bool optimize = true;

    friend bool operator==(const runtime_config&, const runtime_config&)
      = default;
    friend std::ostream& operator<<(std::ostream&, const runtime_config&);
};

/**
 * Parse a yaml document into T. Throws YAML::Exception on malformed input
 * or values of the wrong type.
 */
template<typename T>
T parse_yaml(std::string_view doc) {
    return YAML::Load(std::string(doc)).as<T>();
}

} // namespace modhost

MODHOST_OSTREAM_FMT(modhost::runtime_config)

namespace YAML {

template<>
struct convert<ss::sstring> {
    static Node encode(const ss::sstring& rhs) { return Node(rhs.c_str()); }
    static bool decode(const Node& node, ss::sstring& rhs) {
        if (!node.IsScalar()) {
            return false;
        }
        rhs = node.as<std::string>();
        return true;
    }
};

template<typename T>
struct convert<std::optional<T>> {
    using type = std::optional<T>;

    static Node encode(const type& rhs) {
        if (rhs) {
            return Node(*rhs);
        }
        return Node(NodeType::Null);
    }

    static bool decode(const Node& node, type& rhs) {
        if (node && !node.IsNull()) {
            rhs = std::make_optional<T>(node.as<T>());
        } else {
            rhs = std::nullopt;
        }
        return true;
    }
};

template<>
struct convert<modhost::capability> {
    using type = modhost::capability;
    static Node encode(const type& rhs);
    static bool decode(const Node& node, type& rhs);
};

template<>
struct convert<modhost::preopened_dir> {
    using type = modhost::preopened_dir;
    static Node encode(const type& rhs);
    static bool decode(const Node& node, type& rhs);
};

template<>
struct convert<modhost::capability_policy> {
    using type = modhost::capability_policy;
    static Node encode(const type& rhs);
    static bool decode(const Node& node, type& rhs);
};

template<>
struct convert<modhost::runtime_config> {
    using type = modhost::runtime_config;
    static Node encode(const type& rhs);
    static bool decode(const Node& node, type& rhs);
};

} // namespace YAML
