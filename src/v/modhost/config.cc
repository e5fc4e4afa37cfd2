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
#include "modhost/config.h"

namespace modhost {

std::ostream& operator<<(std::ostream& o, const runtime_config& c) {
    o << "{max_memory_pages: ";
    if (c.max_memory_pages) {
        o << *c.max_memory_pages;
    } else {
        o << "unbounded";
    }
    o << ", fuel_per_invocation: ";
    if (c.fuel_per_invocation) {
        o << *c.fuel_per_invocation;
    } else {
        o << "unmetered";
    }
    return o << ", max_wasm_stack: " << c.max_wasm_stack
             << ", optimize: " << c.optimize << "}";
}

} // namespace modhost

namespace YAML {

Node convert<modhost::capability>::encode(const type& rhs) {
    return Node(std::string(modhost::to_string_view(rhs)));
}

bool convert<modhost::capability>::decode(const Node& node, type& rhs) {
    if (!node.IsScalar()) {
        return false;
    }
    auto parsed = modhost::capability_from_string(node.as<std::string>());
    if (!parsed) {
        return false;
    }
    rhs = *parsed;
    return true;
}

Node convert<modhost::preopened_dir>::encode(const type& rhs) {
    Node node;
    node["host"] = rhs.host_path;
    node["guest"] = rhs.guest_path;
    return node;
}

bool convert<modhost::preopened_dir>::decode(const Node& node, type& rhs) {
    if (!node.IsMap() || !node["host"]) {
        return false;
    }
    rhs.host_path = node["host"].as<ss::sstring>();
    // The guest sees the directory under the host path unless told otherwise.
    rhs.guest_path = node["guest"] ? node["guest"].as<ss::sstring>()
                                   : rhs.host_path;
    return true;
}

Node convert<modhost::capability_policy>::encode(const type& rhs) {
    Node node;
    node["allow"] = Node(NodeType::Sequence);
    for (auto c : rhs.allowed()) {
        node["allow"].push_back(c);
    }
    if (!rhs.preopened_dirs().empty()) {
        for (const auto& dir : rhs.preopened_dirs()) {
            node["preopened_dirs"].push_back(dir);
        }
    }
    return node;
}

bool convert<modhost::capability_policy>::decode(const Node& node, type& rhs) {
    if (!node.IsMap()) {
        return false;
    }
    modhost::capability_policy policy;
    if (auto allow = node["allow"]; allow) {
        if (!allow.IsSequence()) {
            return false;
        }
        for (const auto& c : allow) {
            policy.allow(c.as<modhost::capability>());
        }
    }
    if (auto dirs = node["preopened_dirs"]; dirs) {
        if (!dirs.IsSequence()) {
            return false;
        }
        for (const auto& dir : dirs) {
            policy.preopen(dir.as<modhost::preopened_dir>());
        }
    }
    rhs = std::move(policy);
    return true;
}

Node convert<modhost::runtime_config>::encode(const type& rhs) {
    Node node;
    node["max_memory_pages"] = rhs.max_memory_pages;
    node["fuel_per_invocation"] = rhs.fuel_per_invocation;
    node["max_wasm_stack"] = rhs.max_wasm_stack;
    node["optimize"] = rhs.optimize;
    return node;
}

bool convert<modhost::runtime_config>::decode(const Node& node, type& rhs) {
    if (!node.IsMap()) {
        return false;
    }
    modhost::runtime_config cfg;
    if (node["max_memory_pages"]) {
        cfg.max_memory_pages = node["max_memory_pages"]
                                 .as<std::optional<uint32_t>>();
    }
    if (node["fuel_per_invocation"]) {
        cfg.fuel_per_invocation = node["fuel_per_invocation"]
                                    .as<std::optional<uint64_t>>();
    }
    if (node["max_wasm_stack"]) {
        cfg.max_wasm_stack = node["max_wasm_stack"].as<size_t>();
    }
    if (node["optimize"]) {
        cfg.optimize = node["optimize"].as<bool>();
    }
    rhs = cfg;
    return true;
}

} // namespace YAML
