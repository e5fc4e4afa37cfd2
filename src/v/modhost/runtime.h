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

#include "base/outcome.h"
#include "base/seastarx.h"
#include "bytes/bytes.h"
#include "modhost/capability.h"
#include "modhost/config.h"
#include "modhost/fwd.h"
#include "modhost/memory_broker.h"

#include <seastar/core/sstring.hh>

#include <atomic>
#include <memory>
#include <string_view>

namespace modhost {

/**
 * A module binary that passed validation. Any number of independent
 * instances can be made from it.
 */
class compiled_module {
public:
    compiled_module(
      runtime* rt, ss::sstring name, std::shared_ptr<sandbox::module> mod);
    compiled_module(const compiled_module&) = delete;
    compiled_module& operator=(const compiled_module&) = delete;
    compiled_module(compiled_module&&) = delete;
    compiled_module& operator=(compiled_module&&) = delete;
    ~compiled_module() = default;

    /**
     * Create a new instance with its own memory and allocation table.
     *
     * Fails with errc::disallowed_capability if an import is outside of the
     * policy, errc::invalid_binary if an import cannot be provided or
     * instantiation fails.
     */
    result<std::unique_ptr<module_instance>> instantiate(capability_policy);

    const ss::sstring& name() const { return _name; }
    const sandbox::module_declarations& declarations() const;

private:
    runtime* _runtime;
    ss::sstring _name;
    std::shared_ptr<sandbox::module> _module;
};

/**
 * Loads module binaries through a sandbox engine.
 */
class runtime {
public:
    runtime(std::unique_ptr<sandbox::engine>, runtime_config);
    runtime(const runtime&) = delete;
    runtime& operator=(const runtime&) = delete;
    runtime(runtime&&) = delete;
    runtime& operator=(runtime&&) = delete;
    ~runtime();

    /**
     * Validate a binary and the fixed exports every module must have:
     *
     *   memory:     the linear memory
     *   allocate:   (i32) -> i32
     *   deallocate: (i32, i32) -> () or (i32, i32) -> i32
     *
     * Fails with errc::invalid_binary.
     */
    result<std::shared_ptr<compiled_module>>
    compile(std::string_view name, bytes_view binary);

    // compile then instantiate.
    result<std::unique_ptr<module_instance>>
    load(std::string_view name, bytes_view binary, capability_policy);

    const runtime_config& config() const { return _config; }

private:
    friend class compiled_module;

    instance_id next_instance_id();

    std::unique_ptr<sandbox::engine> _engine;
    runtime_config _config;
    std::atomic<uint64_t> _next_instance_id{1};
};

} // namespace modhost
