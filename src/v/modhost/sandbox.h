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
#include "bytes/bytes.h"
#include "modhost/capability.h"
#include "modhost/ffi.h"

#include <seastar/core/sstring.hh>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

/**
 * The seam between the host and the engine that compiles and executes
 * module binaries. The engine owns verification and instruction level
 * sandboxing, everything above this interface only sees offsets into the
 * module's linear memory and raw call values.
 *
 * Engines report failures by throwing modhost_exception.
 */
namespace modhost::sandbox {

enum class extern_kind { function, memory, table, global };
std::ostream& operator<<(std::ostream&, extern_kind);

struct module_import {
    ss::sstring module_name;
    ss::sstring item_name;
    extern_kind kind = extern_kind::function;

    friend bool operator==(const module_import&, const module_import&)
      = default;
};

struct module_export {
    ss::sstring item_name;
    extern_kind kind = extern_kind::function;
    // Only set for functions.
    ffi::function_type signature;

    friend bool operator==(const module_export&, const module_export&)
      = default;
};

struct module_declarations {
    std::vector<module_import> imports;
    std::vector<module_export> exports;

    const module_export* find_export(std::string_view name) const;
};

/**
 * The linear memory of a single instance.
 */
class linear_memory : public ffi::memory {
public:
    linear_memory() = default;
    linear_memory(const linear_memory&) = delete;
    linear_memory& operator=(const linear_memory&) = delete;
    linear_memory(linear_memory&&) = default;
    linear_memory& operator=(linear_memory&&) = default;
    ~linear_memory() override = default;

    virtual size_t size_bytes() const = 0;

    uint32_t page_count() const { return size_bytes() / ffi::page_size; }

    /**
     * Grow the memory by a number of pages, returns false if the engine
     * refused (the memory's declared maximum or store limits).
     */
    virtual bool grow(uint32_t delta_pages) = 0;
};

/**
 * A single instantiated module. Not thread safe.
 */
class instance {
public:
    instance() = default;
    instance(const instance&) = delete;
    instance& operator=(const instance&) = delete;
    instance(instance&&) = delete;
    instance& operator=(instance&&) = delete;
    virtual ~instance() = default;

    virtual linear_memory* memory() = 0;

    /**
     * Call an exported function with raw i32/i64 values.
     *
     * Throws modhost_exception with errc::module_trap when the module traps
     * and errc::missing_export when there is no such function.
     */
    virtual std::vector<uint64_t>
    call(std::string_view function, std::span<const uint64_t> params) = 0;
};

struct instance_options {
    capability_policy policy;
    // Upper bound on linear memory pages, unset is no bound.
    std::optional<uint32_t> max_memory_pages;
};

/**
 * A compiled module, instances made from it are independent.
 */
class module {
public:
    module() = default;
    module(const module&) = delete;
    module& operator=(const module&) = delete;
    module(module&&) = delete;
    module& operator=(module&&) = delete;
    virtual ~module() = default;

    virtual const module_declarations& declarations() const = 0;

    /**
     * Throws modhost_exception with errc::invalid_binary if the module cannot
     * be instantiated.
     */
    virtual std::unique_ptr<instance> instantiate(const instance_options&) = 0;
};

class engine {
public:
    engine() = default;
    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;
    engine(engine&&) = delete;
    engine& operator=(engine&&) = delete;
    virtual ~engine() = default;

    /**
     * Throws modhost_exception with errc::invalid_binary if the binary does
     * not validate.
     */
    virtual std::shared_ptr<module> compile(bytes_view binary) = 0;
};

} // namespace modhost::sandbox

MODHOST_OSTREAM_FMT(modhost::sandbox::extern_kind)
