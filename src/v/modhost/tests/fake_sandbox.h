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
#include "modhost/module_instance.h"
#include "modhost/sandbox.h"

#include <seastar/core/sstring.hh>

#include <absl/container/btree_map.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

/**
 * An in process sandbox engine for tests. Modules are described in C++:
 * their exports are host functions operating on a byte vector linear memory
 * and a first fit allocator placed above a fixed heap base.
 */
namespace modhost::testing {

class fake_instance;

using native_fn = std::function<std::vector<uint64_t>(
  fake_instance&, std::span<const uint64_t>)>;

struct fake_export {
    ffi::function_type signature;
    native_fn fn;
};

enum class allocator_behavior {
    // Place allocations first fit, 0 when nothing fits.
    first_fit,
    // Hand back an offset past the end of memory.
    out_of_range,
    // Hand back the same offset every time.
    always_same,
    // Trap on every allocation.
    trap,
};

struct fake_module_def {
    uint32_t initial_pages = 1;
    // Declared maximum of the memory, growth beyond it is refused.
    std::optional<uint32_t> max_pages;
    bool export_memory = true;
    bool trap_on_start = false;
    allocator_behavior allocator = allocator_behavior::first_fit;
    std::vector<sandbox::module_import> imports;
    std::map<ss::sstring, fake_export> functions;
};

// Allocations start here, the bytes below stand in for data segments.
constexpr uint32_t fake_heap_base = 1024;

fake_export allocate_export();
// The status variant returns 0 on success and -1 for unknown pointers.
fake_export deallocate_export(bool returns_status = true);

// Memory, allocate and deallocate and nothing else.
fake_module_def allocator_module_def();

/**
 * The standard test module. Besides allocate and deallocate it exports:
 *
 *   answer                     () -> i32, returns 42
 *   c_format_hello_world       scalar_c "Hello World, <name>!"
 *   native_format_hello_world  scalar_native "Hello World, <name>!"
 *   columnar_hello_world       columnar_bulk, adds a "result" column
 *   trap / c_trap              trap in either convention
 *   null_result                returns a null pointer
 *   empty_result               returns a record with a zero length
 *   out_of_bounds_result       returns a record pointing past the region
 *   garbage_columnar           returns bytes that are not a columnar message
 *   unterminated               scalar_c, returns a string without terminator
 */
fake_module_def hello_module_def();

ss::sstring hello_world(std::string_view name);

class fake_memory final : public sandbox::linear_memory {
public:
    fake_memory(uint32_t initial_pages, std::optional<uint32_t> max_pages);

    void* translate_raw(ffi::ptr guest_ptr, uint32_t len) final;
    size_t size_bytes() const final { return _data.size(); }
    bool grow(uint32_t delta_pages) final;

    void refuse_growth(bool refuse) { _refuse_growth = refuse; }

private:
    std::vector<uint8_t> _data;
    std::optional<uint32_t> _max_pages;
    bool _refuse_growth = false;
};

class fake_instance final : public sandbox::instance {
public:
    fake_instance(
      std::shared_ptr<const fake_module_def>,
      std::optional<uint32_t> max_pages);

    fake_memory* memory() final { return &_memory; }

    std::vector<uint64_t>
    call(std::string_view function, std::span<const uint64_t> params) final;

    // The exported allocator, 0 when the request does not fit.
    uint32_t allocate(uint32_t len);
    int32_t deallocate(uint32_t ptr);
    // What the module's own code uses, grows memory when needed.
    uint32_t module_allocate(uint32_t len);

    bytes read(uint32_t ptr, uint32_t len);
    ss::sstring read_c_string(uint32_t ptr);
    void write(uint32_t ptr, bytes_view data);
    // Allocates and writes a (ptr, len) record for a native result.
    uint32_t write_result_record(uint32_t ptr, uint32_t len);

    size_t calls(std::string_view function) const;
    size_t module_allocations() const { return _allocations.size(); }

private:
    std::shared_ptr<const fake_module_def> _def;
    fake_memory _memory;
    absl::btree_map<uint32_t, uint32_t> _allocations;
    std::map<ss::sstring, size_t> _calls;
};

class fake_module final : public sandbox::module {
public:
    explicit fake_module(std::shared_ptr<const fake_module_def>);

    const sandbox::module_declarations& declarations() const final {
        return _declarations;
    }

    std::unique_ptr<sandbox::instance>
    instantiate(const sandbox::instance_options&) final;

    size_t instantiations() const;
    std::optional<sandbox::instance_options> last_options() const;

private:
    std::shared_ptr<const fake_module_def> _def;
    sandbox::module_declarations _declarations;
    mutable std::mutex _mu;
    size_t _instantiations = 0;
    std::optional<sandbox::instance_options> _last_options;
};

class fake_engine final : public sandbox::engine {
public:
    // The binary of a fake module is its name.
    void add_module(ss::sstring name, fake_module_def def);
    static bytes binary(std::string_view name) {
        return bytes::from_string(name);
    }

    std::shared_ptr<sandbox::module> compile(bytes_view binary) final;

    // Runs at the start of every compile.
    void on_compile(std::function<void()> fn) { _on_compile = std::move(fn); }

    size_t compilations() const;
    // The most recent module compiled from the named binary.
    std::shared_ptr<fake_module> compiled(std::string_view name) const;

private:
    std::map<ss::sstring, std::shared_ptr<const fake_module_def>> _modules;
    std::map<ss::sstring, std::shared_ptr<fake_module>> _compiled;
    std::function<void()> _on_compile;
    mutable std::mutex _mu;
    size_t _compilations = 0;
};

/**
 * Instantiates a module definition directly, for tests below the runtime.
 */
std::unique_ptr<fake_instance> make_instance(
  fake_module_def def, std::optional<uint32_t> max_pages = std::nullopt);

struct test_instance {
    std::unique_ptr<module_instance> instance;
    // Owned by instance.
    fake_instance* sandbox = nullptr;
};

test_instance make_module_instance(
  fake_module_def def, std::optional<uint32_t> max_pages = std::nullopt);

} // namespace modhost::testing
