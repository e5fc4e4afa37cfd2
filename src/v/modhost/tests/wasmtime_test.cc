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
#include "modhost/errc.h"
#include "modhost/module_instance.h"
#include "modhost/runtime.h"
#include "modhost/wasmtime.h"

#include <gtest/gtest.h>

#include <string>

namespace modhost {

namespace {

// A bump allocator that never frees, a greeting in a data segment and the
// hello world functions in both scalar conventions.
constexpr std::string_view hello_wat = R"wat(
(module
  (memory (export "memory") 1)
  (global $heap (mut i32) (i32.const 1024))
  (data (i32.const 16) "Hello World, ")

  (func $allocate (export "allocate") (param $len i32) (result i32)
    (local $ptr i32)
    (local $end i32)
    (local.set $ptr (global.get $heap))
    (local.set $end (i32.add (local.get $ptr) (local.get $len)))
    (if (i32.gt_u
          (local.get $end)
          (i32.mul (memory.size) (i32.const 65536)))
      (then (return (i32.const 0))))
    (global.set $heap
      (i32.and (i32.add (local.get $end) (i32.const 7)) (i32.const -8)))
    (local.get $ptr))

  (func (export "deallocate") (param i32 i32))

  (func $module_allocate (param $len i32) (result i32)
    (local $ptr i32)
    (local.set $ptr (call $allocate (local.get $len)))
    (if (i32.eqz (local.get $ptr))
      (then
        (drop (memory.grow
          (i32.add (i32.shr_u (local.get $len) (i32.const 16)) (i32.const 1))))
        (local.set $ptr (call $allocate (local.get $len)))
        (if (i32.eqz (local.get $ptr)) (then unreachable))))
    (local.get $ptr))

  (func $strlen (param $p i32) (result i32)
    (local $n i32)
    (block $done
      (loop $scan
        (br_if $done
          (i32.eqz (i32.load8_u (i32.add (local.get $p) (local.get $n)))))
        (local.set $n (i32.add (local.get $n) (i32.const 1)))
        (br $scan)))
    (local.get $n))

  ;; "Hello World, " + name + "!", zero terminated when $terminate is set.
  (func $format (param $p i32) (param $len i32) (param $terminate i32)
    (result i32)
    (local $out i32)
    (local.set $out (call $module_allocate
      (i32.add
        (i32.add (local.get $len) (i32.const 14))
        (local.get $terminate))))
    (memory.copy (local.get $out) (i32.const 16) (i32.const 13))
    (memory.copy
      (i32.add (local.get $out) (i32.const 13))
      (local.get $p)
      (local.get $len))
    (i32.store8
      (i32.add (i32.add (local.get $out) (i32.const 13)) (local.get $len))
      (i32.const 33))
    (if (local.get $terminate)
      (then
        (i32.store8
          (i32.add (i32.add (local.get $out) (i32.const 14)) (local.get $len))
          (i32.const 0))))
    (local.get $out))

  (func (export "c_format_hello_world") (param $p i32) (result i32)
    (call $format (local.get $p) (call $strlen (local.get $p)) (i32.const 1)))

  (func (export "native_format_hello_world")
    (param $p i32) (param $len i32) (result i32)
    (local $record i32)
    (local $out i32)
    (local.set $out (call $format (local.get $p) (local.get $len) (i32.const 0)))
    (local.set $record (call $module_allocate (i32.const 8)))
    (i32.store (local.get $record) (local.get $out))
    (i32.store offset=4
      (local.get $record)
      (i32.add (local.get $len) (i32.const 14)))
    (local.get $record))

  (func (export "answer") (result i32) (i32.const 42))

  (func (export "trap") (param i32 i32) (result i32) unreachable)

  (func (export "spin") (result i32)
    (loop $forever (br $forever))
    (i32.const 0))
)
)wat";

constexpr std::string_view fd_write_wat = R"wat(
(module
  (import "wasi_snapshot_preview1" "fd_write"
    (func (param i32 i32 i32 i32) (result i32)))
  (memory (export "memory") 1)
  (func (export "allocate") (param i32) (result i32) (i32.const 0))
  (func (export "deallocate") (param i32 i32))
)
)wat";

constexpr std::string_view path_open_wat = R"wat(
(module
  (import "wasi_snapshot_preview1" "path_open"
    (func (param i32 i32 i32 i32 i32 i64 i64 i32 i32) (result i32)))
  (memory (export "memory") 1)
  (func (export "allocate") (param i32) (result i32) (i32.const 0))
  (func (export "deallocate") (param i32 i32))
)
)wat";

constexpr std::string_view missing_allocate_wat = R"wat(
(module
  (memory (export "memory") 1)
  (func (export "deallocate") (param i32 i32))
)
)wat";

constexpr std::string_view start_trap_wat = R"wat(
(module
  (memory (export "memory") 1)
  (func $start unreachable)
  (start $start)
  (func (export "allocate") (param i32) (result i32) (i32.const 0))
  (func (export "deallocate") (param i32 i32))
)
)wat";

struct wasmtime_fixture {
    explicit wasmtime_fixture(runtime_config cfg = {})
      : rt(wasmtime::create_engine(cfg), cfg) {}

    result<std::unique_ptr<module_instance>>
    load(std::string_view wat, capability_policy policy = {}) {
        auto binary = wasmtime::wat_to_wasm(wat);
        return rt.load("test", binary, std::move(policy));
    }

    runtime rt;
};

} // namespace

TEST(wasmtime, hello_world) {
    wasmtime_fixture f;
    auto inst = f.load(hello_wat);
    ASSERT_TRUE(inst.has_value()) << inst.error().message();
    auto& m = *inst.value();
    EXPECT_EQ(m.broker().page_count(), 1);
    EXPECT_EQ(m.invoke_i32("answer").value(), 42);

    auto c = m.call(
      "c_format_hello_world", convention::scalar_c, bytes::from_string("test"));
    ASSERT_TRUE(c.has_value()) << c.error().message();
    EXPECT_EQ(c.value(), bytes::from_string("Hello World, test!"));
    EXPECT_EQ(c.value().size(), 18);

    auto native = m.call(
      "native_format_hello_world",
      convention::scalar_native,
      bytes::from_string("test"));
    ASSERT_TRUE(native.has_value()) << native.error().message();
    EXPECT_EQ(native.value(), bytes::from_string("Hello World, test!"));
    EXPECT_EQ(m.broker().live_allocations(), 0);
}

TEST(wasmtime, memory_growth) {
    wasmtime_fixture f;
    auto inst = f.load(hello_wat);
    ASSERT_TRUE(inst.has_value());
    std::string name(150 * 1024, 'w');
    auto out = inst.value()->call(
      "native_format_hello_world",
      convention::scalar_native,
      bytes::from_string(name));
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out.value().size(), name.size() + 14);
    EXPECT_GT(inst.value()->broker().page_count(), 3);
}

TEST(wasmtime, memory_limit) {
    wasmtime_fixture f(runtime_config{.max_memory_pages = 2});
    auto inst = f.load(hello_wat);
    ASSERT_TRUE(inst.has_value());
    std::string name(150 * 1024, 'w');
    auto out = inst.value()->call(
      "native_format_hello_world",
      convention::scalar_native,
      bytes::from_string(name));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::allocation_failed);
    EXPECT_FALSE(inst.value()->faulted());
    EXPECT_EQ(inst.value()->invoke_i32("answer").value(), 42);
}

TEST(wasmtime, trap_is_isolated) {
    wasmtime_fixture f;
    auto a = f.load(hello_wat);
    auto b = f.load(hello_wat);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    auto trapped = a.value()->call(
      "trap", convention::scalar_native, bytes::from_string("test"));
    ASSERT_TRUE(trapped.has_error());
    EXPECT_EQ(trapped.error(), errc::module_trap);
    EXPECT_TRUE(a.value()->faulted());
    EXPECT_EQ(a.value()->invoke_i32("answer").error(), errc::module_trap);

    EXPECT_FALSE(b.value()->faulted());
    auto out = b.value()->call(
      "c_format_hello_world", convention::scalar_c, bytes::from_string("b"));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value(), bytes::from_string("Hello World, b!"));
}

TEST(wasmtime, out_of_fuel_traps) {
    wasmtime_fixture f(runtime_config{.fuel_per_invocation = 100000});
    auto inst = f.load(hello_wat);
    ASSERT_TRUE(inst.has_value()) << inst.error().message();
    // Fuel is refilled for every call.
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(inst.value()->invoke_i32("answer").value(), 42);
    }
    auto spun = inst.value()->invoke_i32("spin");
    ASSERT_TRUE(spun.has_error());
    EXPECT_EQ(spun.error(), errc::module_trap);
    EXPECT_TRUE(inst.value()->faulted());
}

TEST(wasmtime, missing_export) {
    wasmtime_fixture f;
    auto inst = f.load(hello_wat);
    ASSERT_TRUE(inst.has_value());
    auto out = inst.value()->call(
      "nope", convention::scalar_c, bytes::from_string("test"));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::missing_export);
    EXPECT_FALSE(inst.value()->faulted());
}

TEST(wasmtime, invalid_binaries) {
    wasmtime_fixture f;
    auto garbage = f.rt.load(
      "garbage", bytes{0xde, 0xad, 0xbe, 0xef}, capability_policy{});
    ASSERT_TRUE(garbage.has_error());
    EXPECT_EQ(garbage.error(), errc::invalid_binary);

    auto missing = f.load(missing_allocate_wat);
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), errc::invalid_binary);

    auto start_trap = f.load(start_trap_wat);
    ASSERT_TRUE(start_trap.has_error());
    EXPECT_EQ(start_trap.error(), errc::invalid_binary);

    try {
        wasmtime::wat_to_wasm("(module (func (export \"broken\"");
        ADD_FAILURE() << "malformed text was accepted";
    } catch (const modhost_exception& ex) {
        EXPECT_EQ(ex.error_code(), errc::invalid_binary);
    }
}

TEST(wasmtime, capabilities) {
    wasmtime_fixture f;
    auto denied = f.load(fd_write_wat);
    ASSERT_TRUE(denied.has_error());
    EXPECT_EQ(denied.error(), errc::disallowed_capability);

    capability_policy stdio;
    stdio.allow(capability::stdio);
    auto allowed = f.load(fd_write_wat, stdio);
    ASSERT_TRUE(allowed.has_value()) << allowed.error().message();

    auto files = f.load(path_open_wat, stdio);
    ASSERT_TRUE(files.has_error());
    EXPECT_EQ(files.error(), errc::disallowed_capability);

    capability_policy filesystem;
    filesystem.allow(capability::filesystem);
    auto with_files = f.load(path_open_wat, filesystem);
    ASSERT_TRUE(with_files.has_value()) << with_files.error().message();
}

} // namespace modhost
