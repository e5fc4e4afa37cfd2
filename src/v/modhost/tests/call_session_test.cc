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
#include "modhost/call_session.h"
#include "modhost/errc.h"
#include "modhost/module_instance.h"
#include "modhost/tests/fake_sandbox.h"

#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace modhost {

using namespace testing; // NOLINT

namespace {
const ss::sstring c_hello = "c_format_hello_world";
const ss::sstring native_hello = "native_format_hello_world";

bytes hello_bytes(std::string_view name) {
    return bytes::from_string(hello_world(name));
}
} // namespace

TEST(call_session, scalar_c_call) {
    auto t = make_module_instance(hello_module_def());
    call_session session(t.instance.get(), c_hello, convention::scalar_c);
    EXPECT_EQ(session.state(), session_state::idle);
    auto out = session.run(bytes::from_string("test"));
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out.value(), bytes::from_string("Hello World, test!"));
    EXPECT_EQ(out.value().size(), 18);
    EXPECT_EQ(session.state(), session_state::done);
    EXPECT_TRUE(session.descriptor().owned.empty());
    EXPECT_EQ(t.instance->broker().live_allocations(), 0);
    EXPECT_EQ(t.sandbox->module_allocations(), 0);
}

TEST(call_session, scalar_native_call) {
    auto t = make_module_instance(hello_module_def());
    auto out = t.instance->call(
      native_hello, convention::scalar_native, bytes::from_string("test"));
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out.value(), hello_bytes("test"));
    EXPECT_EQ(t.instance->broker().live_allocations(), 0);
    EXPECT_EQ(t.sandbox->module_allocations(), 0);
    // input, result and record
    EXPECT_EQ(t.sandbox->calls("deallocate"), 3);
}

TEST(call_session, binary_payloads_pass_through_native) {
    auto t = make_module_instance(hello_module_def());
    bytes name{'a', 0, 'b'};
    auto out = t.instance->call(
      native_hello, convention::scalar_native, name);
    ASSERT_TRUE(out.has_value());
    bytes expected = bytes::from_string("Hello World, ");
    for (auto b : name) {
        expected.push_back(b);
    }
    expected.push_back('!');
    EXPECT_EQ(out.value(), expected);
}

TEST(call_session, empty_payloads) {
    auto t = make_module_instance(hello_module_def());
    auto c = t.instance->call(c_hello, convention::scalar_c, {});
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c.value(), hello_bytes(""));
    auto native = t.instance->call(native_hello, convention::scalar_native, {});
    ASSERT_TRUE(native.has_value());
    EXPECT_EQ(native.value(), hello_bytes(""));
    auto empty = t.instance->call(
      "empty_result", convention::scalar_native, bytes::from_string("x"));
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty.value().empty());
    EXPECT_EQ(t.sandbox->module_allocations(), 0);
}

TEST(call_session, repeated_calls_do_not_leak) {
    auto t = make_module_instance(hello_module_def());
    for (int i = 0; i < 1000; ++i) {
        auto name = std::to_string(i);
        auto conv = i % 2 == 0 ? convention::scalar_c
                               : convention::scalar_native;
        auto fn = conv == convention::scalar_c ? c_hello : native_hello;
        auto out = t.instance->call(fn, conv, bytes::from_string(name));
        ASSERT_TRUE(out.has_value());
        ASSERT_EQ(out.value(), hello_bytes(name));
    }
    EXPECT_EQ(t.instance->broker().page_count(), 1);
    EXPECT_EQ(t.instance->broker().live_allocations(), 0);
    EXPECT_EQ(t.sandbox->module_allocations(), 0);
}

TEST(call_session, large_payload_grows_memory) {
    auto t = make_module_instance(hello_module_def());
    std::string name(200 * 1024, 'z');
    auto out = t.instance->call(
      native_hello, convention::scalar_native, bytes::from_string(name));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value().size(), name.size() + 14);
    EXPECT_GT(t.instance->broker().page_count(), 4);
    EXPECT_EQ(t.sandbox->module_allocations(), 0);
}

TEST(call_session, allocation_failure_leaves_instance_usable) {
    auto t = make_module_instance(hello_module_def(), 2);
    std::string name(100 * 1024, 'z');
    call_session session(
      t.instance.get(), native_hello, convention::scalar_native);
    auto out = session.run(bytes::from_string(name));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::allocation_failed);
    EXPECT_EQ(session.state(), session_state::failed);
    EXPECT_FALSE(t.instance->faulted());

    auto ok = t.instance->call(
      native_hello, convention::scalar_native, bytes::from_string("small"));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), hello_bytes("small"));
}

TEST(call_session, trap_faults_the_instance) {
    auto t = make_module_instance(hello_module_def());
    call_session session(t.instance.get(), "trap", convention::scalar_native);
    auto out = session.run(bytes::from_string("test"));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::module_trap);
    EXPECT_EQ(session.state(), session_state::failed);
    EXPECT_TRUE(session.descriptor().owned.empty());
    EXPECT_TRUE(t.instance->faulted());
    ASSERT_TRUE(t.instance->fault_reason().has_value());
    // The input buffer still went back to the module.
    EXPECT_EQ(t.sandbox->module_allocations(), 0);
    EXPECT_EQ(t.instance->broker().live_allocations(), 0);

    auto calls_before = t.sandbox->calls(native_hello);
    auto again = t.instance->call(
      native_hello, convention::scalar_native, bytes::from_string("test"));
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), errc::module_trap);
    EXPECT_EQ(t.sandbox->calls(native_hello), calls_before);

    auto answer = t.instance->invoke_i32("answer");
    ASSERT_TRUE(answer.has_error());
    EXPECT_EQ(answer.error(), errc::module_trap);
    EXPECT_EQ(t.sandbox->calls("answer"), 0);
}

TEST(call_session, scalar_c_trap) {
    auto t = make_module_instance(hello_module_def());
    auto out = t.instance->call(
      "c_trap", convention::scalar_c, bytes::from_string("test"));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::module_trap);
    EXPECT_TRUE(t.instance->faulted());
}

TEST(call_session, trapping_allocator_faults_the_instance) {
    auto def = hello_module_def();
    def.allocator = allocator_behavior::trap;
    auto t = make_module_instance(std::move(def));
    call_session session(t.instance.get(), c_hello, convention::scalar_c);
    auto out = session.run(bytes::from_string("test"));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::module_trap);
    EXPECT_EQ(session.state(), session_state::failed);
    EXPECT_TRUE(t.instance->faulted());
    EXPECT_EQ(t.sandbox->calls(c_hello), 0);
}

TEST(call_session, fault_notifier_runs_once) {
    auto t = make_module_instance(hello_module_def());
    int notified = 0;
    std::optional<instance_id> faulted_id;
    t.instance->set_fault_notifier(
      [&](instance_id id, std::string_view reason) {
          ++notified;
          faulted_id = id;
          EXPECT_FALSE(reason.empty());
      });
    for (int i = 0; i < 3; ++i) {
        auto out = t.instance->call(
          "trap", convention::scalar_native, bytes::from_string("x"));
        EXPECT_EQ(out.error(), errc::module_trap);
    }
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(faulted_id, t.instance->id());
}

TEST(call_session, missing_or_mismatched_export) {
    auto t = make_module_instance(hello_module_def());
    call_session missing(t.instance.get(), "nope", convention::scalar_c);
    auto out = missing.run(bytes::from_string("test"));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::missing_export);
    EXPECT_EQ(missing.state(), session_state::failed);

    auto wrong = t.instance->call(
      c_hello, convention::scalar_native, bytes::from_string("test"));
    ASSERT_TRUE(wrong.has_error());
    EXPECT_EQ(wrong.error(), errc::missing_export);
    EXPECT_FALSE(t.instance->faulted());
    EXPECT_EQ(t.sandbox->calls("allocate"), 0);
}

TEST(call_session, interior_zero_is_rejected_before_allocating) {
    auto t = make_module_instance(hello_module_def());
    auto out = t.instance->call(c_hello, convention::scalar_c, bytes{'a', 0});
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::serialization_error);
    EXPECT_EQ(t.sandbox->calls("allocate"), 0);
    EXPECT_FALSE(t.instance->faulted());
}

TEST(call_session, bad_outputs_release_everything) {
    auto t = make_module_instance(hello_module_def());
    struct bad_output {
        std::string_view fn;
        convention conv;
    };
    for (auto [fn, conv] : {
           bad_output{"null_result", convention::scalar_native},
           bad_output{"out_of_bounds_result", convention::scalar_native},
           bad_output{"unterminated", convention::scalar_c},
         }) {
        call_session session(t.instance.get(), ss::sstring(fn), conv);
        auto out = session.run(bytes::from_string("test"));
        ASSERT_TRUE(out.has_error()) << fn;
        EXPECT_EQ(out.error(), errc::out_of_bounds) << fn;
        EXPECT_EQ(session.state(), session_state::failed);
        EXPECT_TRUE(session.descriptor().owned.empty());
        EXPECT_EQ(t.instance->broker().live_allocations(), 0) << fn;
        EXPECT_EQ(t.sandbox->module_allocations(), 0) << fn;
    }
    EXPECT_FALSE(t.instance->faulted());
}

TEST(call_session, trapping_deallocate_during_cleanup_faults_the_instance) {
    auto def = hello_module_def();
    auto dealloc = deallocate_export();
    dealloc.fn = [](fake_instance&, std::span<const uint64_t>)
      -> std::vector<uint64_t> {
        throw modhost_exception("deallocate trapped", errc::module_trap);
    };
    def.functions.insert_or_assign("deallocate", std::move(dealloc));
    auto t = make_module_instance(std::move(def));

    call_session session(
      t.instance.get(), "null_result", convention::scalar_native);
    auto out = session.run(bytes::from_string("test"));
    ASSERT_TRUE(out.has_error());
    EXPECT_EQ(out.error(), errc::out_of_bounds);
    EXPECT_EQ(session.state(), session_state::failed);
    EXPECT_TRUE(t.instance->faulted());
    EXPECT_EQ(t.sandbox->calls("deallocate"), 1);

    auto calls_before = t.sandbox->calls(native_hello);
    auto again = t.instance->call(
      native_hello, convention::scalar_native, bytes::from_string("test"));
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), errc::module_trap);
    EXPECT_EQ(t.sandbox->calls(native_hello), calls_before);
}

TEST(call_session, concurrent_entry_is_rejected) {
    auto def = hello_module_def();
    module_instance* self = nullptr;
    std::optional<std::error_code> nested;
    def.functions.insert_or_assign(
      "reenter",
      fake_export{
        .signature = signature_for(convention::scalar_native),
        .fn = [&](fake_instance& inst, std::span<const uint64_t>)
          -> std::vector<uint64_t> {
            auto out = self->call(
              native_hello, convention::scalar_native, bytes{'x'});
            nested = out.has_error() ? out.error() : std::error_code{};
            auto i32 = self->invoke_i32("answer");
            EXPECT_EQ(i32.error(), errc::instance_busy);
            return {inst.write_result_record(0, 0)};
        }});
    auto t = make_module_instance(std::move(def));
    self = t.instance.get();
    auto out = t.instance->call(
      "reenter", convention::scalar_native, bytes{'x'});
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(*nested, errc::instance_busy);

    // The guard is released once the outer call returns.
    EXPECT_EQ(t.instance->invoke_i32("answer").value(), 42);
}

TEST(module_instance, invoke_i32) {
    auto t = make_module_instance(hello_module_def());
    auto answer = t.instance->invoke_i32("answer");
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(answer.value(), 42);

    auto wrong = t.instance->invoke_i32(c_hello);
    ASSERT_TRUE(wrong.has_error());
    EXPECT_EQ(wrong.error(), errc::missing_export);
    auto missing = t.instance->invoke_i32("nope");
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), errc::missing_export);
}

TEST(module_instance, invoke_refuses_a_faulted_instance) {
    auto t = make_module_instance(hello_module_def());
    std::array<uint64_t, 0> none{};
    auto answer = t.instance->invoke("answer", none);
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(answer.value(), std::vector<uint64_t>{42});

    std::array<uint64_t, 2> params{fake_heap_base, 0};
    auto trapped = t.instance->invoke("trap", params);
    ASSERT_TRUE(trapped.has_error());
    EXPECT_EQ(trapped.error(), errc::module_trap);
    EXPECT_TRUE(t.instance->faulted());

    auto calls_before = t.sandbox->calls("answer");
    auto again = t.instance->invoke("answer", none);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), errc::module_trap);
    EXPECT_EQ(t.sandbox->calls("answer"), calls_before);
}

TEST(module_instance, invoke_is_rejected_during_a_call) {
    auto def = hello_module_def();
    module_instance* self = nullptr;
    std::optional<std::error_code> nested;
    def.functions.insert_or_assign(
      "reenter_raw",
      fake_export{
        .signature = signature_for(convention::scalar_native),
        .fn = [&](fake_instance& inst, std::span<const uint64_t>)
          -> std::vector<uint64_t> {
            std::array<uint64_t, 0> none{};
            auto out = self->invoke("answer", none);
            nested = out.has_error() ? out.error() : std::error_code{};
            return {inst.write_result_record(0, 0)};
        }});
    auto t = make_module_instance(std::move(def));
    self = t.instance.get();
    auto out = t.instance->call(
      "reenter_raw", convention::scalar_native, bytes{'x'});
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(*nested, errc::instance_busy);
    EXPECT_EQ(t.sandbox->calls("answer"), 0);
}

} // namespace modhost
