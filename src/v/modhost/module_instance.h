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
#include "modhost/abi.h"
#include "modhost/capability.h"
#include "modhost/memory_broker.h"
#include "modhost/sandbox.h"

#include <seastar/core/sstring.hh>
#include <seastar/util/noncopyable_function.hh>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace modhost {

/**
 * One instantiated module: its linear memory, the broker over it and the
 * capability policy it was instantiated with.
 *
 * Only one call may be in flight at a time, concurrent entry is rejected
 * with errc::instance_busy. Once faulted an instance never runs module code
 * again.
 */
class module_instance {
public:
    using fault_notifier
      = ss::noncopyable_function<void(instance_id, std::string_view reason)>;

    module_instance(
      instance_id,
      std::shared_ptr<sandbox::module>,
      std::unique_ptr<sandbox::instance>,
      capability_policy,
      memory_broker::config);
    module_instance(const module_instance&) = delete;
    module_instance& operator=(const module_instance&) = delete;
    module_instance(module_instance&&) = delete;
    module_instance& operator=(module_instance&&) = delete;
    ~module_instance() = default;

    /**
     * Run fn with the given convention through a new call session.
     */
    result<bytes> call(std::string_view fn, convention, bytes_view payload);

    /**
     * Call an export of type () -> i32, no memory is exchanged.
     */
    result<int32_t> invoke_i32(std::string_view fn);

    /**
     * Invoke an export with raw values, no memory is exchanged. A trap faults
     * the instance.
     */
    result<std::vector<uint64_t>>
    invoke(std::string_view fn, std::span<const uint64_t> params);

    // errc::missing_export unless fn is exported with exactly this type.
    result<void>
    check_export(std::string_view fn, const ffi::function_type&) const;

    void mark_faulted(std::string_view reason);
    bool faulted() const;
    std::optional<ss::sstring> fault_reason() const;

    // Called once, the first time the instance faults.
    void set_fault_notifier(fault_notifier);

    instance_id id() const { return _id; }
    const capability_policy& policy() const { return _policy; }
    memory_broker& broker() { return _broker; }
    const memory_broker& broker() const { return _broker; }

    class busy_guard {
    public:
        explicit busy_guard(module_instance* inst)
          : _inst(inst) {}
        busy_guard(const busy_guard&) = delete;
        busy_guard& operator=(const busy_guard&) = delete;
        busy_guard(busy_guard&& o) noexcept
          : _inst(std::exchange(o._inst, nullptr)) {}
        busy_guard& operator=(busy_guard&&) = delete;
        ~busy_guard() {
            if (_inst) {
                _inst->_busy.store(false, std::memory_order_release);
            }
        }

    private:
        module_instance* _inst;
    };

    /**
     * Claim the instance for one call, std::nullopt if a call is already in
     * flight.
     */
    std::optional<busy_guard> try_enter();

private:
    friend class call_session;

    // invoke() for a caller that already holds the busy guard.
    result<std::vector<uint64_t>>
    invoke_entered(std::string_view fn, std::span<const uint64_t> params);

    instance_id _id;
    std::shared_ptr<sandbox::module> _module;
    std::unique_ptr<sandbox::instance> _instance;
    capability_policy _policy;
    memory_broker _broker;
    std::atomic<bool> _busy{false};

    mutable std::mutex _fault_mu;
    std::optional<ss::sstring> _fault_reason;
    fault_notifier _notifier;
};

} // namespace modhost
