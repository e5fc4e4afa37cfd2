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
#include "modhost/module_instance.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "modhost/call_session.h"
#include "modhost/errc.h"
#include "modhost/logger.h"

namespace modhost {

module_instance::module_instance(
  instance_id id,
  std::shared_ptr<sandbox::module> mod,
  std::unique_ptr<sandbox::instance> inst,
  capability_policy policy,
  memory_broker::config broker_config)
  : _id(id)
  , _module(std::move(mod))
  , _instance(std::move(inst))
  , _policy(std::move(policy))
  , _broker(_id, _instance.get(), broker_config) {
    vassert(_module != nullptr, "instance {} without a module", _id);
}

result<bytes>
module_instance::call(std::string_view fn, convention c, bytes_view payload) {
    call_session session(this, ss::sstring(fn), c);
    return session.run(payload);
}

result<int32_t> module_instance::invoke_i32(std::string_view fn) {
    if (faulted()) {
        return errc::module_trap;
    }
    auto guard = try_enter();
    if (!guard) {
        return errc::instance_busy;
    }
    auto checked = check_export(
      fn, {.params = {}, .results = {ffi::val_type::i32}});
    if (checked.has_error()) {
        return checked.error();
    }
    auto results = invoke_entered(fn, {});
    if (results.has_error()) {
        return results.error();
    }
    return static_cast<int32_t>(results.value().front());
}

result<std::vector<uint64_t>>
module_instance::invoke(std::string_view fn, std::span<const uint64_t> params) {
    if (faulted()) {
        return errc::module_trap;
    }
    auto guard = try_enter();
    if (!guard) {
        return errc::instance_busy;
    }
    return invoke_entered(fn, params);
}

result<std::vector<uint64_t>> module_instance::invoke_entered(
  std::string_view fn, std::span<const uint64_t> params) {
    if (faulted()) {
        return errc::module_trap;
    }
    try {
        return _instance->call(fn, params);
    } catch (const modhost_exception& ex) {
        if (ex.error_code() == errc::module_trap) {
            mark_faulted(ex.what());
        } else {
            vlog(
              modhost_log.warn,
              "instance {} call to {} failed: {}",
              _id,
              fn,
              ex.what());
        }
        return ex.error_code();
    }
}

result<void> module_instance::check_export(
  std::string_view fn, const ffi::function_type& expected) const {
    const auto* e = _module->declarations().find_export(fn);
    if (e == nullptr || e->kind != sandbox::extern_kind::function) {
        vlog(modhost_log.debug, "instance {} has no export {}", _id, fn);
        return errc::missing_export;
    }
    if (e->signature != expected) {
        vlog(
          modhost_log.debug,
          "instance {} export {} has type {}, expected {}",
          _id,
          fn,
          e->signature,
          expected);
        return errc::missing_export;
    }
    return outcome::success();
}

void module_instance::mark_faulted(std::string_view reason) {
    fault_notifier notifier;
    {
        std::lock_guard<std::mutex> lock(_fault_mu);
        if (_fault_reason) {
            return;
        }
        _fault_reason.emplace(reason);
        notifier = std::exchange(_notifier, {});
    }
    vlog(modhost_log.warn, "instance {} faulted: {}", _id, reason);
    if (notifier) {
        notifier(_id, reason);
    }
}

bool module_instance::faulted() const {
    std::lock_guard<std::mutex> lock(_fault_mu);
    return _fault_reason.has_value();
}

std::optional<ss::sstring> module_instance::fault_reason() const {
    std::lock_guard<std::mutex> lock(_fault_mu);
    return _fault_reason;
}

void module_instance::set_fault_notifier(fault_notifier notifier) {
    std::lock_guard<std::mutex> lock(_fault_mu);
    _notifier = std::move(notifier);
}

std::optional<module_instance::busy_guard> module_instance::try_enter() {
    bool expected = false;
    if (!_busy.compare_exchange_strong(
          expected, true, std::memory_order_acquire)) {
        return std::nullopt;
    }
    return busy_guard(this);
}

} // namespace modhost
