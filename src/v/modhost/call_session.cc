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

#include "base/vassert.h"
#include "base/vlog.h"
#include "modhost/errc.h"
#include "modhost/logger.h"
#include "modhost/module_instance.h"

namespace modhost {

std::ostream& operator<<(std::ostream& o, session_state s) {
    switch (s) {
    case session_state::idle:
        return o << "idle";
    case session_state::allocating:
        return o << "allocating";
    case session_state::writing:
        return o << "writing";
    case session_state::invoking:
        return o << "invoking";
    case session_state::reading:
        return o << "reading";
    case session_state::releasing:
        return o << "releasing";
    case session_state::done:
        return o << "done";
    case session_state::failed:
        return o << "failed";
    }
    return o << "unknown";
}

call_session::call_session(
  module_instance* instance, ss::sstring function, convention c)
  : _instance(instance)
  , _descriptor{.function = std::move(function), .conv = c} {}

result<bytes> call_session::run(bytes_view payload) {
    vassert(
      _state == session_state::idle,
      "call session for {} run twice (state: {})",
      _descriptor.function,
      _state);
    if (_instance->faulted()) {
        vlog(
          modhost_log.debug,
          "instance {} is faulted, refusing call to {}",
          _instance->id(),
          _descriptor.function);
        return fail(errc::module_trap);
    }
    auto guard = _instance->try_enter();
    if (!guard) {
        return fail(errc::instance_busy);
    }
    auto checked = _instance->check_export(
      _descriptor.function, signature_for(_descriptor.conv));
    if (checked.has_error()) {
        return fail(checked.error());
    }

    abi_adapter adapter(&_instance->broker());

    transition(session_state::allocating);
    auto size = abi_adapter::input_size(_descriptor.conv, payload);
    if (size.has_error()) {
        return fail(size.error());
    }
    auto input = _instance->broker().acquire(size.value());
    if (input.has_error()) {
        return abort(input.error());
    }
    _descriptor.owned.push_back(
      {.offset = input.value(), .length = size.value()});

    transition(session_state::writing);
    auto written = adapter.write_input(
      _descriptor.conv, input.value(), payload);
    if (written.has_error()) {
        return abort(written.error());
    }

    transition(session_state::invoking);
    auto params = abi_adapter::call_parameters(
      _descriptor.conv, input.value(), payload);
    auto results = _instance->invoke_entered(_descriptor.function, params);
    if (results.has_error()) {
        if (results.error() == errc::module_trap) {
            return abort_after_trap();
        }
        return abort(results.error());
    }

    transition(session_state::reading);
    auto output = adapter.read_output(
      _descriptor.conv, results.value(), &_descriptor.owned);
    if (output.has_error()) {
        return abort(output.error());
    }

    transition(session_state::releasing);
    auto released = release_owned();
    if (released.has_error()) {
        return abort(released.error());
    }
    transition(session_state::done);
    return std::move(output).value();
}

void call_session::transition(session_state next) {
    vlog(
      modhost_log.trace,
      "instance {} call {}: {} -> {}",
      _instance->id(),
      _descriptor.function,
      _state,
      next);
    _state = next;
}

std::error_code call_session::fail(std::error_code ec) {
    if (ec == errc::module_trap) {
        _instance->mark_faulted(
          ss::format("trap during call to {}", _descriptor.function));
    }
    transition(session_state::failed);
    return ec;
}

result<void> call_session::release_owned() {
    // Input first, then outputs in the order they were read.
    while (!_descriptor.owned.empty()) {
        owned_buffer buf = _descriptor.owned.front();
        _descriptor.owned.erase(_descriptor.owned.begin());
        auto released = _instance->broker().release(buf.offset, buf.length);
        if (released.has_error()) {
            return released.error();
        }
    }
    return outcome::success();
}

std::error_code call_session::abort(std::error_code ec) {
    vlog(
      modhost_log.debug,
      "instance {} call {} failed in state {}: {}",
      _instance->id(),
      _descriptor.function,
      _state,
      ec.message());
    // A trapped allocator must not be entered again.
    if (ec != errc::module_trap) {
        for (const auto& buf : _descriptor.owned) {
            if (!_instance->broker().validate(buf.offset, buf.length)) {
                continue;
            }
            auto released = _instance->broker().release(buf.offset, buf.length);
            if (released.has_error()) {
                if (released.error() == errc::module_trap) {
                    // Nothing more goes back to a trapped allocator.
                    _instance->mark_faulted(ss::format(
                      "trap releasing {} bytes at {} after failed call to {}",
                      buf.length,
                      buf.offset,
                      _descriptor.function));
                    break;
                }
                vlog(
                  modhost_log.warn,
                  "instance {} unable to release {} bytes at {} after failed "
                  "call {}: {}",
                  _instance->id(),
                  buf.length,
                  buf.offset,
                  _descriptor.function,
                  released.error().message());
            }
        }
    }
    _descriptor.owned.clear();
    return fail(ec);
}

std::error_code call_session::abort_after_trap() {
    // The output is never looked at, only the input is ours to return.
    vassert(
      _descriptor.owned.size() == 1,
      "expected only the input allocation after invoking, have {}",
      _descriptor.owned.size());
    owned_buffer input = _descriptor.owned.front();
    _descriptor.owned.clear();
    auto released = _instance->broker().release(input.offset, input.length);
    if (released.has_error()) {
        vlog(
          modhost_log.warn,
          "instance {} unable to release input of trapped call {}: {}",
          _instance->id(),
          _descriptor.function,
          released.error().message());
    }
    return fail(errc::module_trap);
}

} // namespace modhost
