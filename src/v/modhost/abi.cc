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
#include "modhost/abi.h"

#include "base/unreachable.h"
#include "base/vassert.h"
#include "base/vlog.h"
#include "modhost/errc.h"
#include "modhost/logger.h"
#include "modhost/memory_broker.h"

#include <absl/algorithm/container.h>

#include <limits>

namespace modhost {

namespace {
// (result_ptr: u32, result_len: u32)
constexpr uint32_t native_record_size = 2 * sizeof(uint32_t);
} // namespace

std::ostream& operator<<(std::ostream& o, convention c) {
    switch (c) {
    case convention::scalar_c:
        return o << "scalar_c";
    case convention::scalar_native:
        return o << "scalar_native";
    case convention::columnar_bulk:
        return o << "columnar_bulk";
    }
    return o << "unknown";
}

ffi::function_type signature_for(convention c) {
    using ffi::val_type;
    switch (c) {
    case convention::scalar_c:
        return {.params = {val_type::i32}, .results = {val_type::i32}};
    case convention::scalar_native:
    case convention::columnar_bulk:
        return {
          .params = {val_type::i32, val_type::i32},
          .results = {val_type::i32}};
    }
    unreachable();
}

result<uint32_t> abi_adapter::input_size(convention c, bytes_view payload) {
    // One byte is left for the terminator of scalar_c.
    if (payload.size() >= std::numeric_limits<uint32_t>::max()) {
        vlog(
          modhost_log.debug,
          "payload of {} bytes does not fit in module memory",
          payload.size());
        return errc::serialization_error;
    }
    auto size = static_cast<uint32_t>(payload.size());
    switch (c) {
    case convention::scalar_c:
        if (absl::c_linear_search(payload, uint8_t(0))) {
            vlog(
              modhost_log.debug,
              "scalar_c payload contains an interior zero byte");
            return errc::serialization_error;
        }
        return size + 1;
    case convention::scalar_native:
    case convention::columnar_bulk:
        return size;
    }
    unreachable();
}

result<void>
abi_adapter::write_input(convention c, ffi::ptr offset, bytes_view payload) {
    if (c != convention::scalar_c) {
        return _broker->write(offset, payload);
    }
    bytes buf(bytes::initialized_zero{}, payload.size() + 1);
    ffi::writer w(ffi::array<uint8_t>(buf.data(), buf.size()));
    w.append(payload);
    w.append_byte(0);
    return _broker->write(offset, buf);
}

std::vector<uint64_t> abi_adapter::call_parameters(
  convention c, ffi::ptr offset, bytes_view payload) {
    switch (c) {
    case convention::scalar_c:
        return {offset()};
    case convention::scalar_native:
    case convention::columnar_bulk:
        return {offset(), payload.size()};
    }
    unreachable();
}

result<bytes> abi_adapter::read_output(
  convention c,
  std::span<const uint64_t> results,
  std::vector<owned_buffer>* owned) {
    vassert(
      results.size() == 1,
      "{} call returned {} values, expected 1",
      c,
      results.size());
    ffi::ptr out(static_cast<uint32_t>(results.front()));
    if (out == 0) {
        vlog(modhost_log.warn, "{} call returned a null pointer", c);
        return errc::out_of_bounds;
    }
    switch (c) {
    case convention::scalar_c:
        return read_c_string(out, owned);
    case convention::scalar_native:
    case convention::columnar_bulk:
        return read_native(out, owned);
    }
    unreachable();
}

result<bytes>
abi_adapter::read_c_string(ffi::ptr out, std::vector<owned_buffer>* owned) {
    auto len = _broker->find_terminator(out);
    if (len.has_error()) {
        return len.error();
    }
    auto adopted = _broker->adopt(out, len.value() + 1);
    if (adopted.has_error()) {
        return adopted.error();
    }
    owned->push_back({.offset = out, .length = len.value() + 1});
    return _broker->read(out, len.value());
}

result<bytes>
abi_adapter::read_native(ffi::ptr record, std::vector<owned_buffer>* owned) {
    auto raw = adopt_and_read(record, native_record_size, owned);
    if (raw.has_error()) {
        return raw.error();
    }
    ffi::reader r(raw.value());
    ffi::ptr result_ptr(r.read_uint32());
    uint32_t result_len = r.read_uint32();
    if (result_len == 0) {
        return bytes();
    }
    if (result_ptr == 0) {
        vlog(
          modhost_log.warn,
          "result record at {} has a null pointer for {} bytes",
          record,
          result_len);
        return errc::out_of_bounds;
    }
    return adopt_and_read(result_ptr, result_len, owned);
}

result<bytes> abi_adapter::adopt_and_read(
  ffi::ptr offset, uint32_t len, std::vector<owned_buffer>* owned) {
    auto adopted = _broker->adopt(offset, len);
    if (adopted.has_error()) {
        return adopted.error();
    }
    owned->push_back({.offset = offset, .length = len});
    return _broker->read(offset, len);
}

} // namespace modhost
