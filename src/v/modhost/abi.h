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

#include "base/fmt.h"
#include "base/outcome.h"
#include "bytes/bytes.h"
#include "modhost/ffi.h"
#include "modhost/fwd.h"

#include <cstdint>
#include <ostream>
#include <span>
#include <vector>

namespace modhost {

/**
 * How a function's input and output cross the module boundary.
 *
 * scalar_c: a zero terminated string in, fn(ptr) -> ptr, a zero terminated
 * string out.
 *
 * scalar_native: raw bytes in, fn(ptr, len) -> record_ptr, where the record
 * is two little endian u32 words (result_ptr, result_len).
 *
 * columnar_bulk: a serialized columnar message passed exactly like
 * scalar_native, its contents are never inspected here.
 */
enum class convention { scalar_c, scalar_native, columnar_bulk };
std::ostream& operator<<(std::ostream&, convention);

// The function type an export must have to be called with a convention.
ffi::function_type signature_for(convention);

// A region of module memory the current call is responsible for releasing.
struct owned_buffer {
    ffi::ptr offset;
    uint32_t length = 0;

    friend bool operator==(const owned_buffer&, const owned_buffer&)
      = default;
};

/**
 * Encodes call inputs into and decodes call outputs from module memory,
 * only through the broker's primitives.
 */
class abi_adapter {
public:
    explicit abi_adapter(memory_broker* broker)
      : _broker(broker) {}

    // Size of the allocation the encoded payload needs.
    static result<uint32_t> input_size(convention, bytes_view payload);

    result<void> write_input(convention, ffi::ptr, bytes_view payload);

    static std::vector<uint64_t>
    call_parameters(convention, ffi::ptr, bytes_view payload);

    /**
     * Decode the result of a call. Buffers the output occupies are adopted
     * by the broker and appended to owned, even when decoding fails later.
     */
    result<bytes> read_output(
      convention,
      std::span<const uint64_t> results,
      std::vector<owned_buffer>* owned);

private:
    result<bytes> read_c_string(ffi::ptr, std::vector<owned_buffer>*);
    result<bytes> read_native(ffi::ptr, std::vector<owned_buffer>*);
    result<bytes>
    adopt_and_read(ffi::ptr, uint32_t len, std::vector<owned_buffer>*);

    memory_broker* _broker;
};

} // namespace modhost

MODHOST_OSTREAM_FMT(modhost::convention)
