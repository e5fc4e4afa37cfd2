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
#include "base/seastarx.h"
#include "base/units.h"
#include "bytes/bytes.h"
#include "utils/named_type.h"

#include <cstdint>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

namespace modhost::ffi {

// An offset into a module's linear memory.
using ptr = named_type<uint32_t, struct ptr_tag>;

template<typename T>
using array = std::span<T>;

// WebAssembly linear memory grows in units of this size.
constexpr size_t page_size = 64_KiB;

/**
 * Writes fixed width little endian values into a host buffer.
 */
class writer {
public:
    explicit writer(array<uint8_t>);
    writer(const writer&) = delete;
    writer& operator=(const writer&) = delete;
    writer(writer&&) = default;
    writer& operator=(writer&&) = default;
    ~writer() = default;

    void append(bytes_view);
    void append_byte(uint8_t);

    size_t total() const noexcept { return _offset; };

private:
    void ensure_size(size_t);
    array<uint8_t> slice_remainder();

    array<uint8_t> _output;
    size_t _offset{0};
};

/**
 * Reads fixed width little endian values out of a host buffer.
 *
 * Throws std::out_of_range when reading past the end of the input.
 */
class reader {
public:
    explicit reader(array<const uint8_t>);
    reader(const reader&) = delete;
    reader& operator=(const reader&) = delete;
    reader(reader&&) = default;
    reader& operator=(reader&&) = default;
    ~reader() = default;

    uint32_t read_uint32();

private:
    array<const uint8_t> slice_remainder() const;

    array<const uint8_t> _input;
    size_t _offset{0};
};

/**
 * A view of guest memory from the host.
 */
class memory {
public:
    memory() = default;
    virtual ~memory() = default;
    memory(const memory&) = delete;
    memory& operator=(const memory&) = delete;
    memory(memory&&) = default;
    memory& operator=(memory&&) = default;

    /*
     * Returns the host pointer for a given guest ptr and length.
     *
     * Throws modhost_exception (out_of_bounds) if out of bounds.
     */
    virtual void* translate_raw(ptr guest_ptr, uint32_t len) = 0;

    /**
     * Convert a guest pointer into an array of items in host memory.
     *
     * Will throw if the memory is out of bounds of the guest memory.
     */
    template<typename T>
    ffi::array<T> translate_array(ptr guest_ptr, uint32_t len) {
        void* ptr = translate_raw(guest_ptr, len * sizeof(T));
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return ffi::array<T>(reinterpret_cast<T*>(ptr), len);
    }
};

// Only i32 and i64 cross the host boundary, the rest describe exports.
enum class val_type { i32, i64, f32, f64, ref };
std::ostream& operator<<(std::ostream& o, val_type vt);

// The parameter and result types of a WebAssembly function.
struct function_type {
    std::vector<val_type> params;
    std::vector<val_type> results;

    friend bool operator==(const function_type&, const function_type&)
      = default;
    friend std::ostream& operator<<(std::ostream&, const function_type&);
};

} // namespace modhost::ffi

MODHOST_OSTREAM_FMT(modhost::ffi::val_type)
MODHOST_OSTREAM_FMT(modhost::ffi::function_type)
