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
#include "modhost/ffi.h"

#include <seastar/core/byteorder.hh>
#include <seastar/core/print.hh>

#include <algorithm>
#include <stdexcept>

namespace modhost::ffi {

writer::writer(array<uint8_t> buf)
  : _output(buf) {}

void writer::append(bytes_view s) {
    ensure_size(s.size());
    std::copy(s.begin(), s.end(), slice_remainder().begin());
    _offset += s.size();
}
void writer::append_byte(uint8_t v) {
    ensure_size(1);
    _output[_offset++] = v;
}

void writer::ensure_size(size_t size) {
    auto remainder = slice_remainder();
    if (size > remainder.size()) {
        throw std::out_of_range(ss::format(
          "ffi::array buffer too small {} > {}, total: {}",
          size,
          remainder.size(),
          _output.size()));
    }
}
array<uint8_t> writer::slice_remainder() { return _output.subspan(_offset); }

reader::reader(array<const uint8_t> buf)
  : _input(buf) {}

uint32_t reader::read_uint32() {
    auto r = slice_remainder();
    if (r.size() < sizeof(uint32_t)) {
        throw std::out_of_range(ss::format(
          "ffi::array buffer too small {} > {}, total: {}",
          sizeof(uint32_t),
          r.size(),
          _input.size()));
    }
    _offset += sizeof(uint32_t);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return ss::read_le<uint32_t>(reinterpret_cast<const char*>(r.data()));
}
array<const uint8_t> reader::slice_remainder() const {
    return _input.subspan(_offset);
}

std::ostream& operator<<(std::ostream& o, val_type vt) {
    switch (vt) {
    case val_type::i32:
        o << "i32";
        break;
    case val_type::i64:
        o << "i64";
        break;
    case val_type::f32:
        o << "f32";
        break;
    case val_type::f64:
        o << "f64";
        break;
    case val_type::ref:
        o << "ref";
        break;
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, const function_type& ft) {
    auto print = [&o](const std::vector<val_type>& types) {
        o << "(";
        for (size_t i = 0; i < types.size(); ++i) {
            if (i != 0) {
                o << ", ";
            }
            o << types[i];
        }
        o << ")";
    };
    print(ft.params);
    o << " -> ";
    print(ft.results);
    return o;
}

} // namespace modhost::ffi
