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

#include <seastar/core/sstring.hh>

#include <absl/container/inlined_vector.h>

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string_view>

using bytes_view = std::span<const uint8_t>;

constexpr size_t bytes_inline_size = 31;

// An owned, host side byte buffer. Small buffers stay inline.
class bytes {
    using container_type = absl::InlinedVector<uint8_t, bytes_inline_size>;

public:
    using value_type = container_type::value_type;
    using size_type = container_type::size_type;
    using reference = container_type::reference;
    using const_reference = container_type::const_reference;
    using pointer = container_type::pointer;
    using const_pointer = container_type::const_pointer;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;

    static bytes from_string(std::string_view s) {
        return {s.begin(), s.end()};
    }

    bytes() = default;
    bytes(const bytes&) = default;
    bytes& operator=(const bytes&) = default;
    bytes(bytes&&) noexcept = default;
    bytes& operator=(bytes&&) noexcept = default;
    ~bytes() = default;

    struct initialized_zero {};
    bytes(initialized_zero, size_t size)
      : data_(size, 0) {}

    bytes(const value_type* data, size_t size)
      : data_(data, data + size) {}

    bytes(std::initializer_list<uint8_t> x)
      : data_(x) {}

    template<typename InputIterator>
    bytes(InputIterator begin, InputIterator end)
      : data_(begin, end) {}

    explicit bytes(bytes_view v)
      : data_(v.begin(), v.end()) {}

    reference operator[](size_type pos) noexcept { return data_[pos]; }
    const_reference operator[](size_type pos) const noexcept {
        return data_[pos];
    }

    pointer data() noexcept { return data_.data(); }
    const_pointer data() const noexcept { return data_.data(); }

    iterator begin() noexcept { return data_.begin(); }
    const_iterator begin() const noexcept { return data_.begin(); }

    iterator end() noexcept { return data_.end(); }
    const_iterator end() const noexcept { return data_.end(); }

    size_type size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    void resize(size_type size) { data_.resize(size); }
    void reserve(size_type size) { data_.reserve(size); }
    void push_back(value_type v) { data_.push_back(v); }

    friend bool operator==(const bytes&, const bytes&) = default;

    friend std::ostream& operator<<(std::ostream& os, const bytes& b);

private:
    container_type data_;
};

std::string_view as_string_view(bytes_view);
ss::sstring to_hex(bytes_view);
