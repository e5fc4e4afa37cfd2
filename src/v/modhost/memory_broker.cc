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
#include "modhost/memory_broker.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "modhost/errc.h"
#include "modhost/logger.h"
#include "modhost/sandbox.h"

#include <absl/algorithm/container.h>

#include <algorithm>
#include <array>
#include <limits>

namespace modhost {

namespace {
constexpr std::string_view allocate_export = "allocate";
constexpr std::string_view deallocate_export = "deallocate";
// Terminator scans look at module memory this many bytes at a time.
constexpr size_t scan_chunk_size = 4_KiB;

std::ostream& operator<<(std::ostream& o, allocation_status s) {
    return o << (s == allocation_status::live ? "live" : "freed");
}
std::ostream& operator<<(std::ostream& o, allocation_origin s) {
    return o << (s == allocation_origin::host ? "host" : "module");
}
} // namespace

std::ostream& operator<<(std::ostream& o, const allocation& a) {
    return o << "{offset: " << a.offset << ", length: " << a.length
             << ", status: " << a.status << ", origin: " << a.origin << "}";
}

memory_broker::memory_broker(
  instance_id id, sandbox::instance* instance, config cfg)
  : _id(id)
  , _instance(instance)
  , _config(cfg) {
    vassert(_instance != nullptr, "memory broker without an instance");
    publish_usage();
}

result<ffi::ptr> memory_broker::acquire(uint32_t len) {
    uint32_t request = std::max<uint32_t>(len, 1);
    auto offset = call_allocate(request);
    if (offset.has_error()) {
        return offset.error();
    }
    if (offset.value() == 0) {
        vlog(
          modhost_log.debug,
          "instance {} could not place {} bytes in {} pages, growing",
          _id,
          request,
          page_count());
        auto grown = grow_for(request);
        if (grown.has_error()) {
            return grown.error();
        }
        offset = call_allocate(request);
        if (offset.has_error()) {
            return offset.error();
        }
        if (offset.value() == 0) {
            vlog(
              modhost_log.warn,
              "instance {} failed to allocate {} bytes after growing to {} "
              "pages",
              _id,
              request,
              page_count());
            return errc::allocation_failed;
        }
    }
    auto recorded = record(offset.value(), len, allocation_origin::host);
    if (recorded.has_error()) {
        return recorded.error();
    }
    vlog(
      modhost_log.trace,
      "instance {} acquired {} bytes at {}",
      _id,
      len,
      offset.value());
    return offset.value();
}

result<void> memory_broker::release(ffi::ptr offset, uint32_t len) {
    auto it = _allocations.find(offset);
    if (it == _allocations.end()) {
        if (auto freed = _released.find(offset); freed != _released.end()) {
            vlog(
              modhost_log.warn,
              "instance {} double free of allocation {}",
              _id,
              freed->second);
            return errc::double_free;
        }
        vlog(
          modhost_log.warn,
          "instance {} release of unknown allocation {} ({} bytes)",
          _id,
          offset,
          len);
        return errc::out_of_bounds;
    }
    if (it->second.length != len) {
        vlog(
          modhost_log.warn,
          "instance {} release of {} with mismatched length {}",
          _id,
          it->second,
          len);
        return errc::out_of_bounds;
    }
    auto released = call_deallocate(offset, it->second.extent());
    if (released.has_error()) {
        return released.error();
    }
    allocation freed = it->second;
    freed.status = allocation_status::freed;
    _allocations.erase(it);
    _released.insert_or_assign(offset, freed);
    publish_usage();
    vlog(
      modhost_log.trace,
      "instance {} released {} bytes at {}",
      _id,
      len,
      offset);
    return outcome::success();
}

bool memory_broker::validate(ffi::ptr offset, uint32_t len) const {
    size_t end = size_t(offset()) + len;
    if (end > region_size()) {
        return false;
    }
    const allocation* a = covering(offset);
    if (a == nullptr) {
        return false;
    }
    return end <= size_t(a->offset()) + a->length;
}

result<bytes> memory_broker::read(ffi::ptr offset, uint32_t len) {
    if (!validate(offset, len)) {
        vlog(
          modhost_log.debug,
          "instance {} read outside of a live allocation: {} + {}",
          _id,
          offset,
          len);
        return errc::out_of_bounds;
    }
    try {
        auto data = _instance->memory()->translate_array<uint8_t>(offset, len);
        return bytes(data.data(), data.size());
    } catch (const modhost_exception& ex) {
        vlog(modhost_log.warn, "instance {} read failed: {}", _id, ex.what());
        return ex.error_code();
    }
}

result<void> memory_broker::write(ffi::ptr offset, bytes_view data) {
    if (data.size() > std::numeric_limits<uint32_t>::max()) {
        return errc::out_of_bounds;
    }
    auto len = static_cast<uint32_t>(data.size());
    if (!validate(offset, len)) {
        vlog(
          modhost_log.debug,
          "instance {} write outside of a live allocation: {} + {}",
          _id,
          offset,
          len);
        return errc::out_of_bounds;
    }
    try {
        auto dst = _instance->memory()->translate_array<uint8_t>(offset, len);
        absl::c_copy(data, dst.begin());
    } catch (const modhost_exception& ex) {
        vlog(modhost_log.warn, "instance {} write failed: {}", _id, ex.what());
        return ex.error_code();
    }
    return outcome::success();
}

result<void> memory_broker::adopt(ffi::ptr offset, uint32_t len) {
    auto recorded = record(offset, len, allocation_origin::module);
    if (recorded.has_value()) {
        vlog(
          modhost_log.trace,
          "instance {} adopted {} bytes at {}",
          _id,
          len,
          offset);
    }
    return recorded;
}

result<uint32_t> memory_broker::find_terminator(ffi::ptr offset) {
    size_t size = region_size();
    size_t pos = offset();
    if (pos >= size) {
        return errc::out_of_bounds;
    }
    try {
        while (pos < size) {
            auto n = static_cast<uint32_t>(
              std::min(scan_chunk_size, size - pos));
            auto chunk = _instance->memory()->translate_array<uint8_t>(
              ffi::ptr(static_cast<uint32_t>(pos)), n);
            auto it = absl::c_find(chunk, uint8_t(0));
            if (it != chunk.end()) {
                return static_cast<uint32_t>(
                  pos - offset() + std::distance(chunk.begin(), it));
            }
            pos += n;
        }
    } catch (const modhost_exception& ex) {
        vlog(modhost_log.warn, "instance {} scan failed: {}", _id, ex.what());
        return ex.error_code();
    }
    vlog(
      modhost_log.warn,
      "instance {} string at {} is not terminated before the end of memory",
      _id,
      offset);
    return errc::out_of_bounds;
}

std::optional<allocation> memory_broker::lookup(ffi::ptr offset) const {
    if (auto it = _allocations.find(offset); it != _allocations.end()) {
        return it->second;
    }
    if (auto it = _released.find(offset); it != _released.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t memory_broker::live_allocations() const {
    return _allocations.size();
}

size_t memory_broker::region_size() const {
    return _instance->memory()->size_bytes();
}

uint32_t memory_broker::page_count() const {
    return _instance->memory()->page_count();
}

memory_broker::usage memory_broker::published_usage() const {
    return {
      .region_size = _published_region_size.load(std::memory_order_relaxed),
      .live_allocations = _published_live_allocations.load(
        std::memory_order_relaxed),
    };
}

void memory_broker::publish_usage() {
    _published_region_size.store(region_size(), std::memory_order_relaxed);
    _published_live_allocations.store(
      live_allocations(), std::memory_order_relaxed);
}

result<ffi::ptr> memory_broker::call_allocate(uint32_t len) {
    std::array<uint64_t, 1> params{len};
    try {
        auto results = _instance->call(allocate_export, params);
        vassert(
          results.size() == 1,
          "allocate returned {} values, expected 1",
          results.size());
        return ffi::ptr(static_cast<uint32_t>(results.front()));
    } catch (const modhost_exception& ex) {
        vlog(
          modhost_log.warn,
          "instance {} allocate({}) failed: {}",
          _id,
          len,
          ex.what());
        return ex.error_code();
    }
}

result<void> memory_broker::call_deallocate(ffi::ptr offset, uint32_t len) {
    std::array<uint64_t, 2> params{offset(), len};
    std::vector<uint64_t> results;
    try {
        results = _instance->call(deallocate_export, params);
    } catch (const modhost_exception& ex) {
        vlog(
          modhost_log.warn,
          "instance {} deallocate({}, {}) failed: {}",
          _id,
          offset,
          len,
          ex.what());
        return ex.error_code();
    }
    // The status returning variant reports a pointer it does not own with a
    // non zero value.
    if (!results.empty() && static_cast<int32_t>(results.front()) != 0) {
        vlog(
          modhost_log.warn,
          "instance {} rejected deallocate({}, {}) with status {}",
          _id,
          offset,
          len,
          static_cast<int32_t>(results.front()));
        return errc::out_of_bounds;
    }
    return outcome::success();
}

result<void> memory_broker::grow_for(uint32_t len) {
    auto pages = static_cast<uint32_t>(
      (size_t(len) + ffi::page_size - 1) / ffi::page_size);
    uint32_t current = page_count();
    if (_config.max_pages && size_t(current) + pages > *_config.max_pages) {
        vlog(
          modhost_log.warn,
          "instance {} growing by {} pages exceeds the limit of {} pages",
          _id,
          pages,
          *_config.max_pages);
        return errc::allocation_failed;
    }
    bool grown = false;
    try {
        grown = _instance->memory()->grow(pages);
    } catch (const modhost_exception& ex) {
        vlog(modhost_log.warn, "instance {} grow failed: {}", _id, ex.what());
        return ex.error_code();
    }
    if (!grown) {
        vlog(
          modhost_log.warn,
          "instance {} memory refused to grow by {} pages from {}",
          _id,
          pages,
          current);
        return errc::allocation_failed;
    }
    vlog(
      modhost_log.debug,
      "instance {} grew memory from {} to {} pages",
      _id,
      current,
      page_count());
    return outcome::success();
}

result<void> memory_broker::record(
  ffi::ptr offset, uint32_t len, allocation_origin origin) {
    allocation a{.offset = offset, .length = len, .origin = origin};
    size_t end = size_t(offset()) + a.extent();
    if (offset() == 0 || end > region_size()) {
        vlog(
          modhost_log.warn,
          "instance {} module returned allocation {} outside of the {} byte "
          "region",
          _id,
          a,
          region_size());
        return errc::out_of_bounds;
    }
    auto first = _allocations.upper_bound(offset);
    if (first != _allocations.begin()) {
        auto prev = std::prev(first);
        if (size_t(prev->first()) + prev->second.extent() > offset()) {
            first = prev;
        }
    }
    auto last = end > std::numeric_limits<uint32_t>::max()
                  ? _allocations.end()
                  : _allocations.lower_bound(
                      ffi::ptr(static_cast<uint32_t>(end)));
    if (first != last) {
        vlog(
          modhost_log.warn,
          "instance {} module returned allocation {} overlapping {}",
          _id,
          a,
          first->second);
        return errc::out_of_bounds;
    }
    _released.erase(offset);
    _allocations.emplace(offset, a);
    publish_usage();
    return outcome::success();
}

const allocation* memory_broker::covering(ffi::ptr offset) const {
    auto it = _allocations.upper_bound(offset);
    if (it == _allocations.begin()) {
        return nullptr;
    }
    --it;
    if (offset() < size_t(it->first()) + it->second.extent()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace modhost
