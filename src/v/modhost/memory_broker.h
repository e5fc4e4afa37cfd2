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
#include "bytes/bytes.h"
#include "modhost/ffi.h"
#include "modhost/fwd.h"
#include "utils/named_type.h"

#include <absl/container/btree_map.h>

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>

namespace modhost {

using instance_id = named_type<uint64_t, struct instance_id_tag>;

enum class allocation_status { live, freed };
// Who asked the module for the allocation: the host through acquire, or the
// module itself for a result it handed back.
enum class allocation_origin { host, module };

struct allocation {
    ffi::ptr offset;
    uint32_t length = 0;
    allocation_status status = allocation_status::live;
    allocation_origin origin = allocation_origin::host;

    // Bytes the allocation occupies, zero length allocations still occupy a
    // byte so that their offsets are distinct.
    uint32_t extent() const { return length == 0 ? 1 : length; }

    friend bool operator==(const allocation&, const allocation&) = default;
    friend std::ostream& operator<<(std::ostream&, const allocation&);
};

/**
 * Bridges host requests for memory to the allocator exported by a single
 * module instance and keeps the table of allocations the host knows about.
 *
 * The module decides placement, the broker only checks that what comes back
 * is inside the region and does not overlap anything live. All reads and
 * writes of module memory go through here.
 */
class memory_broker {
public:
    struct config {
        // Upper bound on the page count growth may reach, unset is unbounded.
        std::optional<uint32_t> max_pages;
    };

    struct usage {
        size_t region_size = 0;
        size_t live_allocations = 0;
    };

    memory_broker(instance_id, sandbox::instance*, config);
    memory_broker(const memory_broker&) = delete;
    memory_broker& operator=(const memory_broker&) = delete;
    memory_broker(memory_broker&&) = delete;
    memory_broker& operator=(memory_broker&&) = delete;
    ~memory_broker() = default;

    /**
     * Ask the module for len bytes. When the module cannot place the request
     * in the current region the region grows by the fewest pages covering len
     * and the request is retried once.
     */
    result<ffi::ptr> acquire(uint32_t len);

    /**
     * Return an allocation to the module. The pair must match what acquire
     * (or adopt) recorded.
     */
    result<void> release(ffi::ptr offset, uint32_t len);

    // True iff [offset, offset+len) is inside the region and a live
    // allocation.
    bool validate(ffi::ptr offset, uint32_t len) const;

    result<bytes> read(ffi::ptr offset, uint32_t len);
    result<void> write(ffi::ptr offset, bytes_view data);

    /**
     * Record a buffer the module allocated and returned, so that it can be
     * read and released like any other allocation.
     */
    result<void> adopt(ffi::ptr offset, uint32_t len);

    /**
     * Length of the zero terminated string at offset, not counting the
     * terminator. The scan stops at the end of the region.
     */
    result<uint32_t> find_terminator(ffi::ptr offset);

    std::optional<allocation> lookup(ffi::ptr offset) const;
    size_t live_allocations() const;
    size_t region_size() const;
    uint32_t page_count() const;
    instance_id id() const { return _id; }

    /**
     * Region size and live allocation count as of the last acquire, release
     * or adopt. Unlike the accessors above this may be read from any thread
     * while a call is in flight.
     */
    usage published_usage() const;

private:
    result<ffi::ptr> call_allocate(uint32_t len);
    result<void> call_deallocate(ffi::ptr offset, uint32_t len);
    result<void> grow_for(uint32_t len);
    result<void> record(ffi::ptr offset, uint32_t len, allocation_origin);
    const allocation* covering(ffi::ptr offset) const;
    void publish_usage();

    instance_id _id;
    sandbox::instance* _instance;
    config _config;
    // Live allocations keyed by offset.
    absl::btree_map<ffi::ptr, allocation> _allocations;
    // The last allocation released at each offset, until the module hands
    // that offset out again.
    absl::btree_map<ffi::ptr, allocation> _released;
    std::atomic<size_t> _published_region_size{0};
    std::atomic<size_t> _published_live_allocations{0};
};

} // namespace modhost

MODHOST_OSTREAM_FMT(modhost::allocation)
