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
#include "base/seastarx.h"
#include "bytes/bytes.h"
#include "modhost/abi.h"
#include "modhost/capability.h"
#include "modhost/fwd.h"
#include "modhost/memory_broker.h"
#include "utils/absl_sstring_hash.h"

#include <seastar/core/sstring.hh>

#include <absl/container/flat_hash_map.h>

#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace modhost {

/**
 * Lifecycle of a module identifier:
 *
 *   unloaded -> loading -> ready -> faulted -> unloaded
 *
 * A failed load returns to unloaded. A faulted instance never runs again, it
 * is discarded by unload, reload or the next load of the identifier.
 */
enum class module_state { unloaded, loading, ready, faulted };
std::ostream& operator<<(std::ostream&, module_state);

struct module_info {
    ss::sstring id;
    module_state state = module_state::unloaded;
    std::optional<instance_id> instance;
    capability_policy policy;
    size_t memory_size_bytes = 0;
    size_t live_allocations = 0;
    std::optional<ss::sstring> fault_reason;
};

/**
 * Tracks the loaded instance of each module identifier.
 *
 * Lifecycle transitions of an identifier are serialized, calls run without
 * holding any registry lock.
 */
class registry {
public:
    explicit registry(runtime*);
    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) = delete;
    registry& operator=(registry&&) = delete;
    ~registry();

    /**
     * Compile and instantiate a binary under the identifier. A faulted
     * instance under the same identifier is discarded first.
     */
    result<void>
    load(std::string_view id, bytes_view binary, capability_policy policy);

    /**
     * Replace the instance of a ready or faulted identifier with a fresh one
     * from the already compiled module.
     */
    result<void> reload(std::string_view id);

    // Drops the instance and its memory.
    result<void> unload(std::string_view id);

    /**
     * The ready instance of an identifier. errc::module_not_found if it is not
     * loaded, errc::module_not_ready while loading and errc::module_trap once
     * faulted.
     */
    result<std::shared_ptr<module_instance>> lookup(std::string_view id) const;

    module_state state(std::string_view id) const;

    // Every known identifier, ordered by identifier.
    std::vector<module_info> list() const;

    result<bytes> call(
      std::string_view id,
      std::string_view fn,
      convention,
      bytes_view payload);

    result<int32_t> invoke_i32(std::string_view id, std::string_view fn);

private:
    struct entry {
        mutable std::mutex mu;
        module_state state = module_state::unloaded;
        capability_policy policy;
        std::shared_ptr<compiled_module> compiled;
        std::shared_ptr<module_instance> instance;
        std::optional<ss::sstring> fault_reason;
    };

    std::shared_ptr<entry> find(std::string_view id) const;
    result<void> finish_load(
      const ss::sstring& id,
      const std::shared_ptr<entry>&,
      result<std::unique_ptr<module_instance>>);
    void erase_if_unloaded(const ss::sstring& id);

    runtime* _runtime;
    mutable std::mutex _mu;
    absl::flat_hash_map<
      ss::sstring,
      std::shared_ptr<entry>,
      sstring_hash,
      sstring_eq>
      _entries;
};

} // namespace modhost

MODHOST_OSTREAM_FMT(modhost::module_state)
