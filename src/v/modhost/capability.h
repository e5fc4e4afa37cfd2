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

#include <seastar/core/sstring.hh>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace modhost {

namespace sandbox {
struct module_import;
struct module_declarations;
} // namespace sandbox

// External resources a module may be granted access to.
enum class capability : uint8_t {
    filesystem,
    network,
    environment,
    stdio,
    clock,
    random,
};

std::string_view to_string_view(capability);
std::optional<capability> capability_from_string(std::string_view);
std::ostream& operator<<(std::ostream&, capability);

// The import module name of the WASI preview1 host functions.
constexpr std::string_view wasi_preview1_module = "wasi_snapshot_preview1";

// A host directory made visible to the module under a guest path.
struct preopened_dir {
    ss::sstring host_path;
    ss::sstring guest_path;

    friend bool operator==(const preopened_dir&, const preopened_dir&)
      = default;
};

/**
 * Per module allow list over capabilities. A default constructed policy
 * denies everything.
 */
class capability_policy {
public:
    capability_policy() = default;

    static capability_policy allow_all();

    capability_policy& allow(capability);
    capability_policy& deny(capability);
    bool allows(capability) const;

    capability_policy& preopen(preopened_dir);
    const std::vector<preopened_dir>& preopened_dirs() const {
        return _preopened_dirs;
    }

    std::vector<capability> allowed() const;

    friend bool operator==(const capability_policy&, const capability_policy&)
      = default;
    friend std::ostream& operator<<(std::ostream&, const capability_policy&);

private:
    static uint8_t bit(capability c) { return 1U << static_cast<uint8_t>(c); }

    uint8_t _allowed{0};
    std::vector<preopened_dir> _preopened_dirs;
};

/**
 * The capability an import requires, std::nullopt for imports every module
 * may use (such as proc_exit).
 *
 * Returns errc::invalid_binary when the host cannot provide the import.
 */
result<std::optional<capability>>
required_capability(const sandbox::module_import&);

/**
 * Checks every import of a module against the policy.
 *
 * Unresolvable imports are errc::invalid_binary, imports outside of the
 * policy are errc::disallowed_capability.
 */
result<void>
check_policy(const sandbox::module_declarations&, const capability_policy&);

} // namespace modhost

MODHOST_OSTREAM_FMT(modhost::capability)
MODHOST_OSTREAM_FMT(modhost::capability_policy)
