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
#include "modhost/capability.h"

#include "base/vlog.h"
#include "modhost/errc.h"
#include "modhost/logger.h"
#include "modhost/sandbox.h"

#include <absl/container/flat_hash_map.h>
#include <absl/strings/escaping.h>

#include <array>

namespace modhost {

namespace {

constexpr std::array all_capabilities = {
  capability::filesystem,
  capability::network,
  capability::environment,
  capability::stdio,
  capability::clock,
  capability::random,
};

// Every WASI preview1 function the host can link, mapped to the capability it
// needs. Preopen discovery is unrestricted: without a granted directory it
// reports none.
const absl::flat_hash_map<std::string_view, std::optional<capability>>&
wasi_functions() {
    static const absl::
      flat_hash_map<std::string_view, std::optional<capability>>
        functions{
          {"args_get", capability::environment},
          {"args_sizes_get", capability::environment},
          {"environ_get", capability::environment},
          {"environ_sizes_get", capability::environment},
          {"clock_res_get", capability::clock},
          {"clock_time_get", capability::clock},
          {"poll_oneoff", capability::clock},
          {"random_get", capability::random},
          {"fd_read", capability::stdio},
          {"fd_write", capability::stdio},
          {"fd_close", capability::stdio},
          {"fd_seek", capability::stdio},
          {"fd_tell", capability::stdio},
          {"fd_fdstat_get", capability::stdio},
          {"fd_fdstat_set_flags", capability::stdio},
          {"fd_fdstat_set_rights", capability::stdio},
          {"fd_filestat_get", capability::stdio},
          {"fd_prestat_get", std::nullopt},
          {"fd_prestat_dir_name", std::nullopt},
          {"fd_advise", capability::filesystem},
          {"fd_allocate", capability::filesystem},
          {"fd_datasync", capability::filesystem},
          {"fd_sync", capability::filesystem},
          {"fd_filestat_set_size", capability::filesystem},
          {"fd_filestat_set_times", capability::filesystem},
          {"fd_pread", capability::filesystem},
          {"fd_pwrite", capability::filesystem},
          {"fd_readdir", capability::filesystem},
          {"fd_renumber", capability::filesystem},
          {"path_create_directory", capability::filesystem},
          {"path_filestat_get", capability::filesystem},
          {"path_filestat_set_times", capability::filesystem},
          {"path_link", capability::filesystem},
          {"path_open", capability::filesystem},
          {"path_readlink", capability::filesystem},
          {"path_remove_directory", capability::filesystem},
          {"path_rename", capability::filesystem},
          {"path_symlink", capability::filesystem},
          {"path_unlink_file", capability::filesystem},
          {"sock_accept", capability::network},
          {"sock_recv", capability::network},
          {"sock_send", capability::network},
          {"sock_shutdown", capability::network},
          {"proc_exit", std::nullopt},
          {"proc_raise", std::nullopt},
          {"sched_yield", std::nullopt},
        };
    return functions;
}

} // namespace

std::string_view to_string_view(capability c) {
    switch (c) {
    case capability::filesystem:
        return "filesystem";
    case capability::network:
        return "network";
    case capability::environment:
        return "environment";
    case capability::stdio:
        return "stdio";
    case capability::clock:
        return "clock";
    case capability::random:
        return "random";
    }
    return "unknown";
}

std::optional<capability> capability_from_string(std::string_view s) {
    for (capability c : all_capabilities) {
        if (to_string_view(c) == s) {
            return c;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& o, capability c) {
    return o << to_string_view(c);
}

capability_policy capability_policy::allow_all() {
    capability_policy p;
    for (capability c : all_capabilities) {
        p.allow(c);
    }
    return p;
}

capability_policy& capability_policy::allow(capability c) {
    _allowed |= bit(c);
    return *this;
}

capability_policy& capability_policy::deny(capability c) {
    _allowed &= ~bit(c);
    return *this;
}

bool capability_policy::allows(capability c) const {
    return (_allowed & bit(c)) != 0;
}

capability_policy& capability_policy::preopen(preopened_dir dir) {
    _preopened_dirs.push_back(std::move(dir));
    return *this;
}

std::vector<capability> capability_policy::allowed() const {
    std::vector<capability> out;
    for (capability c : all_capabilities) {
        if (allows(c)) {
            out.push_back(c);
        }
    }
    return out;
}

std::ostream& operator<<(std::ostream& o, const capability_policy& p) {
    o << "{allow: [";
    bool first = true;
    for (capability c : p.allowed()) {
        o << (first ? "" : ", ") << c;
        first = false;
    }
    o << "], preopened_dirs: [";
    first = true;
    for (const auto& dir : p.preopened_dirs()) {
        o << (first ? "" : ", ") << dir.host_path << ":" << dir.guest_path;
        first = false;
    }
    return o << "]}";
}

result<std::optional<capability>>
required_capability(const sandbox::module_import& mod_import) {
    if (
      std::string_view(mod_import.module_name) != wasi_preview1_module
      || mod_import.kind != sandbox::extern_kind::function) {
        return errc::invalid_binary;
    }
    const auto& functions = wasi_functions();
    auto it = functions.find(std::string_view(mod_import.item_name));
    if (it == functions.end()) {
        return errc::invalid_binary;
    }
    return it->second;
}

result<void> check_policy(
  const sandbox::module_declarations& decls, const capability_policy& policy) {
    for (const auto& mod_import : decls.imports) {
        auto required = required_capability(mod_import);
        if (required.has_error()) {
            vlog(
              modhost_log.warn,
              "invalid module: unresolvable import \"{}\".\"{}\" ({})",
              absl::CHexEscape(std::string_view(mod_import.module_name)),
              absl::CHexEscape(std::string_view(mod_import.item_name)),
              mod_import.kind);
            return required.error();
        }
        const auto& needed = required.value();
        if (needed && !policy.allows(*needed)) {
            vlog(
              modhost_log.warn,
              "module import \"{}\" requires capability {} outside of policy "
              "{}",
              absl::CHexEscape(std::string_view(mod_import.item_name)),
              *needed,
              policy);
            return errc::disallowed_capability;
        }
    }
    if (
      !policy.preopened_dirs().empty()
      && !policy.allows(capability::filesystem)) {
        vlog(
          modhost_log.warn,
          "policy {} preopens directories without the filesystem capability",
          policy);
        return errc::disallowed_capability;
    }
    return outcome::success();
}

} // namespace modhost
