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
#include "modhost/registry.h"

#include "base/vlog.h"
#include "modhost/errc.h"
#include "modhost/logger.h"
#include "modhost/module_instance.h"
#include "modhost/runtime.h"

#include <absl/algorithm/container.h>

#include <utility>

namespace modhost {

std::ostream& operator<<(std::ostream& o, module_state s) {
    switch (s) {
    case module_state::unloaded:
        return o << "unloaded";
    case module_state::loading:
        return o << "loading";
    case module_state::ready:
        return o << "ready";
    case module_state::faulted:
        return o << "faulted";
    }
    return o << "unknown";
}

registry::registry(runtime* rt)
  : _runtime(rt) {}

registry::~registry() = default;

result<void> registry::load(
  std::string_view id, bytes_view binary, capability_policy policy) {
    ss::sstring key(id);
    std::shared_ptr<entry> e;
    {
        std::lock_guard<std::mutex> map_lock(_mu);
        auto it = _entries.find(id);
        if (it == _entries.end()) {
            it = _entries.emplace(key, std::make_shared<entry>()).first;
        }
        e = it->second;
        std::lock_guard<std::mutex> lock(e->mu);
        switch (e->state) {
        case module_state::loading:
        case module_state::ready:
            vlog(
              modhost_log.debug,
              "module {} is already {}, refusing to load it",
              id,
              e->state);
            return errc::module_already_loaded;
        case module_state::faulted:
            vlog(
              modhost_log.info,
              "discarding faulted instance of module {} before loading",
              id);
            e->instance.reset();
            e->fault_reason.reset();
            e->state = module_state::unloaded;
            break;
        case module_state::unloaded:
            break;
        }
        e->state = module_state::loading;
        e->policy = policy;
    }
    vlog(modhost_log.info, "loading module {}", id);
    auto compiled = _runtime->compile(id, binary);
    if (compiled.has_error()) {
        return finish_load(key, e, compiled.error());
    }
    {
        std::lock_guard<std::mutex> lock(e->mu);
        e->compiled = compiled.value();
    }
    return finish_load(
      key, e, compiled.value()->instantiate(std::move(policy)));
}

result<void> registry::reload(std::string_view id) {
    auto e = find(id);
    if (!e) {
        return errc::module_not_found;
    }
    std::shared_ptr<compiled_module> compiled;
    capability_policy policy;
    {
        std::lock_guard<std::mutex> lock(e->mu);
        switch (e->state) {
        case module_state::loading:
            return errc::module_not_ready;
        case module_state::unloaded:
            return errc::module_not_found;
        case module_state::ready:
        case module_state::faulted:
            break;
        }
        vlog(
          modhost_log.info,
          "reloading module {} (was {})",
          id,
          e->state);
        e->instance.reset();
        e->fault_reason.reset();
        e->state = module_state::loading;
        compiled = e->compiled;
        policy = e->policy;
    }
    return finish_load(ss::sstring(id), e, compiled->instantiate(policy));
}

result<void> registry::unload(std::string_view id) {
    std::shared_ptr<module_instance> instance;
    {
        std::lock_guard<std::mutex> map_lock(_mu);
        auto it = _entries.find(id);
        if (it == _entries.end()) {
            return errc::module_not_found;
        }
        auto e = it->second;
        std::lock_guard<std::mutex> lock(e->mu);
        if (e->state == module_state::loading) {
            return errc::module_not_ready;
        }
        instance = std::exchange(e->instance, nullptr);
        e->state = module_state::unloaded;
        _entries.erase(it);
    }
    vlog(
      modhost_log.info,
      "unloaded module {}{}",
      id,
      instance ? ss::format(" (instance {})", instance->id()) : "");
    return outcome::success();
}

result<std::shared_ptr<module_instance>>
registry::lookup(std::string_view id) const {
    auto e = find(id);
    if (!e) {
        return errc::module_not_found;
    }
    std::lock_guard<std::mutex> lock(e->mu);
    switch (e->state) {
    case module_state::unloaded:
        return errc::module_not_found;
    case module_state::loading:
        return errc::module_not_ready;
    case module_state::faulted:
        return errc::module_trap;
    case module_state::ready:
        break;
    }
    if (e->instance->faulted()) {
        return errc::module_trap;
    }
    return e->instance;
}

module_state registry::state(std::string_view id) const {
    auto e = find(id);
    if (!e) {
        return module_state::unloaded;
    }
    std::lock_guard<std::mutex> lock(e->mu);
    return e->state;
}

std::vector<module_info> registry::list() const {
    std::vector<std::pair<ss::sstring, std::shared_ptr<entry>>> entries;
    {
        std::lock_guard<std::mutex> map_lock(_mu);
        entries.assign(_entries.begin(), _entries.end());
    }
    std::vector<module_info> infos;
    infos.reserve(entries.size());
    for (const auto& [id, e] : entries) {
        std::lock_guard<std::mutex> lock(e->mu);
        module_info info{
          .id = id,
          .state = e->state,
          .policy = e->policy,
          .fault_reason = e->fault_reason,
        };
        if (e->instance) {
            info.instance = e->instance->id();
            // A call may be running on another thread, only the published
            // figures are safe to read.
            auto usage = e->instance->broker().published_usage();
            info.memory_size_bytes = usage.region_size;
            info.live_allocations = usage.live_allocations;
        }
        infos.push_back(std::move(info));
    }
    absl::c_sort(infos, [](const module_info& a, const module_info& b) {
        return a.id < b.id;
    });
    return infos;
}

result<bytes> registry::call(
  std::string_view id,
  std::string_view fn,
  convention c,
  bytes_view payload) {
    auto instance = lookup(id);
    if (instance.has_error()) {
        return instance.error();
    }
    return instance.value()->call(fn, c, payload);
}

result<int32_t>
registry::invoke_i32(std::string_view id, std::string_view fn) {
    auto instance = lookup(id);
    if (instance.has_error()) {
        return instance.error();
    }
    return instance.value()->invoke_i32(fn);
}

std::shared_ptr<registry::entry> registry::find(std::string_view id) const {
    std::lock_guard<std::mutex> map_lock(_mu);
    auto it = _entries.find(id);
    if (it == _entries.end()) {
        return nullptr;
    }
    return it->second;
}

result<void> registry::finish_load(
  const ss::sstring& id,
  const std::shared_ptr<entry>& e,
  result<std::unique_ptr<module_instance>> loaded) {
    if (loaded.has_error()) {
        vlog(
          modhost_log.warn,
          "failed to load module {}: {}",
          id,
          loaded.error().message());
        {
            std::lock_guard<std::mutex> lock(e->mu);
            e->state = module_state::unloaded;
            e->instance.reset();
        }
        erase_if_unloaded(id);
        return loaded.error();
    }
    std::shared_ptr<module_instance> instance = std::move(loaded).value();
    // Installed before the instance is reachable so no fault is missed.
    std::weak_ptr<entry> weak = e;
    instance->set_fault_notifier(
      [weak](instance_id faulted, std::string_view reason) {
          auto owner = weak.lock();
          if (!owner) {
              return;
          }
          std::lock_guard<std::mutex> lock(owner->mu);
          if (
            owner->state != module_state::ready || !owner->instance
            || owner->instance->id() != faulted) {
              return;
          }
          owner->state = module_state::faulted;
          owner->fault_reason.emplace(reason);
      });
    {
        std::lock_guard<std::mutex> lock(e->mu);
        e->instance = instance;
        e->state = module_state::ready;
    }
    vlog(
      modhost_log.info,
      "module {} ready as instance {}",
      id,
      instance->id());
    return outcome::success();
}

void registry::erase_if_unloaded(const ss::sstring& id) {
    std::lock_guard<std::mutex> map_lock(_mu);
    auto it = _entries.find(id);
    if (it == _entries.end()) {
        return;
    }
    std::lock_guard<std::mutex> lock(it->second->mu);
    if (it->second->state == module_state::unloaded) {
        _entries.erase(it);
    }
}

} // namespace modhost
