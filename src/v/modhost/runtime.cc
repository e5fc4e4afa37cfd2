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
#include "modhost/runtime.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "modhost/errc.h"
#include "modhost/logger.h"
#include "modhost/module_instance.h"
#include "modhost/sandbox.h"

namespace modhost {

namespace {

using ffi::val_type;

bool is_exported_memory(const sandbox::module_declarations& decls) {
    const auto* e = decls.find_export("memory");
    return e != nullptr && e->kind == sandbox::extern_kind::memory;
}

bool is_function(
  const sandbox::module_export* e, const ffi::function_type& expected) {
    return e != nullptr && e->kind == sandbox::extern_kind::function
           && e->signature == expected;
}

bool is_allocate_fn(const sandbox::module_declarations& decls) {
    return is_function(
      decls.find_export("allocate"),
      {.params = {val_type::i32}, .results = {val_type::i32}});
}

bool is_deallocate_fn(const sandbox::module_declarations& decls) {
    const auto* e = decls.find_export("deallocate");
    return is_function(
             e, {.params = {val_type::i32, val_type::i32}, .results = {}})
           || is_function(
             e,
             {.params = {val_type::i32, val_type::i32},
              .results = {val_type::i32}});
}

result<void>
validate_abi(std::string_view name, const sandbox::module_declarations& decls) {
    if (!is_exported_memory(decls)) {
        vlog(
          modhost_log.warn, "invalid module {}: missing memory export", name);
        return errc::invalid_binary;
    }
    if (!is_allocate_fn(decls)) {
        vlog(
          modhost_log.warn,
          "invalid module {}: missing allocate(i32) -> i32 export",
          name);
        return errc::invalid_binary;
    }
    if (!is_deallocate_fn(decls)) {
        vlog(
          modhost_log.warn,
          "invalid module {}: missing deallocate(i32, i32) export",
          name);
        return errc::invalid_binary;
    }
    return outcome::success();
}

} // namespace

compiled_module::compiled_module(
  runtime* rt, ss::sstring name, std::shared_ptr<sandbox::module> mod)
  : _runtime(rt)
  , _name(std::move(name))
  , _module(std::move(mod)) {}

const sandbox::module_declarations& compiled_module::declarations() const {
    return _module->declarations();
}

result<std::unique_ptr<module_instance>>
compiled_module::instantiate(capability_policy policy) {
    auto allowed = check_policy(declarations(), policy);
    if (allowed.has_error()) {
        vlog(
          modhost_log.warn,
          "refusing to instantiate module {} under policy {}: {}",
          _name,
          policy,
          allowed.error().message());
        return allowed.error();
    }
    std::unique_ptr<sandbox::instance> inst;
    try {
        inst = _module->instantiate({
          .policy = policy,
          .max_memory_pages = _runtime->config().max_memory_pages,
        });
    } catch (const modhost_exception& ex) {
        vlog(
          modhost_log.warn,
          "unable to instantiate module {}: {}",
          _name,
          ex.what());
        return ex.error_code();
    }
    auto id = _runtime->next_instance_id();
    vlog(
      modhost_log.info,
      "instantiated module {} as instance {} with policy {}",
      _name,
      id,
      policy);
    return std::make_unique<module_instance>(
      id,
      _module,
      std::move(inst),
      std::move(policy),
      memory_broker::config{
        .max_pages = _runtime->config().max_memory_pages,
      });
}

runtime::runtime(std::unique_ptr<sandbox::engine> engine, runtime_config cfg)
  : _engine(std::move(engine))
  , _config(std::move(cfg)) {
    vassert(_engine != nullptr, "runtime without a sandbox engine");
}

runtime::~runtime() = default;

result<std::shared_ptr<compiled_module>>
runtime::compile(std::string_view name, bytes_view binary) {
    vlog(
      modhost_log.debug,
      "compiling module {} ({} bytes)",
      name,
      binary.size());
    std::shared_ptr<sandbox::module> mod;
    try {
        mod = _engine->compile(binary);
    } catch (const modhost_exception& ex) {
        vlog(
          modhost_log.warn,
          "invalid module {} (unable to compile): {}",
          name,
          ex.what());
        return ex.error_code();
    }
    auto valid = validate_abi(name, mod->declarations());
    if (valid.has_error()) {
        return valid.error();
    }
    vlog(modhost_log.info, "finished compiling module {}", name);
    return std::make_shared<compiled_module>(
      this, ss::sstring(name), std::move(mod));
}

result<std::unique_ptr<module_instance>> runtime::load(
  std::string_view name, bytes_view binary, capability_policy policy) {
    auto compiled = compile(name, binary);
    if (compiled.has_error()) {
        return compiled.error();
    }
    return compiled.value()->instantiate(std::move(policy));
}

instance_id runtime::next_instance_id() {
    return instance_id(
      _next_instance_id.fetch_add(1, std::memory_order_relaxed));
}

} // namespace modhost
