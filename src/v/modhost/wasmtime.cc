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
#include "modhost/wasmtime.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "modhost/errc.h"
#include "modhost/ffi.h"
#include "modhost/logger.h"

#include <seastar/core/print.hh>
#include <seastar/util/defer.hh>

#include <absl/strings/escaping.h>

#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <wasi.h>
#include <wasm.h>
#include <wasmtime.h>

namespace modhost::wasmtime {

namespace {

template<typename T, auto fn>
struct deleter {
    void operator()(T* ptr) { fn(ptr); }
};
/** A unique_ptr that uses a free function as a deleter. */
template<typename T, auto fn>
using handle = std::unique_ptr<T, deleter<T, fn>>;

/**
 * This is similar to std::out_ptr in C++23 when used with handles.
 *
 * Example usage:
 *
 * class foo;
 * int external_fn(foo** out_ptr);
 * void free_foo(foo*);
 *
 * int main() {
 *   handle<foo, free_foo> foo_ptr;
 *   int errno = external_fn(out_handle(foo_ptr));
 *   if (errno != 0) {
 *     throw ...;
 *   }
 *   // foo_ptr is set with the out ptr from external_fn
 * }
 */
template<typename T, auto fn>
class out_handle {
public:
    explicit out_handle(handle<T, fn>& out_handle)
      : _out_handle(&out_handle) {}
    out_handle(const out_handle&) = delete;
    out_handle(out_handle&&) = delete;
    out_handle& operator=(const out_handle&) = delete;
    out_handle& operator=(out_handle&&) = delete;
    ~out_handle() noexcept {
        _out_handle->reset(std::exchange(_raw_ptr, nullptr));
    }

    // NOLINTNEXTLINE
    operator T**() noexcept { return &_raw_ptr; }

private:
    handle<T, fn>* _out_handle;
    T* _raw_ptr = nullptr;
};

std::string_view as_string_view(const wasm_name_t* name) {
    return {name->data, name->size};
}

void check_error(const wasmtime_error_t* error, errc code) {
    if (!error) {
        return;
    }
    wasm_name_t msg;
    wasmtime_error_message(error, &msg);
    std::string str(msg.data, msg.size);
    wasm_byte_vec_delete(&msg);
    throw modhost_exception(std::move(str), code);
}

std::string_view trap_code_name(wasmtime_trap_code_t code) {
    switch (static_cast<wasmtime_trap_code_enum>(code)) {
    case WASMTIME_TRAP_CODE_STACK_OVERFLOW:
        return "STACK_OVERFLOW";
    case WASMTIME_TRAP_CODE_MEMORY_OUT_OF_BOUNDS:
        return "MEMORY_OUT_OF_BOUNDS";
    case WASMTIME_TRAP_CODE_HEAP_MISALIGNED:
        return "HEAP_MISALIGNED";
    case WASMTIME_TRAP_CODE_TABLE_OUT_OF_BOUNDS:
        return "TABLE_OUT_OF_BOUNDS";
    case WASMTIME_TRAP_CODE_INDIRECT_CALL_TO_NULL:
        return "INDIRECT_CALL_TO_NULL";
    case WASMTIME_TRAP_CODE_BAD_SIGNATURE:
        return "BAD_SIGNATURE";
    case WASMTIME_TRAP_CODE_INTEGER_OVERFLOW:
        return "INTEGER_OVERFLOW";
    case WASMTIME_TRAP_CODE_INTEGER_DIVISION_BY_ZERO:
        return "INTEGER_DIVISION_BY_ZERO";
    case WASMTIME_TRAP_CODE_BAD_CONVERSION_TO_INTEGER:
        return "BAD_CONVERSION_TO_INTEGER";
    case WASMTIME_TRAP_CODE_UNREACHABLE_CODE_REACHED:
        return "UNREACHABLE_CODE_REACHED";
    case WASMTIME_TRAP_CODE_INTERRUPT:
        return "INTERRUPT";
    case WASMTIME_TRAP_CODE_OUT_OF_FUEL:
        return "OUT_OF_FUEL";
    default:
        return {};
    }
}

// Throws a trap as modhost_exception, with its code and the module frames it
// unwound through.
void check_trap(const wasm_trap_t* trap, errc code) {
    if (!trap) {
        return;
    }
    wasm_name_t msg{.size = 0, .data = nullptr};
    wasm_trap_message(trap, &msg);
    std::stringstream sb;
    sb << std::string_view(msg.data, msg.size);
    wasm_byte_vec_delete(&msg);
    wasmtime_trap_code_t trap_code = 0;
    if (wasmtime_trap_code(trap, &trap_code)) {
        auto name = trap_code_name(trap_code);
        if (!name.empty()) {
            sb << " (code " << name << ")";
        }
    }
    wasm_frame_vec_t trace{.size = 0, .data = nullptr};
    wasm_trap_trace(trap, &trace);
    for (wasm_frame_t* frame : std::span(trace.data, trace.size)) {
        const auto* module_name = wasmtime_frame_module_name(frame);
        const auto* function_name = wasmtime_frame_func_name(frame);
        if (module_name && function_name) {
            sb << std::endl
               << as_string_view(module_name) << "::"
               << as_string_view(function_name);
        } else if (module_name) {
            sb << std::endl << as_string_view(module_name) << "::??";
        } else if (function_name) {
            sb << std::endl << as_string_view(function_name);
        }
    }
    wasm_frame_vec_delete(&trace);
    throw modhost_exception(sb.str(), code);
}

ffi::val_type from_wasm(const wasm_valtype_t* type) {
    switch (wasm_valtype_kind(type)) {
    case WASM_I32:
        return ffi::val_type::i32;
    case WASM_I64:
        return ffi::val_type::i64;
    case WASM_F32:
        return ffi::val_type::f32;
    case WASM_F64:
        return ffi::val_type::f64;
    default:
        return ffi::val_type::ref;
    }
}

std::vector<ffi::val_type> from_wasm(const wasm_valtype_vec_t* types) {
    std::vector<ffi::val_type> out;
    out.reserve(types->size);
    for (const wasm_valtype_t* type : std::span(types->data, types->size)) {
        out.push_back(from_wasm(type));
    }
    return out;
}

ffi::function_type from_wasm(const wasm_functype_t* type) {
    return {
      .params = from_wasm(wasm_functype_params(type)),
      .results = from_wasm(wasm_functype_results(type)),
    };
}

sandbox::extern_kind from_wasm(wasm_externkind_t kind) {
    switch (kind) {
    case WASM_EXTERN_FUNC:
        return sandbox::extern_kind::function;
    case WASM_EXTERN_GLOBAL:
        return sandbox::extern_kind::global;
    case WASM_EXTERN_TABLE:
        return sandbox::extern_kind::table;
    default:
        return sandbox::extern_kind::memory;
    }
}

sandbox::module_declarations
extract_declarations(const wasmtime_module_t* mod) {
    sandbox::module_declarations decls;

    wasm_importtype_vec_t imports;
    wasm_importtype_vec_new_empty(&imports);
    auto free_imports = ss::defer(
      [&imports]() noexcept { wasm_importtype_vec_delete(&imports); });
    wasmtime_module_imports(mod, &imports);
    for (const wasm_importtype_t* module_import :
         std::span(imports.data, imports.size)) {
        decls.imports.push_back({
          .module_name = ss::sstring(
            as_string_view(wasm_importtype_module(module_import))),
          .item_name = ss::sstring(
            as_string_view(wasm_importtype_name(module_import))),
          .kind = from_wasm(
            wasm_externtype_kind(wasm_importtype_type(module_import))),
        });
    }

    wasm_exporttype_vec_t exports;
    wasm_exporttype_vec_new_empty(&exports);
    auto free_exports = ss::defer(
      [&exports]() noexcept { wasm_exporttype_vec_delete(&exports); });
    wasmtime_module_exports(mod, &exports);
    for (const wasm_exporttype_t* module_export :
         std::span(exports.data, exports.size)) {
        const wasm_externtype_t* extern_type = wasm_exporttype_type(
          module_export);
        auto name = as_string_view(wasm_exporttype_name(module_export));
        sandbox::module_export decl{
          .item_name = ss::sstring(name),
          .kind = from_wasm(wasm_externtype_kind(extern_type)),
        };
        if (decl.kind == sandbox::extern_kind::function) {
            decl.signature = from_wasm(
              wasm_externtype_as_functype_const(extern_type));
        } else if (decl.kind == sandbox::extern_kind::memory) {
            const wasm_memorytype_t* memory_type
              = wasm_externtype_as_memorytype_const(extern_type);
            if (wasmtime_memorytype_is64(memory_type)) {
                throw modhost_exception(
                  ss::format(
                    "invalid 64bit memory export: \"{}\"",
                    absl::CHexEscape(name)),
                  errc::invalid_binary);
            }
        }
        decls.exports.push_back(std::move(decl));
    }
    return decls;
}

class guest_memory final : public sandbox::linear_memory {
public:
    guest_memory(wasmtime_context_t* ctx, wasmtime_memory_t underlying)
      : _ctx(ctx)
      , _underlying(underlying) {}

    void* translate_raw(ffi::ptr guest_ptr, uint32_t len) final {
        size_t memory_size = size_bytes();
        // Prevent overflow by upgrading to a larger type.
        size_t end_read_addr = guest_ptr();
        end_read_addr += len;
        if (end_read_addr > memory_size) [[unlikely]] {
            throw modhost_exception(
              ss::format(
                "Out of bounds memory access: {} + {} > {}",
                guest_ptr,
                len,
                memory_size),
              errc::out_of_bounds);
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return wasmtime_memory_data(_ctx, &_underlying) + guest_ptr();
    }

    size_t size_bytes() const final {
        return wasmtime_memory_data_size(_ctx, &_underlying);
    }

    bool grow(uint32_t delta_pages) final {
        uint64_t previous = 0;
        handle<wasmtime_error_t, wasmtime_error_delete> error(
          wasmtime_memory_grow(_ctx, &_underlying, delta_pages, &previous));
        if (error) {
            wasm_name_t msg;
            wasmtime_error_message(error.get(), &msg);
            vlog(
              modhost_log.debug,
              "memory refused to grow by {} pages: {}",
              delta_pages,
              std::string_view(msg.data, msg.size));
            wasm_byte_vec_delete(&msg);
            return false;
        }
        return true;
    }

private:
    wasmtime_context_t* _ctx;
    wasmtime_memory_t _underlying;
};

class instance_impl final : public sandbox::instance {
public:
    instance_impl(
      handle<wasmtime_store_t, wasmtime_store_delete> store,
      wasmtime_instance_t instance,
      wasmtime_memory_t mem,
      std::optional<uint64_t> fuel)
      : _store(std::move(store))
      , _instance(instance)
      , _memory(wasmtime_store_context(_store.get()), mem)
      , _fuel(fuel) {}

    sandbox::linear_memory* memory() final { return &_memory; }

    std::vector<uint64_t>
    call(std::string_view function, std::span<const uint64_t> params) final {
        auto* ctx = wasmtime_store_context(_store.get());
        wasmtime_extern_t fn_extern;
        bool ok = wasmtime_instance_export_get(
          ctx, &_instance, function.data(), function.size(), &fn_extern);
        if (!ok || fn_extern.kind != WASMTIME_EXTERN_FUNC) {
            throw modhost_exception(
              ss::format("missing function export: {}", function),
              errc::missing_export);
        }
        handle<wasm_functype_t, wasm_functype_delete> fn_type(
          wasmtime_func_type(ctx, &fn_extern.of.func));
        auto signature = from_wasm(fn_type.get());
        if (signature.params.size() != params.size()) {
            throw modhost_exception(
              ss::format(
                "{} takes {} parameters, given {}",
                function,
                signature.params.size(),
                params.size()),
              errc::missing_export);
        }
        std::vector<wasmtime_val_t> args;
        args.reserve(params.size());
        for (size_t i = 0; i < params.size(); ++i) {
            args.push_back(
              to_wasmtime(function, signature.params[i], params[i]));
        }
        std::vector<wasmtime_val_t> results(signature.results.size());
        reset_fuel(ctx);

        handle<wasmtime_error_t, wasmtime_error_delete> error;
        handle<wasm_trap_t, wasm_trap_delete> trap;
        {
            auto trap_out = out_handle(trap);
            error.reset(wasmtime_func_call(
              ctx,
              &fn_extern.of.func,
              args.data(),
              args.size(),
              results.data(),
              results.size(),
              trap_out));
        }
        // Errors out of a call are host failures such as proc_exit, to the
        // caller they are the same as a trap.
        check_error(error.get(), errc::module_trap);
        check_trap(trap.get(), errc::module_trap);
        return to_raw_values(function, results);
    }

private:
    static wasmtime_val_t
    to_wasmtime(std::string_view function, ffi::val_type type, uint64_t raw) {
        switch (type) {
        case ffi::val_type::i32:
            return wasmtime_val_t{
              .kind = WASMTIME_I32, .of = {.i32 = static_cast<int32_t>(raw)}};
        case ffi::val_type::i64:
            return wasmtime_val_t{
              .kind = WASMTIME_I64, .of = {.i64 = static_cast<int64_t>(raw)}};
        default:
            throw modhost_exception(
              ss::format(
                "{} takes an unsupported {} parameter", function, type),
              errc::missing_export);
        }
    }

    static std::vector<uint64_t> to_raw_values(
      std::string_view function, std::span<const wasmtime_val_t> values) {
        std::vector<uint64_t> raw;
        raw.reserve(values.size());
        for (const wasmtime_val_t& val : values) {
            switch (val.kind) {
            case WASMTIME_I32:
                raw.push_back(static_cast<uint32_t>(val.of.i32));
                break;
            case WASMTIME_I64:
                raw.push_back(static_cast<uint64_t>(val.of.i64));
                break;
            default:
                throw modhost_exception(
                  ss::format(
                    "{} returned an unsupported value type: {}",
                    function,
                    val.kind),
                  errc::missing_export);
            }
        }
        return raw;
    }

    void reset_fuel(wasmtime_context_t* ctx) {
        if (!_fuel) {
            return;
        }
        handle<wasmtime_error_t, wasmtime_error_delete> error(
          wasmtime_context_set_fuel(ctx, *_fuel));
        check_error(error.get(), errc::module_trap);
    }

    handle<wasmtime_store_t, wasmtime_store_delete> _store;
    wasmtime_instance_t _instance;
    guest_memory _memory;
    std::optional<uint64_t> _fuel;
};

// The policy decides which parts of the host environment WASI exposes.
handle<wasi_config_t, wasi_config_delete>
make_wasi_config(const capability_policy& policy) {
    handle<wasi_config_t, wasi_config_delete> wasi(wasi_config_new());
    if (policy.allows(capability::stdio)) {
        wasi_config_inherit_stdin(wasi.get());
        wasi_config_inherit_stdout(wasi.get());
        wasi_config_inherit_stderr(wasi.get());
    }
    if (policy.allows(capability::environment)) {
        wasi_config_inherit_env(wasi.get());
        wasi_config_inherit_argv(wasi.get());
    }
    for (const auto& dir : policy.preopened_dirs()) {
        if (!wasi_config_preopen_dir(
              wasi.get(), dir.host_path.c_str(), dir.guest_path.c_str())) {
            throw modhost_exception(
              ss::format(
                "unable to preopen {} as {}", dir.host_path, dir.guest_path),
              errc::invalid_binary);
        }
    }
    return wasi;
}

class module_impl final : public sandbox::module {
public:
    module_impl(
      wasm_engine_t* engine,
      handle<wasmtime_module_t, wasmtime_module_delete> mod,
      sandbox::module_declarations decls,
      std::optional<uint64_t> fuel)
      : _engine(engine)
      , _module(std::move(mod))
      , _declarations(std::move(decls))
      , _fuel(fuel) {}

    const sandbox::module_declarations& declarations() const final {
        return _declarations;
    }

    std::unique_ptr<sandbox::instance>
    instantiate(const sandbox::instance_options& opts) final {
        handle<wasmtime_store_t, wasmtime_store_delete> store{
          wasmtime_store_new(_engine, /*data=*/nullptr, /*finalizer=*/nullptr)};
        if (opts.max_memory_pages) {
            // Negative values keep Wasmtime's defaults.
            wasmtime_store_limiter(
              store.get(),
              /*memory_size=*/int64_t(*opts.max_memory_pages) * ffi::page_size,
              /*table_elements=*/-1,
              /*instances=*/1,
              /*tables=*/-1,
              /*memories=*/1);
        }
        auto* context = wasmtime_store_context(store.get());
        if (_fuel) {
            handle<wasmtime_error_t, wasmtime_error_delete> error(
              wasmtime_context_set_fuel(context, *_fuel));
            check_error(error.get(), errc::invalid_binary);
        }

        // The context takes ownership of the config.
        handle<wasmtime_error_t, wasmtime_error_delete> error(
          wasmtime_context_set_wasi(
            context, make_wasi_config(opts.policy).release()));
        check_error(error.get(), errc::invalid_binary);

        handle<wasmtime_linker_t, wasmtime_linker_delete> linker{
          wasmtime_linker_new(_engine)};
        error.reset(wasmtime_linker_define_wasi(linker.get()));
        check_error(error.get(), errc::invalid_binary);

        wasmtime_instance_t instance;
        handle<wasm_trap_t, wasm_trap_delete> trap;
        {
            auto trap_out = out_handle(trap);
            error.reset(wasmtime_linker_instantiate(
              linker.get(), context, _module.get(), &instance, trap_out));
        }
        // A trap in the module's start function fails the load.
        check_error(error.get(), errc::invalid_binary);
        check_trap(trap.get(), errc::invalid_binary);

        std::string_view memory_export_name = "memory";
        wasmtime_extern_t memory_extern;
        bool ok = wasmtime_instance_export_get(
          context,
          &instance,
          memory_export_name.data(),
          memory_export_name.size(),
          &memory_extern);
        if (!ok || memory_extern.kind != WASMTIME_EXTERN_MEMORY) {
            throw modhost_exception(
              "module missing memory export", errc::invalid_binary);
        }
        return std::make_unique<instance_impl>(
          std::move(store), instance, memory_extern.of.memory, _fuel);
    }

private:
    wasm_engine_t* _engine;
    handle<wasmtime_module_t, wasmtime_module_delete> _module;
    sandbox::module_declarations _declarations;
    std::optional<uint64_t> _fuel;
};

class wasmtime_engine final : public sandbox::engine {
public:
    explicit wasmtime_engine(const runtime_config& cfg)
      : _fuel(cfg.fuel_per_invocation) {
        wasm_config_t* config = wasm_config_new();

        if (cfg.optimize) {
            // Spend more time compiling so that we can have faster code.
            wasmtime_config_cranelift_opt_level_set(
              config, WASMTIME_OPT_LEVEL_SPEED);
        }
        // Fuel allows us to stop execution after some time.
        wasmtime_config_consume_fuel_set(config, _fuel.has_value());
        // We want to enable memcopy and other efficent memcpy operators
        wasmtime_config_wasm_bulk_memory_set(config, true);
        wasmtime_config_max_wasm_stack_set(config, cfg.max_wasm_stack);
        // Registering unwind info makes C++ exceptions take a lock in libgcc
        // that a trapping guest can leave held.
        wasmtime_config_native_unwind_info_set(config, false);

        _engine.reset(wasm_engine_new_with_config(config));
        vlog(modhost_log.info, "created wasmtime engine with config {}", cfg);
    }

    std::shared_ptr<sandbox::module> compile(bytes_view binary) final {
        handle<wasmtime_module_t, wasmtime_module_delete> user_module;
        handle<wasmtime_error_t, wasmtime_error_delete> error{
          wasmtime_module_new(
            _engine.get(),
            binary.data(),
            binary.size(),
            out_handle(user_module))};
        check_error(error.get(), errc::invalid_binary);
        auto decls = extract_declarations(user_module.get());
        return std::make_shared<module_impl>(
          _engine.get(), std::move(user_module), std::move(decls), _fuel);
    }

private:
    handle<wasm_engine_t, &wasm_engine_delete> _engine;
    std::optional<uint64_t> _fuel;
};

} // namespace

std::unique_ptr<sandbox::engine> create_engine(const runtime_config& cfg) {
    return std::make_unique<wasmtime_engine>(cfg);
}

bytes wat_to_wasm(std::string_view wat) {
    wasm_byte_vec_t wasm{.size = 0, .data = nullptr};
    handle<wasmtime_error_t, wasmtime_error_delete> error(
      wasmtime_wat2wasm(wat.data(), wat.size(), &wasm));
    check_error(error.get(), errc::invalid_binary);
    auto free_wasm = ss::defer(
      [&wasm]() noexcept { wasm_byte_vec_delete(&wasm); });
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return bytes(reinterpret_cast<const uint8_t*>(wasm.data), wasm.size);
}

} // namespace modhost::wasmtime
