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

#include <exception>
#include <string>
#include <system_error>

namespace modhost {
enum class errc {
    success = 0,
    // The binary failed validation or instantiation
    invalid_binary,
    // The module imports something outside of its capability policy
    disallowed_capability,
    // The module could not satisfy an allocation, even after growth
    allocation_failed,
    // A pointer or length outside of a live allocation or the region
    out_of_bounds,
    // Release of an allocation that was already released
    double_free,
    // The module trapped, the instance is no longer usable
    module_trap,
    // A payload could not be encoded or decoded
    serialization_error,
    // The function is not exported or has the wrong signature
    missing_export,
    // Another call is already in flight on the instance
    instance_busy,
    module_not_found,
    module_not_ready,
    module_already_loaded,
};

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "modhost::errc"; }

    std::string message(int c) const final {
        switch (static_cast<errc>(c)) {
        case errc::success:
            return "modhost::errc::success";
        case errc::invalid_binary:
            return "modhost::errc::invalid_binary";
        case errc::disallowed_capability:
            return "modhost::errc::disallowed_capability";
        case errc::allocation_failed:
            return "modhost::errc::allocation_failed";
        case errc::out_of_bounds:
            return "modhost::errc::out_of_bounds";
        case errc::double_free:
            return "modhost::errc::double_free";
        case errc::module_trap:
            return "modhost::errc::module_trap";
        case errc::serialization_error:
            return "modhost::errc::serialization_error";
        case errc::missing_export:
            return "modhost::errc::missing_export";
        case errc::instance_busy:
            return "modhost::errc::instance_busy";
        case errc::module_not_found:
            return "modhost::errc::module_not_found";
        case errc::module_not_ready:
            return "modhost::errc::module_not_ready";
        case errc::module_already_loaded:
            return "modhost::errc::module_already_loaded";
        default:
            return "modhost::errc::unknown(" + std::to_string(c) + ")";
        }
    }
};
inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

/**
 * Thrown by the sandbox engine layer. Everything above the sandbox seam
 * converts it into an error code.
 */
class modhost_exception final : public std::exception {
public:
    explicit modhost_exception(std::string msg, errc err_code) noexcept
      : _msg(std::move(msg))
      , _err_code(err_code) {}

    const char* what() const noexcept final { return _msg.c_str(); }

    errc error_code() const noexcept { return _err_code; }

private:
    std::string _msg;
    errc _err_code;
};

} // namespace modhost

namespace std {
template<>
struct is_error_code_enum<modhost::errc> : true_type {};
} // namespace std
