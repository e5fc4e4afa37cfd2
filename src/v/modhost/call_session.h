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
#include "modhost/fwd.h"

#include <seastar/core/sstring.hh>

#include <ostream>
#include <system_error>
#include <vector>

namespace modhost {

enum class session_state {
    idle,
    allocating,
    writing,
    invoking,
    reading,
    releasing,
    done,
    failed,
};
std::ostream& operator<<(std::ostream&, session_state);

// What is being called and the module memory the call owns right now.
struct call_descriptor {
    ss::sstring function;
    convention conv;
    std::vector<owned_buffer> owned;
};

/**
 * Drives a single call end to end:
 *
 *   acquire input -> write input -> invoke -> read output
 *     -> release input -> release outputs
 *
 * Every allocation the session acquired or adopted is released before run
 * returns, whatever the outcome. A trap while invoking faults the instance
 * and skips the output entirely.
 *
 * A session runs once.
 */
class call_session {
public:
    call_session(module_instance*, ss::sstring function, convention);
    call_session(const call_session&) = delete;
    call_session& operator=(const call_session&) = delete;
    call_session(call_session&&) = delete;
    call_session& operator=(call_session&&) = delete;
    ~call_session() = default;

    result<bytes> run(bytes_view payload);

    session_state state() const { return _state; }
    const call_descriptor& descriptor() const { return _descriptor; }

private:
    void transition(session_state);
    std::error_code fail(std::error_code);
    std::error_code abort(std::error_code);
    std::error_code abort_after_trap();
    result<void> release_owned();

    module_instance* _instance;
    call_descriptor _descriptor;
    session_state _state{session_state::idle};
};

} // namespace modhost

MODHOST_OSTREAM_FMT(modhost::session_state)
