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

#include "bytes/bytes.h"
#include "modhost/config.h"
#include "modhost/sandbox.h"

#include <memory>
#include <string_view>

namespace modhost::wasmtime {

/**
 * A sandbox engine backed by Wasmtime. WASI preview1 is provided to modules,
 * with stdio, environment and preopened directories only wired up when the
 * instance's policy allows them.
 */
std::unique_ptr<sandbox::engine> create_engine(const runtime_config&);

/**
 * Translate the WebAssembly text format into a binary module.
 *
 * Throws modhost_exception with errc::invalid_binary on malformed text.
 */
bytes wat_to_wasm(std::string_view wat);

} // namespace modhost::wasmtime
