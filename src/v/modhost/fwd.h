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

namespace modhost {
class memory_broker;
class abi_adapter;
class call_session;
class module_instance;
class compiled_module;
class runtime;
class registry;
class capability_policy;
struct runtime_config;
} // namespace modhost

namespace modhost::sandbox {
class engine;
class module;
class instance;
class linear_memory;
} // namespace modhost::sandbox
