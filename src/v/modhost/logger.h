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

#include "base/seastarx.h"

#include <seastar/util/log.hh>

namespace modhost {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
extern ss::logger modhost_log;
} // namespace modhost
