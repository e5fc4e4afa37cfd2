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

#include "base/outcome.h"
#include "bytes/bytes.h"
#include "modhost/fwd.h"

#include <arrow/type_fwd.h>

#include <memory>
#include <string_view>

/**
 * Columnar bulk payloads are Arrow IPC streams holding a single record
 * batch. The call path treats them as opaque bytes, these helpers are the
 * only place they are built or parsed.
 */
namespace modhost::columnar {

// errc::serialization_error if Arrow fails to write the stream.
result<bytes> serialize(const arrow::RecordBatch&);

/**
 * errc::serialization_error unless the bytes are a valid stream holding
 * exactly one record batch.
 */
result<std::shared_ptr<arrow::RecordBatch>> deserialize(bytes_view);

/**
 * Call a columnar_bulk export with a record batch and parse what it returns.
 */
result<std::shared_ptr<arrow::RecordBatch>>
call(module_instance&, std::string_view fn, const arrow::RecordBatch&);

} // namespace modhost::columnar
