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
#include "modhost/columnar.h"

#include "base/vlog.h"
#include "modhost/abi.h"
#include "modhost/errc.h"
#include "modhost/logger.h"
#include "modhost/module_instance.h"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/record_batch.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <string>

namespace modhost::columnar {

result<bytes> serialize(const arrow::RecordBatch& batch) {
    auto sink = arrow::io::BufferOutputStream::Create();
    if (!sink.ok()) {
        vlog(
          modhost_log.warn,
          "unable to create arrow sink: {}",
          sink.status().ToString());
        return errc::serialization_error;
    }
    auto writer = arrow::ipc::MakeStreamWriter(*sink, batch.schema());
    if (!writer.ok()) {
        vlog(
          modhost_log.warn,
          "unable to create arrow stream writer: {}",
          writer.status().ToString());
        return errc::serialization_error;
    }
    arrow::Status status = (*writer)->WriteRecordBatch(batch);
    if (status.ok()) {
        status = (*writer)->Close();
    }
    if (!status.ok()) {
        vlog(
          modhost_log.warn,
          "unable to write record batch: {}",
          status.ToString());
        return errc::serialization_error;
    }
    auto buffer = (*sink)->Finish();
    if (!buffer.ok()) {
        vlog(
          modhost_log.warn,
          "unable to finish arrow stream: {}",
          buffer.status().ToString());
        return errc::serialization_error;
    }
    return bytes((*buffer)->data(), (*buffer)->size());
}

result<std::shared_ptr<arrow::RecordBatch>> deserialize(bytes_view data) {
    // Batches read from a stream reference its buffer, so it owns a copy.
    auto input = std::make_shared<arrow::io::BufferReader>(
      arrow::Buffer::FromString(std::string(as_string_view(data))));
    auto reader = arrow::ipc::RecordBatchStreamReader::Open(input);
    if (!reader.ok()) {
        vlog(
          modhost_log.debug,
          "invalid arrow stream: {}",
          reader.status().ToString());
        return errc::serialization_error;
    }
    std::shared_ptr<arrow::RecordBatch> batch;
    arrow::Status status = (*reader)->ReadNext(&batch);
    if (!status.ok() || !batch) {
        vlog(
          modhost_log.debug,
          "arrow stream has no readable record batch: {}",
          status.ToString());
        return errc::serialization_error;
    }
    std::shared_ptr<arrow::RecordBatch> trailing;
    status = (*reader)->ReadNext(&trailing);
    if (!status.ok() || trailing) {
        vlog(
          modhost_log.debug,
          "arrow stream holds more than one record batch: {}",
          status.ToString());
        return errc::serialization_error;
    }
    status = batch->ValidateFull();
    if (!status.ok()) {
        vlog(
          modhost_log.debug,
          "invalid record batch: {}",
          status.ToString());
        return errc::serialization_error;
    }
    return batch;
}

result<std::shared_ptr<arrow::RecordBatch>> call(
  module_instance& instance,
  std::string_view fn,
  const arrow::RecordBatch& batch) {
    auto payload = serialize(batch);
    if (payload.has_error()) {
        return payload.error();
    }
    auto output = instance.call(fn, convention::columnar_bulk, payload.value());
    if (output.has_error()) {
        return output.error();
    }
    return deserialize(output.value());
}

} // namespace modhost::columnar
