/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#pragma once

/// \file avrorow/arrow/row_batch_builder.h
/// Assembly of rows into Arrow record batches.

#include <cstdint>
#include <memory>
#include <optional>

#include <arrow/array/builder_nested.h>
#include <arrow/memory_pool.h>
#include <arrow/record_batch.h>
#include <arrow/type_fwd.h>

#include "avrorow/avrorow_export.h"
#include "avrorow/result.h"
#include "avrorow/row.h"
#include "avrorow/schema_node.h"

namespace avrorow::arrow {

/// \brief Appends rows of one record schema to Arrow builders.
///
/// The column types follow ToArrowSchema.  A builder is not thread-safe; use
/// one per thread.
class AVROROW_EXPORT RowBatchBuilder {
 public:
  /// \brief Create a builder for rows of the given record schema.
  ///
  /// \return NotSupported if the schema has no Arrow counterpart.
  static Result<std::unique_ptr<RowBatchBuilder>> Make(
      std::shared_ptr<const RecordNode> schema,
      ::arrow::MemoryPool* pool = ::arrow::default_memory_pool());

  /// \brief Append one row.
  ///
  /// A row with a value that does not fit its column is rejected before
  /// anything is appended, and the builder stays usable.  If Arrow itself
  /// fails while appending, that error is kept and returned by every later
  /// Append and Finish.
  ///
  /// \return InvalidArgument if the row has a different schema, InvalidArrowData
  /// if a value does not fit its column.
  Status Append(const Row& row);

  /// \brief Build a record batch from the rows appended so far and reset the
  /// builder.
  Result<std::shared_ptr<::arrow::RecordBatch>> Finish();

  int64_t num_rows() const { return builder_->length(); }

  const std::shared_ptr<::arrow::Schema>& arrow_schema() const { return arrow_schema_; }

 private:
  RowBatchBuilder(std::shared_ptr<const RecordNode> schema,
                  std::shared_ptr<::arrow::Schema> arrow_schema,
                  std::unique_ptr<::arrow::StructBuilder> builder);

  std::shared_ptr<const RecordNode> schema_;
  std::shared_ptr<::arrow::Schema> arrow_schema_;
  std::unique_ptr<::arrow::StructBuilder> builder_;
  std::optional<Error> failure_;
};

}  // namespace avrorow::arrow
