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

/// \file avrorow/avro/avro_record_parser.h
/// Conversion of avro-cpp generic records into rows.
///
/// The parser walks a schema node tree and a correspondingly shaped
/// avro::GenericDatum.  Every error message starts with the path of the
/// offending value below the root record, e.g. `regions["cities"][1].name`.

#include <cstdint>
#include <memory>
#include <string_view>

#include <avro/Generic.hh>

#include "avrorow/avrorow_export.h"
#include "avrorow/parser_config.h"
#include "avrorow/result.h"
#include "avrorow/row.h"
#include "avrorow/schema_node.h"
#include "avrorow/value.h"

namespace avro {
class ValidSchema;
}  // namespace avro

namespace avrorow::avro {

/// \brief Convert one Avro value according to its schema node.
///
/// Unions resolve to their first member that is structurally compatible with
/// the runtime value.  Native scalars accept the Avro promotions int to long,
/// int and long to float and double, float to double and string to and from
/// bytes.  A promotion counts as compatible even when an exact member is
/// declared later: `["string", "bytes"]` turns a bytes value into a string.
/// A union with a single non-null member converts a non-null value exactly as
/// that member would, errors included.
///
/// \return The converted value, or SchemaMismatch, MissingField,
/// MalformedLogicalValue or InvalidArgument (bad configuration).
AVROROW_EXPORT Result<Value> Dispatch(const SchemaNodePtr& node,
                                      const ::avro::GenericDatum& datum,
                                      const ParserConfig& config = ParserConfig{});

/// \brief Convert an Avro record into a row with one value per field of
/// `schema`, in field declaration order.  Fields absent from the record are
/// null when nullable and a MissingField error otherwise.
AVROROW_EXPORT Result<Row> ParseRecord(const std::shared_ptr<const RecordNode>& schema,
                                       const ::avro::GenericRecord& record,
                                       const ParserConfig& config = ParserConfig{});

/// \brief A parser bound to one record schema.  It holds no mutable state and
/// may be shared by any number of threads.
class AVROROW_EXPORT RecordParser {
 public:
  /// \brief Create a parser for the given record schema.
  ///
  /// \return InvalidArgument if the schema is null or the configuration holds
  /// an unparsable or negative entry.
  static Result<RecordParser> Make(std::shared_ptr<const RecordNode> schema,
                                   const ParserConfig& config = ParserConfig{});

  /// \brief Create a parser for the root record of an avro-cpp schema.
  static Result<RecordParser> Make(const ::avro::ValidSchema& schema,
                                   const ParserConfig& config = ParserConfig{});

  /// \brief Create a parser from an Avro JSON schema.
  static Result<RecordParser> MakeFromJson(std::string_view json,
                                           const ParserConfig& config = ParserConfig{});

  /// \brief Parse a datum holding a record.
  Result<Row> Parse(const ::avro::GenericDatum& datum) const;

  /// \brief Parse a record.
  Result<Row> Parse(const ::avro::GenericRecord& record) const;

  const std::shared_ptr<const RecordNode>& schema() const { return schema_; }
  int32_t max_nesting_depth() const { return max_nesting_depth_; }
  bool validate_time_of_day() const { return validate_time_of_day_; }

 private:
  RecordParser(std::shared_ptr<const RecordNode> schema, int32_t max_nesting_depth,
               bool validate_time_of_day);

  std::shared_ptr<const RecordNode> schema_;
  int32_t max_nesting_depth_;
  bool validate_time_of_day_;
};

}  // namespace avrorow::avro
