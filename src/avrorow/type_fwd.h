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

/// \file avrorow/type_fwd.h
/// Forward declarations and enum definitions.  When writing your own headers,
/// you can include this instead of the "full" headers to help reduce compile
/// times.

#include <string_view>

#include "avrorow/avrorow_export.h"

namespace avrorow {

/// \brief The Avro type tags.
enum class AvroType {
  kNull,
  kBoolean,
  kInt,
  kLong,
  kFloat,
  kDouble,
  kBytes,
  kString,
  kFixed,
  kEnum,
  kArray,
  kMap,
  kRecord,
  kUnion,
};

/// \brief The Avro logical type annotations understood by the parser.
enum class LogicalTypeKind {
  kNone,
  kDate,
  kTimeMillis,
  kTimeMicros,
  kTimestampMillis,
  kTimestampMicros,
  kDecimal,
  kDuration,
};

/// \brief Get the Avro name of a type tag, e.g. "record".
AVROROW_EXPORT std::string_view ToString(AvroType type);

/// \brief Get the Avro name of a logical type, e.g. "timestamp-millis".
AVROROW_EXPORT std::string_view ToString(LogicalTypeKind kind);

struct LogicalType;
class SchemaNode;
class PrimitiveNode;
class FixedNode;
class EnumNode;
class RecordField;
class RecordNode;
class ArrayNode;
class MapNode;
class UnionNode;

class Value;
class Row;
class FieldPath;
class ParserConfig;

namespace avro {
class RecordParser;
}  // namespace avro

}  // namespace avrorow
