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

#include "avrorow/schema_internal.h"

#include <string>
#include <string_view>

#include "avrorow/schema_node.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep
#include "avrorow/util/macros.h"

namespace avrorow {

namespace {

#define AVROROW_NANOARROW_RETURN_NOT_OK(expr)                                          \
  do {                                                                                 \
    if (ArrowErrorCode _code = (expr); _code != NANOARROW_OK) [[unlikely]] {           \
      return InvalidSchema("Failed to build Arrow schema, nanoarrow error code: {}", \
                           _code);                                                     \
    }                                                                                  \
  } while (0)

constexpr std::string_view kListElementName = "item";
constexpr std::string_view kMapKeyName = "key";
constexpr std::string_view kMapValueName = "value";

Status ToArrowSchema(const SchemaNode& node, bool nullable, std::string_view name,
                     ArrowSchema* schema);

Status ToArrowUnionSchema(const UnionNode& node, std::string_view name,
                          ArrowSchema* schema) {
  const auto members = node.members();
  if (members.size() == 1 && node.nullable()) {
    AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_NA));
    AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetName(schema, std::string(name).c_str()));
    schema->flags |= ARROW_FLAG_NULLABLE;
    return {};
  }
  if (const SchemaNode* member = node.single_non_null_member(); member != nullptr) {
    return ToArrowSchema(*member, /*nullable=*/true, name, schema);
  }
  if (members.size() == 1) {
    return ToArrowSchema(*members[0], /*nullable=*/false, name, schema);
  }
  return NotSupported("Cannot map {} of field '{}' to an Arrow type", node, name);
}

Status ToArrowSchema(const SchemaNode& node, bool nullable, std::string_view name,
                     ArrowSchema* schema) {
  const auto& logical_type = node.logical_type();
  switch (node.type()) {
    case AvroType::kUnion:
      return ToArrowUnionSchema(static_cast<const UnionNode&>(node), name, schema);
    case AvroType::kRecord: {
      const auto& record = static_cast<const RecordNode&>(node);
      AVROROW_NANOARROW_RETURN_NOT_OK(
          ArrowSchemaSetTypeStruct(schema, static_cast<int64_t>(record.num_fields())));
      const auto fields = record.fields();
      for (size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        AVROROW_RETURN_UNEXPECTED(ToArrowSchema(*field.node(), field.nullable(),
                                                field.name(), schema->children[i]));
      }
    } break;
    case AvroType::kArray: {
      const auto& element = *static_cast<const ArrayNode&>(node).element();
      AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_LIST));
      AVROROW_RETURN_UNEXPECTED(ToArrowSchema(element, element.nullable(),
                                              kListElementName, schema->children[0]));
    } break;
    case AvroType::kMap: {
      const auto& value = *static_cast<const MapNode&>(node).value();
      AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_MAP));
      AVROROW_RETURN_UNEXPECTED(ToArrowSchema(*string(), /*nullable=*/false, kMapKeyName,
                                              schema->children[0]->children[0]));
      AVROROW_RETURN_UNEXPECTED(ToArrowSchema(value, value.nullable(), kMapValueName,
                                              schema->children[0]->children[1]));
    } break;
    case AvroType::kNull:
      AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_NA));
      nullable = true;
      break;
    case AvroType::kBoolean:
      AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_BOOL));
      break;
    case AvroType::kInt:
      if (logical_type.kind == LogicalTypeKind::kDate) {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_DATE32));
      } else if (logical_type.kind == LogicalTypeKind::kTimeMillis) {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetTypeDateTime(
            schema, NANOARROW_TYPE_TIME32, NANOARROW_TIME_UNIT_MILLI,
            /*timezone=*/nullptr));
      } else {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_INT32));
      }
      break;
    case AvroType::kLong:
      if (logical_type.kind == LogicalTypeKind::kTimeMicros) {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetTypeDateTime(
            schema, NANOARROW_TYPE_TIME64, NANOARROW_TIME_UNIT_MICRO,
            /*timezone=*/nullptr));
      } else if (logical_type.kind == LogicalTypeKind::kTimestampMillis) {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetTypeDateTime(
            schema, NANOARROW_TYPE_TIMESTAMP, NANOARROW_TIME_UNIT_MILLI, "UTC"));
      } else if (logical_type.kind == LogicalTypeKind::kTimestampMicros) {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetTypeDateTime(
            schema, NANOARROW_TYPE_TIMESTAMP, NANOARROW_TIME_UNIT_MICRO, "UTC"));
      } else {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_INT64));
      }
      break;
    case AvroType::kFloat:
      AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_FLOAT));
      break;
    case AvroType::kDouble:
      AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_DOUBLE));
      break;
    case AvroType::kString:
    case AvroType::kEnum:
      AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_STRING));
      break;
    case AvroType::kBytes:
    case AvroType::kFixed:
      if (logical_type.kind == LogicalTypeKind::kDecimal) {
        AVROROW_NANOARROW_RETURN_NOT_OK(
            ArrowSchemaSetTypeDecimal(schema, NANOARROW_TYPE_DECIMAL128,
                                      logical_type.precision, logical_type.scale));
      } else if (logical_type.kind == LogicalTypeKind::kDuration) {
        AVROROW_NANOARROW_RETURN_NOT_OK(
            ArrowSchemaSetType(schema, NANOARROW_TYPE_INTERVAL_MONTH_DAY_NANO));
      } else if (node.type() == AvroType::kFixed) {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetTypeFixedSize(
            schema, NANOARROW_TYPE_FIXED_SIZE_BINARY,
            static_cast<int32_t>(static_cast<const FixedNode&>(node).size())));
      } else {
        AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetType(schema, NANOARROW_TYPE_BINARY));
      }
      break;
  }

  if (!name.empty()) {
    AVROROW_NANOARROW_RETURN_NOT_OK(ArrowSchemaSetName(schema, std::string(name).c_str()));
  }

  if (nullable) {
    schema->flags |= ARROW_FLAG_NULLABLE;
  } else {
    schema->flags &= ~ARROW_FLAG_NULLABLE;
  }
  return {};
}

#undef AVROROW_NANOARROW_RETURN_NOT_OK

}  // namespace

Status ToArrowSchema(const RecordNode& schema, ArrowSchema* out) {
  if (out == nullptr) [[unlikely]] {
    return InvalidArgument("Output Arrow schema cannot be null");
  }

  ArrowSchemaInit(out);
  auto status = ToArrowSchema(schema, /*nullable=*/false, /*name=*/"", out);
  if (!status.has_value()) {
    ArrowSchemaRelease(out);
  }
  return status;
}

}  // namespace avrorow
