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

#include "avrorow/arrow/row_batch_builder.h"

#include <algorithm>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

#include <arrow/array/builder_binary.h>
#include <arrow/array/builder_decimal.h>
#include <arrow/array/builder_primitive.h>
#include <arrow/array/builder_time.h>
#include <arrow/builder.h>
#include <arrow/c/bridge.h>
#include <arrow/type.h>
#include <arrow/util/checked_cast.h>

#include "avrorow/arrow/arrow_error_transform_internal.h"
#include "avrorow/schema_internal.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep
#include "avrorow/util/logging_internal.h"
#include "avrorow/util/macros.h"

namespace avrorow::arrow {

using ::arrow::internal::checked_cast;

namespace {

constexpr int64_t kNanosPerMilli = 1'000'000;

/// \brief Get the payload of a value, or InvalidArrowData if it holds another
/// kind.
template <typename T>
Result<const T*> Expect(const SchemaNode& node, const Value& value) {
  if (const T* payload = value.get_if<T>(); payload != nullptr) {
    return payload;
  }
  return InvalidArrowData("Cannot append {} value to column of {}", value.kind(), node);
}

/// \brief Resolve a union to the member that owns the Arrow column.
Result<const SchemaNode*> ColumnNode(const SchemaNode& node) {
  if (node.type() != AvroType::kUnion) {
    return &node;
  }
  const auto& union_node = static_cast<const UnionNode&>(node);
  if (const SchemaNode* member = union_node.single_non_null_member(); member != nullptr) {
    return member;
  }
  if (union_node.members().size() == 1) {
    return union_node.members()[0].get();
  }
  return NotSupported("Cannot append values of {} to an Arrow column", node);
}

/// \brief The value kind held by a column of `node`, which is not a union.
ValueKind ColumnKind(const SchemaNode& node) {
  switch (node.logical_type().kind) {
    case LogicalTypeKind::kDate:
      return ValueKind::kDate;
    case LogicalTypeKind::kTimeMillis:
      return ValueKind::kTimeMillis;
    case LogicalTypeKind::kTimeMicros:
      return ValueKind::kTimeMicros;
    case LogicalTypeKind::kTimestampMillis:
      return ValueKind::kTimestampMillis;
    case LogicalTypeKind::kTimestampMicros:
      return ValueKind::kTimestampMicros;
    case LogicalTypeKind::kDecimal:
      return ValueKind::kDecimal;
    case LogicalTypeKind::kDuration:
      return ValueKind::kDuration;
    case LogicalTypeKind::kNone:
      break;
  }
  switch (node.type()) {
    case AvroType::kNull:
    case AvroType::kUnion:
      return ValueKind::kNull;
    case AvroType::kBoolean:
      return ValueKind::kBoolean;
    case AvroType::kInt:
      return ValueKind::kInt;
    case AvroType::kLong:
      return ValueKind::kLong;
    case AvroType::kFloat:
      return ValueKind::kFloat;
    case AvroType::kDouble:
      return ValueKind::kDouble;
    case AvroType::kString:
    case AvroType::kEnum:
      return ValueKind::kString;
    case AvroType::kBytes:
    case AvroType::kFixed:
      return ValueKind::kBytes;
    case AvroType::kRecord:
      return ValueKind::kRow;
    case AvroType::kArray:
      return ValueKind::kList;
    case AvroType::kMap:
      return ValueKind::kMap;
  }
  std::unreachable();
}

Status CheckValue(const SchemaNode& declared, const Value& value);

Status CheckFields(const RecordNode& record, const Row& row) {
  const auto fields = record.fields();
  if (row.size() != fields.size()) {
    return InvalidArrowData("Cannot append row of {} values to column of {}", row.size(),
                            record);
  }
  for (size_t i = 0; i < fields.size(); ++i) {
    AVROROW_RETURN_UNEXPECTED(CheckValue(*fields[i].node(), row[i]));
  }
  return {};
}

/// \brief Check that a value fits its column without touching any builder, so
/// that a rejected row leaves every column at the same length.
Status CheckValue(const SchemaNode& declared, const Value& value) {
  if (value.is_null()) {
    if (!declared.nullable()) {
      return InvalidArrowData("Cannot append null to column of {}", declared);
    }
    return {};
  }

  AVROROW_ASSIGN_OR_RAISE(const SchemaNode* node, ColumnNode(declared));
  if (node->type() == AvroType::kNull || value.kind() != ColumnKind(*node)) {
    return InvalidArrowData("Cannot append {} value to column of {}", value.kind(),
                            *node);
  }
  switch (value.kind()) {
    case ValueKind::kBytes:
      if (node->type() == AvroType::kFixed &&
          value.get_if<Bytes>()->size() != static_cast<const FixedNode&>(*node).size()) {
        return InvalidArrowData("Cannot append {} bytes to column of {}",
                                value.get_if<Bytes>()->size(), *node);
      }
      return {};
    case ValueKind::kDuration: {
      constexpr auto kMaxComponent =
          static_cast<uint32_t>(std::numeric_limits<int32_t>::max());
      const auto* duration = value.get_if<Duration>();
      if (duration->months > kMaxComponent || duration->days > kMaxComponent) {
        return InvalidArrowData("Duration of {} months and {} days exceeds Arrow interval",
                                duration->months, duration->days);
      }
      return {};
    }
    case ValueKind::kRow:
      return CheckFields(static_cast<const RecordNode&>(*node), value.row());
    case ValueKind::kList: {
      const auto& element = *static_cast<const ArrayNode&>(*node).element();
      for (const auto& item : value.list()) {
        AVROROW_RETURN_UNEXPECTED(CheckValue(element, item));
      }
      return {};
    }
    case ValueKind::kMap: {
      const auto& entry_node = *static_cast<const MapNode&>(*node).value();
      for (const auto& [key, entry] : value.map()) {
        AVROROW_RETURN_UNEXPECTED(CheckValue(entry_node, entry));
      }
      return {};
    }
    default:
      return {};
  }
}

// The append functions expect values accepted by CheckValue.
Status AppendValue(const SchemaNode& node, const Value& value,
                   ::arrow::ArrayBuilder* builder);

Status AppendFields(const RecordNode& record, const Row& row,
                    ::arrow::StructBuilder* builder) {
  AVROROW_ARROW_RETURN_NOT_OK(builder->Append());
  const auto fields = record.fields();
  for (size_t i = 0; i < fields.size(); ++i) {
    AVROROW_RETURN_UNEXPECTED(AppendValue(*fields[i].node(), row[i],
                                          builder->field_builder(static_cast<int>(i))));
  }
  return {};
}

Status AppendMap(const MapNode& node, const ValueMap& entries,
                 ::arrow::MapBuilder* builder) {
  // Keys are appended in sorted order so that equal maps build equal arrays.
  std::vector<const ValueMap::value_type*> sorted;
  sorted.reserve(entries.size());
  for (const auto& entry : entries) {
    sorted.push_back(&entry);
  }
  std::ranges::sort(sorted, {}, [](const auto* entry) { return entry->first; });

  AVROROW_ARROW_RETURN_NOT_OK(builder->Append());
  auto* key_builder = checked_cast<::arrow::StringBuilder*>(builder->key_builder());
  for (const auto* entry : sorted) {
    AVROROW_ARROW_RETURN_NOT_OK(key_builder->Append(entry->first));
    AVROROW_RETURN_UNEXPECTED(
        AppendValue(*node.value(), entry->second, builder->item_builder()));
  }
  return {};
}

Status AppendBinaryLike(const SchemaNode& node, const Value& value,
                        ::arrow::ArrayBuilder* builder) {
  switch (node.logical_type().kind) {
    case LogicalTypeKind::kDecimal: {
      AVROROW_ASSIGN_OR_RAISE(auto decimal, Expect<Decimal>(node, value));
      AVROROW_ARROW_RETURN_NOT_OK(
          checked_cast<::arrow::Decimal128Builder*>(builder)->Append(decimal->unscaled));
      return {};
    }
    case LogicalTypeKind::kDuration: {
      AVROROW_ASSIGN_OR_RAISE(auto duration, Expect<Duration>(node, value));
      ::arrow::MonthDayNanoIntervalType::MonthDayNanos interval{
          .months = static_cast<int32_t>(duration->months),
          .days = static_cast<int32_t>(duration->days),
          .nanoseconds = static_cast<int64_t>(duration->milliseconds) * kNanosPerMilli};
      AVROROW_ARROW_RETURN_NOT_OK(
          checked_cast<::arrow::MonthDayNanoIntervalBuilder*>(builder)->Append(interval));
      return {};
    }
    default:
      break;
  }

  AVROROW_ASSIGN_OR_RAISE(auto bytes, Expect<Bytes>(node, value));
  if (node.type() == AvroType::kFixed) {
    AVROROW_ARROW_RETURN_NOT_OK(
        checked_cast<::arrow::FixedSizeBinaryBuilder*>(builder)->Append(bytes->data()));
  } else {
    AVROROW_ARROW_RETURN_NOT_OK(checked_cast<::arrow::BinaryBuilder*>(builder)->Append(
        bytes->data(), static_cast<int32_t>(bytes->size())));
  }
  return {};
}

Status AppendValue(const SchemaNode& declared, const Value& value,
                   ::arrow::ArrayBuilder* builder) {
  if (value.is_null()) {
    if (!declared.nullable()) {
      return InvalidArrowData("Cannot append null to column of {}", declared);
    }
    AVROROW_ARROW_RETURN_NOT_OK(builder->AppendNull());
    return {};
  }

  AVROROW_ASSIGN_OR_RAISE(const SchemaNode* node, ColumnNode(declared));
  const auto logical_kind = node->logical_type().kind;
  switch (node->type()) {
    case AvroType::kNull:
    case AvroType::kUnion:
      return InvalidArrowData("Cannot append {} value to column of {}", value.kind(),
                              *node);
    case AvroType::kBoolean: {
      AVROROW_ASSIGN_OR_RAISE(auto payload, Expect<bool>(*node, value));
      AVROROW_ARROW_RETURN_NOT_OK(
          checked_cast<::arrow::BooleanBuilder*>(builder)->Append(*payload));
      return {};
    }
    case AvroType::kInt: {
      if (logical_kind == LogicalTypeKind::kDate) {
        AVROROW_ASSIGN_OR_RAISE(auto date, Expect<Date>(*node, value));
        AVROROW_ARROW_RETURN_NOT_OK(checked_cast<::arrow::Date32Builder*>(builder)->Append(
            static_cast<int32_t>(date->time_since_epoch().count())));
      } else if (logical_kind == LogicalTypeKind::kTimeMillis) {
        AVROROW_ASSIGN_OR_RAISE(auto time, Expect<TimeMillis>(*node, value));
        AVROROW_ARROW_RETURN_NOT_OK(checked_cast<::arrow::Time32Builder*>(builder)->Append(
            static_cast<int32_t>(time->count())));
      } else {
        AVROROW_ASSIGN_OR_RAISE(auto payload, Expect<int32_t>(*node, value));
        AVROROW_ARROW_RETURN_NOT_OK(
            checked_cast<::arrow::Int32Builder*>(builder)->Append(*payload));
      }
      return {};
    }
    case AvroType::kLong: {
      if (logical_kind == LogicalTypeKind::kTimeMicros) {
        AVROROW_ASSIGN_OR_RAISE(auto time, Expect<TimeMicros>(*node, value));
        AVROROW_ARROW_RETURN_NOT_OK(
            checked_cast<::arrow::Time64Builder*>(builder)->Append(time->count()));
      } else if (logical_kind == LogicalTypeKind::kTimestampMillis) {
        AVROROW_ASSIGN_OR_RAISE(auto timestamp, Expect<TimestampMillis>(*node, value));
        AVROROW_ARROW_RETURN_NOT_OK(checked_cast<::arrow::TimestampBuilder*>(builder)->Append(
            timestamp->time_since_epoch().count()));
      } else if (logical_kind == LogicalTypeKind::kTimestampMicros) {
        AVROROW_ASSIGN_OR_RAISE(auto timestamp, Expect<TimestampMicros>(*node, value));
        AVROROW_ARROW_RETURN_NOT_OK(checked_cast<::arrow::TimestampBuilder*>(builder)->Append(
            timestamp->time_since_epoch().count()));
      } else {
        AVROROW_ASSIGN_OR_RAISE(auto payload, Expect<int64_t>(*node, value));
        AVROROW_ARROW_RETURN_NOT_OK(
            checked_cast<::arrow::Int64Builder*>(builder)->Append(*payload));
      }
      return {};
    }
    case AvroType::kFloat: {
      AVROROW_ASSIGN_OR_RAISE(auto payload, Expect<float>(*node, value));
      AVROROW_ARROW_RETURN_NOT_OK(
          checked_cast<::arrow::FloatBuilder*>(builder)->Append(*payload));
      return {};
    }
    case AvroType::kDouble: {
      AVROROW_ASSIGN_OR_RAISE(auto payload, Expect<double>(*node, value));
      AVROROW_ARROW_RETURN_NOT_OK(
          checked_cast<::arrow::DoubleBuilder*>(builder)->Append(*payload));
      return {};
    }
    case AvroType::kString:
    case AvroType::kEnum: {
      AVROROW_ASSIGN_OR_RAISE(auto payload, Expect<std::string>(*node, value));
      AVROROW_ARROW_RETURN_NOT_OK(
          checked_cast<::arrow::StringBuilder*>(builder)->Append(*payload));
      return {};
    }
    case AvroType::kBytes:
    case AvroType::kFixed:
      return AppendBinaryLike(*node, value, builder);
    case AvroType::kRecord: {
      AVROROW_ASSIGN_OR_RAISE(auto row, Expect<std::shared_ptr<const Row>>(*node, value));
      return AppendFields(static_cast<const RecordNode&>(*node), **row,
                          checked_cast<::arrow::StructBuilder*>(builder));
    }
    case AvroType::kArray: {
      AVROROW_ASSIGN_OR_RAISE(auto list,
                              Expect<std::shared_ptr<const ValueList>>(*node, value));
      auto* list_builder = checked_cast<::arrow::ListBuilder*>(builder);
      AVROROW_ARROW_RETURN_NOT_OK(list_builder->Append());
      const auto& element = *static_cast<const ArrayNode&>(*node).element();
      for (const auto& item : **list) {
        AVROROW_RETURN_UNEXPECTED(AppendValue(element, item, list_builder->value_builder()));
      }
      return {};
    }
    case AvroType::kMap: {
      AVROROW_ASSIGN_OR_RAISE(auto map, Expect<std::shared_ptr<const ValueMap>>(*node, value));
      return AppendMap(static_cast<const MapNode&>(*node), **map,
                       checked_cast<::arrow::MapBuilder*>(builder));
    }
  }
  std::unreachable();
}

}  // namespace

RowBatchBuilder::RowBatchBuilder(std::shared_ptr<const RecordNode> schema,
                                 std::shared_ptr<::arrow::Schema> arrow_schema,
                                 std::unique_ptr<::arrow::StructBuilder> builder)
    : schema_(std::move(schema)),
      arrow_schema_(std::move(arrow_schema)),
      builder_(std::move(builder)) {}

Result<std::unique_ptr<RowBatchBuilder>> RowBatchBuilder::Make(
    std::shared_ptr<const RecordNode> schema, ::arrow::MemoryPool* pool) {
  if (schema == nullptr) {
    return InvalidArgument("Row batch builder requires a record schema");
  }

  ArrowSchema c_schema;
  AVROROW_RETURN_UNEXPECTED(ToArrowSchema(*schema, &c_schema));
  AVROROW_ARROW_ASSIGN_OR_RETURN(auto arrow_schema, ::arrow::ImportSchema(&c_schema));

  auto struct_type = ::arrow::struct_(arrow_schema->fields());
  AVROROW_ARROW_ASSIGN_OR_RETURN(auto builder, ::arrow::MakeBuilder(struct_type, pool));
  std::unique_ptr<::arrow::StructBuilder> struct_builder(
      checked_cast<::arrow::StructBuilder*>(builder.release()));

  return std::unique_ptr<RowBatchBuilder>(new RowBatchBuilder(
      std::move(schema), std::move(arrow_schema), std::move(struct_builder)));
}

Status RowBatchBuilder::Append(const Row& row) {
  if (row.schema() != schema_ && *row.schema() != *schema_) {
    return InvalidArgument("Cannot append row of {} to batch of {}", *row.schema(),
                           *schema_);
  }
  if (failure_.has_value()) {
    return std::unexpected<Error>(failure_.value());
  }
  AVROROW_RETURN_UNEXPECTED(CheckFields(*schema_, row));

  auto status = AppendFields(*schema_, row, builder_.get());
  if (!status.has_value()) {
    // Arrow failed part way through the row; the columns no longer line up.
    failure_ = status.error();
  }
  return status;
}

Result<std::shared_ptr<::arrow::RecordBatch>> RowBatchBuilder::Finish() {
  if (failure_.has_value()) {
    return std::unexpected<Error>(failure_.value());
  }
  const int64_t num_rows = builder_->length();
  std::shared_ptr<::arrow::StructArray> array;
  AVROROW_ARROW_RETURN_NOT_OK(builder_->Finish(&array));
  internal::Logger()->debug("Finished record batch of {} rows for record {}", num_rows,
                            std::string(schema_->name()));
  return ::arrow::RecordBatch::Make(arrow_schema_, num_rows, array->fields());
}

}  // namespace avrorow::arrow
