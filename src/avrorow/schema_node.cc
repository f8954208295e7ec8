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

#include "avrorow/schema_node.h"

#include <algorithm>
#include <format>
#include <ranges>
#include <unordered_set>
#include <utility>

#include "avrorow/exception.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep
#include "avrorow/util/formatter_internal.h"
#include "avrorow/util/macros.h"

namespace avrorow {

std::string_view ToString(AvroType type) {
  switch (type) {
    case AvroType::kNull:
      return "null";
    case AvroType::kBoolean:
      return "boolean";
    case AvroType::kInt:
      return "int";
    case AvroType::kLong:
      return "long";
    case AvroType::kFloat:
      return "float";
    case AvroType::kDouble:
      return "double";
    case AvroType::kBytes:
      return "bytes";
    case AvroType::kString:
      return "string";
    case AvroType::kFixed:
      return "fixed";
    case AvroType::kEnum:
      return "enum";
    case AvroType::kArray:
      return "array";
    case AvroType::kMap:
      return "map";
    case AvroType::kRecord:
      return "record";
    case AvroType::kUnion:
      return "union";
  }
  std::unreachable();
}

std::string_view ToString(LogicalTypeKind kind) {
  switch (kind) {
    case LogicalTypeKind::kNone:
      return "none";
    case LogicalTypeKind::kDate:
      return "date";
    case LogicalTypeKind::kTimeMillis:
      return "time-millis";
    case LogicalTypeKind::kTimeMicros:
      return "time-micros";
    case LogicalTypeKind::kTimestampMillis:
      return "timestamp-millis";
    case LogicalTypeKind::kTimestampMicros:
      return "timestamp-micros";
    case LogicalTypeKind::kDecimal:
      return "decimal";
    case LogicalTypeKind::kDuration:
      return "duration";
  }
  std::unreachable();
}

std::string LogicalType::ToString() const {
  if (kind == LogicalTypeKind::kDecimal) {
    return std::format("decimal({}, {})", precision, scale);
  }
  return std::string(avrorow::ToString(kind));
}

int32_t MaxDecimalPrecision(size_t byte_width) {
  if (byte_width == 0) {
    return 0;
  }
  // Largest positive value is 2^(8n-1) - 1; count its decimal digits.
  // log10(2) ~= 0.30103
  auto bits = static_cast<double>(byte_width * 8 - 1);
  return static_cast<int32_t>(bits * 0.30102999566398120);
}

Status ValidateLogicalType(AvroType base, const LogicalType& logical_type,
                           size_t fixed_size) {
  switch (logical_type.kind) {
    case LogicalTypeKind::kNone:
      return {};
    case LogicalTypeKind::kDate:
    case LogicalTypeKind::kTimeMillis:
      if (base == AvroType::kInt) {
        return {};
      }
      break;
    case LogicalTypeKind::kTimeMicros:
    case LogicalTypeKind::kTimestampMillis:
    case LogicalTypeKind::kTimestampMicros:
      if (base == AvroType::kLong) {
        return {};
      }
      break;
    case LogicalTypeKind::kDecimal: {
      if (base != AvroType::kBytes && base != AvroType::kFixed) {
        break;
      }
      if (logical_type.precision < 1 ||
          logical_type.precision > LogicalType::kMaxDecimalPrecision) {
        return InvalidSchema("Decimal precision must be in [1, {}], got {}",
                             LogicalType::kMaxDecimalPrecision, logical_type.precision);
      }
      if (logical_type.scale < 0 || logical_type.scale > logical_type.precision) {
        return InvalidSchema("Decimal scale must be in [0, {}], got {}",
                             logical_type.precision, logical_type.scale);
      }
      if (base == AvroType::kFixed &&
          MaxDecimalPrecision(fixed_size) < logical_type.precision) {
        return InvalidSchema("Fixed size {} cannot hold a decimal of precision {}",
                             fixed_size, logical_type.precision);
      }
      return {};
    }
    case LogicalTypeKind::kDuration:
      if (base == AvroType::kFixed) {
        if (fixed_size != LogicalType::kDurationSize) {
          return InvalidSchema("Duration must be a fixed of size {}, got {}",
                               LogicalType::kDurationSize, fixed_size);
        }
        return {};
      }
      break;
  }
  return InvalidSchema("Logical type {} cannot annotate Avro type {}",
                       logical_type.ToString(), base);
}

namespace {

void CheckLogicalType(AvroType base, const LogicalType& logical_type,
                      size_t fixed_size = 0) {
  auto status = ValidateLogicalType(base, logical_type, fixed_size);
  AVROROW_CHECK_OR_DIE(status.has_value(), "{}", status.error().message);
}

bool IsPrimitive(AvroType type) {
  switch (type) {
    case AvroType::kNull:
    case AvroType::kBoolean:
    case AvroType::kInt:
    case AvroType::kLong:
    case AvroType::kFloat:
    case AvroType::kDouble:
    case AvroType::kBytes:
    case AvroType::kString:
      return true;
    default:
      return false;
  }
}

std::string AnnotatedName(std::string base, const LogicalType& logical_type) {
  if (logical_type.is_none()) {
    return base;
  }
  return std::format("{}<{}>", logical_type.ToString(), base);
}

}  // namespace

PrimitiveNode::PrimitiveNode(AvroType type, LogicalType logical_type)
    : SchemaNode(logical_type), type_(type) {
  AVROROW_CHECK_OR_DIE(IsPrimitive(type), "Avro type {} is not a primitive type", type);
  CheckLogicalType(type, logical_type);
}

std::string PrimitiveNode::ToString() const {
  return AnnotatedName(std::string(avrorow::ToString(type_)), logical_type_);
}

bool PrimitiveNode::Equals(const SchemaNode& other) const {
  return other.type() == type_ && other.logical_type() == logical_type_;
}

FixedNode::FixedNode(std::string name, size_t size, LogicalType logical_type)
    : SchemaNode(logical_type), name_(std::move(name)), size_(size) {
  AVROROW_CHECK_OR_DIE(!name_.empty(), "Fixed type must have a name");
  CheckLogicalType(AvroType::kFixed, logical_type, size_);
}

std::string FixedNode::ToString() const {
  return AnnotatedName(std::format("fixed {}[{}]", name_, size_), logical_type_);
}

bool FixedNode::Equals(const SchemaNode& other) const {
  if (other.type() != AvroType::kFixed) {
    return false;
  }
  const auto& fixed = static_cast<const FixedNode&>(other);
  return name_ == fixed.name_ && size_ == fixed.size_ &&
         logical_type_ == fixed.logical_type_;
}

EnumNode::EnumNode(std::string name, std::vector<std::string> symbols)
    : name_(std::move(name)), symbols_(std::move(symbols)) {
  AVROROW_CHECK_OR_DIE(!name_.empty(), "Enum type must have a name");
  std::unordered_set<std::string_view> seen;
  for (const auto& symbol : symbols_) {
    AVROROW_CHECK_OR_DIE(seen.insert(symbol).second, "Duplicate symbol '{}' in enum {}",
                         symbol, name_);
  }
}

std::string EnumNode::ToString() const {
  return FormatRange(symbols_, ", ", std::format("enum {} [", name_), "]");
}

bool EnumNode::Equals(const SchemaNode& other) const {
  if (other.type() != AvroType::kEnum) {
    return false;
  }
  const auto& enum_node = static_cast<const EnumNode&>(other);
  return name_ == enum_node.name_ && symbols_ == enum_node.symbols_;
}

RecordField::RecordField(std::string name, SchemaNodePtr node)
    : name_(std::move(name)), node_(std::move(node)) {
  AVROROW_CHECK_OR_DIE(!name_.empty(), "Record field must have a name");
  AVROROW_CHECK_OR_DIE(node_ != nullptr, "Record field '{}' must have a type", name_);
}

std::string RecordField::ToString() const {
  return std::format("{}: {}", name_, *node_);
}

RecordNode::RecordNode(std::string name, std::vector<RecordField> fields)
    : name_(std::move(name)), fields_(std::move(fields)) {
  AVROROW_CHECK_OR_DIE(!name_.empty(), "Record type must have a name");
  field_index_.reserve(fields_.size());
  for (size_t i = 0; i < fields_.size(); ++i) {
    auto [_, inserted] = field_index_.emplace(std::string(fields_[i].name()), i);
    AVROROW_CHECK_OR_DIE(inserted, "Duplicate field name '{}' in record {}",
                         fields_[i].name(), name_);
  }
}

std::optional<size_t> RecordNode::FieldIndex(std::string_view name) const {
  auto it = field_index_.find(std::string(name));
  if (it == field_index_.cend()) {
    return std::nullopt;
  }
  return it->second;
}

std::string RecordNode::ToString() const {
  return FormatRange(fields_, ", ", std::format("record {} {{", name_), "}");
}

bool RecordNode::Equals(const SchemaNode& other) const {
  if (other.type() != AvroType::kRecord) {
    return false;
  }
  const auto& record = static_cast<const RecordNode&>(other);
  return name_ == record.name_ && fields_ == record.fields_;
}

ArrayNode::ArrayNode(SchemaNodePtr element) : element_(std::move(element)) {
  AVROROW_CHECK_OR_DIE(element_ != nullptr, "Array must have an element type");
}

std::string ArrayNode::ToString() const { return std::format("array<{}>", *element_); }

bool ArrayNode::Equals(const SchemaNode& other) const {
  return other.type() == AvroType::kArray &&
         *element_ == *static_cast<const ArrayNode&>(other).element_;
}

MapNode::MapNode(SchemaNodePtr value) : value_(std::move(value)) {
  AVROROW_CHECK_OR_DIE(value_ != nullptr, "Map must have a value type");
}

std::string MapNode::ToString() const { return std::format("map<{}>", *value_); }

bool MapNode::Equals(const SchemaNode& other) const {
  return other.type() == AvroType::kMap &&
         *value_ == *static_cast<const MapNode&>(other).value_;
}

UnionNode::UnionNode(std::vector<SchemaNodePtr> members) : members_(std::move(members)) {
  AVROROW_CHECK_OR_DIE(!members_.empty(), "Union must have at least one member");
  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < members_.size(); ++i) {
    const auto& member = members_[i];
    AVROROW_CHECK_OR_DIE(member != nullptr, "Union member {} is null", i);
    AVROROW_CHECK_OR_DIE(member->type() != AvroType::kUnion,
                         "Union may not immediately contain another union");
    // Named types are distinguished by name, the others by their tag.
    std::string key = member->name().empty() ? std::string(avrorow::ToString(member->type()))
                                             : std::string(member->name());
    AVROROW_CHECK_OR_DIE(seen.insert(key).second, "Union contains duplicate member {}",
                         key);
    if (member->type() == AvroType::kNull) {
      null_index_ = i;
    }
  }
}

const SchemaNode* UnionNode::single_non_null_member() const {
  if (members_.size() != 2 || !null_index_.has_value()) {
    return nullptr;
  }
  return members_[1 - null_index_.value()].get();
}

std::string UnionNode::ToString() const {
  return FormatRange(members_, ", ", "union<", ">");
}

bool UnionNode::Equals(const SchemaNode& other) const {
  if (other.type() != AvroType::kUnion) {
    return false;
  }
  const auto& other_members = static_cast<const UnionNode&>(other).members_;
  return std::ranges::equal(members_, other_members,
                            [](const auto& lhs, const auto& rhs) { return *lhs == *rhs; });
}

#define PRIMITIVE_NODE_FACTORY(NAME, TYPE, LOGICAL)                          \
  const std::shared_ptr<PrimitiveNode>& NAME() {                             \
    static const auto node = std::make_shared<PrimitiveNode>(TYPE, LOGICAL); \
    return node;                                                             \
  }

PRIMITIVE_NODE_FACTORY(null, AvroType::kNull, LogicalType::None())
PRIMITIVE_NODE_FACTORY(boolean, AvroType::kBoolean, LogicalType::None())
PRIMITIVE_NODE_FACTORY(int32, AvroType::kInt, LogicalType::None())
PRIMITIVE_NODE_FACTORY(int64, AvroType::kLong, LogicalType::None())
PRIMITIVE_NODE_FACTORY(float32, AvroType::kFloat, LogicalType::None())
PRIMITIVE_NODE_FACTORY(float64, AvroType::kDouble, LogicalType::None())
PRIMITIVE_NODE_FACTORY(bytes, AvroType::kBytes, LogicalType::None())
PRIMITIVE_NODE_FACTORY(string, AvroType::kString, LogicalType::None())
PRIMITIVE_NODE_FACTORY(date, AvroType::kInt, LogicalType::Date())
PRIMITIVE_NODE_FACTORY(time_millis, AvroType::kInt, LogicalType::TimeMillis())
PRIMITIVE_NODE_FACTORY(time_micros, AvroType::kLong, LogicalType::TimeMicros())
PRIMITIVE_NODE_FACTORY(timestamp_millis, AvroType::kLong, LogicalType::TimestampMillis())
PRIMITIVE_NODE_FACTORY(timestamp_micros, AvroType::kLong, LogicalType::TimestampMicros())

#undef PRIMITIVE_NODE_FACTORY

std::shared_ptr<PrimitiveNode> decimal(int32_t precision, int32_t scale) {
  return std::make_shared<PrimitiveNode>(AvroType::kBytes,
                                         LogicalType::Decimal(precision, scale));
}

std::shared_ptr<FixedNode> decimal_fixed(std::string name, size_t size,
                                         int32_t precision, int32_t scale) {
  return std::make_shared<FixedNode>(std::move(name), size,
                                     LogicalType::Decimal(precision, scale));
}

std::shared_ptr<FixedNode> fixed(std::string name, size_t size) {
  return std::make_shared<FixedNode>(std::move(name), size);
}

std::shared_ptr<FixedNode> duration(std::string name) {
  return std::make_shared<FixedNode>(std::move(name), LogicalType::kDurationSize,
                                     LogicalType::Duration());
}

std::shared_ptr<EnumNode> enumeration(std::string name,
                                      std::vector<std::string> symbols) {
  return std::make_shared<EnumNode>(std::move(name), std::move(symbols));
}

std::shared_ptr<RecordNode> record(std::string name, std::vector<RecordField> fields) {
  return std::make_shared<RecordNode>(std::move(name), std::move(fields));
}

std::shared_ptr<ArrayNode> array(SchemaNodePtr element) {
  return std::make_shared<ArrayNode>(std::move(element));
}

std::shared_ptr<MapNode> map(SchemaNodePtr value) {
  return std::make_shared<MapNode>(std::move(value));
}

std::shared_ptr<UnionNode> union_of(std::vector<SchemaNodePtr> members) {
  return std::make_shared<UnionNode>(std::move(members));
}

std::shared_ptr<UnionNode> optional(SchemaNodePtr node) {
  return std::make_shared<UnionNode>(std::vector<SchemaNodePtr>{null(), std::move(node)});
}

}  // namespace avrorow
