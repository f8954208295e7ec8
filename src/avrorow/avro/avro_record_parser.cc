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

#include "avrorow/avro/avro_record_parser.h"

#include <algorithm>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <avro/Exception.hh>
#include <avro/Node.hh>
#include <avro/Types.hh>
#include <avro/ValidSchema.hh>

#include "avrorow/avro/avro_schema_util.h"
#include "avrorow/field_path.h"
#include "avrorow/logical_type_decoder.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep
#include "avrorow/util/logging_internal.h"
#include "avrorow/util/macros.h"

namespace avrorow::avro {

namespace {

struct ParseOptions {
  int32_t max_nesting_depth;
  bool validate_time_of_day;
};

/// \brief Per-call state: the options, the current nesting depth and the path
/// of the value being converted.
struct ParseContext {
  ParseOptions options;
  int32_t depth = 0;
  FieldPath path;

  std::string Where() const { return path.empty() ? "<root>" : path.ToString(); }
};

Result<ParseOptions> ReadOptions(const ParserConfig& config) {
  ParseOptions options;
  try {
    options.max_nesting_depth = config.max_nesting_depth();
    options.validate_time_of_day = config.validate_time_of_day();
  } catch (const AvrorowError& e) {
    return InvalidArgument("Invalid parser configuration: {}", e.what());
  }
  if (options.max_nesting_depth < 0) {
    return InvalidArgument("{} must not be negative, got {}",
                           ParserConfig::kMaxNestingDepth.key(),
                           options.max_nesting_depth);
  }
  return options;
}

/// \brief Prefix an error produced below the current path with that path.
std::unexpected<Error> AtPath(const ParseContext& ctx, Error error) {
  error.message = std::format("{}: {}", ctx.Where(), error.message);
  return std::unexpected<Error>(std::move(error));
}

std::unexpected<Error> TypeMismatch(const ParseContext& ctx, const SchemaNode& node,
                                    const ::avro::GenericDatum& datum) {
  return SchemaMismatch("{}: expected {} but got Avro {}", ctx.Where(), node,
                        ::avro::toString(datum.type()));
}

/// \brief Counts one level of nesting for as long as it is alive.
class NestingGuard {
 public:
  explicit NestingGuard(ParseContext& ctx) : ctx_(ctx) { ++ctx_.depth; }
  ~NestingGuard() { --ctx_.depth; }

  NestingGuard(const NestingGuard&) = delete;
  NestingGuard& operator=(const NestingGuard&) = delete;

 private:
  ParseContext& ctx_;
};

Status CheckNestingDepth(const ParseContext& ctx) {
  if (ctx.depth >= ctx.options.max_nesting_depth) {
    internal::Logger()->debug("{}: nesting depth limit {} reached", ctx.Where(),
                              ctx.options.max_nesting_depth);
    return SchemaMismatch("{}: value is nested deeper than {} levels", ctx.Where(),
                          ctx.options.max_nesting_depth);
  }
  return {};
}

std::string RuntimeName(const ::avro::GenericDatum& datum) {
  switch (datum.type()) {
    case ::avro::AVRO_RECORD:
      return datum.value<::avro::GenericRecord>().schema()->name().fullname();
    case ::avro::AVRO_ENUM:
      return datum.value<::avro::GenericEnum>().schema()->name().fullname();
    case ::avro::AVRO_FIXED:
      return datum.value<::avro::GenericFixed>().schema()->name().fullname();
    default:
      return {};
  }
}

/// \brief Whether a union member can hold the runtime value.
bool IsCompatible(const SchemaNode& member, const ::avro::GenericDatum& datum) {
  const ::avro::Type type = datum.type();
  switch (member.type()) {
    case AvroType::kNull:
      return type == ::avro::AVRO_NULL;
    case AvroType::kBoolean:
      return type == ::avro::AVRO_BOOL;
    case AvroType::kInt:
      return type == ::avro::AVRO_INT;
    case AvroType::kLong:
      return type == ::avro::AVRO_INT || type == ::avro::AVRO_LONG;
    case AvroType::kFloat:
      return type == ::avro::AVRO_INT || type == ::avro::AVRO_LONG ||
             type == ::avro::AVRO_FLOAT;
    case AvroType::kDouble:
      return type == ::avro::AVRO_INT || type == ::avro::AVRO_LONG ||
             type == ::avro::AVRO_FLOAT || type == ::avro::AVRO_DOUBLE;
    case AvroType::kBytes:
    case AvroType::kString:
      return type == ::avro::AVRO_BYTES || type == ::avro::AVRO_STRING;
    case AvroType::kFixed: {
      if (type != ::avro::AVRO_FIXED) {
        return false;
      }
      const auto& fixed = static_cast<const FixedNode&>(member);
      const auto runtime_name = RuntimeName(datum);
      if (!runtime_name.empty() && runtime_name != fixed.name()) {
        return false;
      }
      // The size of a decimal or duration is checked by its decoder.
      return fixed.logical_type().kind == LogicalTypeKind::kDecimal ||
             fixed.logical_type().kind == LogicalTypeKind::kDuration ||
             datum.value<::avro::GenericFixed>().value().size() == fixed.size();
    }
    case AvroType::kEnum:
      return type == ::avro::AVRO_ENUM && RuntimeName(datum) == member.name();
    case AvroType::kRecord: {
      if (type != ::avro::AVRO_RECORD) {
        return false;
      }
      if (RuntimeName(datum) == member.name()) {
        return true;
      }
      const auto& record = datum.value<::avro::GenericRecord>();
      for (const auto& field : static_cast<const RecordNode&>(member).fields()) {
        if (!field.nullable() && !record.hasField(std::string(field.name()))) {
          return false;
        }
      }
      return true;
    }
    case AvroType::kArray:
      return type == ::avro::AVRO_ARRAY;
    case AvroType::kMap:
      return type == ::avro::AVRO_MAP;
    case AvroType::kUnion:
      return false;
  }
  std::unreachable();
}

Result<Value> DispatchNode(const SchemaNodePtr& node, const ::avro::GenericDatum& datum,
                           ParseContext& ctx);

Result<Row> ParseFields(const std::shared_ptr<const RecordNode>& schema,
                        const ::avro::GenericRecord& record, ParseContext& ctx) {
  std::vector<Value> values;
  values.reserve(schema->num_fields());
  for (const auto& field : schema->fields()) {
    FieldPathScope scope(ctx.path, field.name());
    const std::string name(field.name());
    if (!record.hasField(name)) {
      if (field.nullable()) {
        values.emplace_back();
        continue;
      }
      return MissingField("{}: required field is missing from record {}", ctx.Where(),
                          schema->name());
    }
    AVROROW_ASSIGN_OR_RAISE(auto value, DispatchNode(field.node(), record.field(name), ctx));
    values.push_back(std::move(value));
  }
  return Row(schema, std::move(values));
}

Result<Value> DispatchRecord(const SchemaNodePtr& node, const ::avro::GenericDatum& datum,
                             ParseContext& ctx) {
  if (datum.type() != ::avro::AVRO_RECORD) {
    return TypeMismatch(ctx, *node, datum);
  }
  AVROROW_RETURN_UNEXPECTED(CheckNestingDepth(ctx));
  NestingGuard nesting(ctx);
  AVROROW_ASSIGN_OR_RAISE(
      auto row, ParseFields(std::static_pointer_cast<const RecordNode>(node),
                            datum.value<::avro::GenericRecord>(), ctx));
  return Value::Row(std::move(row));
}

Result<Value> DispatchArray(const ArrayNode& node, const ::avro::GenericDatum& datum,
                            ParseContext& ctx) {
  if (datum.type() != ::avro::AVRO_ARRAY) {
    return TypeMismatch(ctx, node, datum);
  }
  AVROROW_RETURN_UNEXPECTED(CheckNestingDepth(ctx));
  NestingGuard nesting(ctx);

  const auto& elements = datum.value<::avro::GenericArray>().value();
  ValueList values;
  values.reserve(elements.size());
  for (size_t i = 0; i < elements.size(); ++i) {
    FieldPathScope scope(ctx.path, i);
    AVROROW_ASSIGN_OR_RAISE(auto value, DispatchNode(node.element(), elements[i], ctx));
    values.push_back(std::move(value));
  }
  return Value::List(std::move(values));
}

Result<Value> DispatchMap(const MapNode& node, const ::avro::GenericDatum& datum,
                          ParseContext& ctx) {
  if (datum.type() != ::avro::AVRO_MAP) {
    return TypeMismatch(ctx, node, datum);
  }
  AVROROW_RETURN_UNEXPECTED(CheckNestingDepth(ctx));
  NestingGuard nesting(ctx);

  const auto& entries = datum.value<::avro::GenericMap>().value();
  ValueMap values;
  values.reserve(entries.size());
  for (const auto& [key, entry] : entries) {
    FieldPathScope scope(ctx.path, MapKey{key});
    AVROROW_ASSIGN_OR_RAISE(auto value, DispatchNode(node.value(), entry, ctx));
    values.insert_or_assign(key, std::move(value));
  }
  return Value::Map(std::move(values));
}

Result<Value> DispatchUnion(const UnionNode& node, const ::avro::GenericDatum& datum,
                            ParseContext& ctx) {
  if (datum.type() == ::avro::AVRO_NULL) {
    if (node.null_index().has_value()) {
      return Value::Null();
    }
    return SchemaMismatch("{}: null value for {} without a null member", ctx.Where(),
                          node);
  }

  const auto members = node.members();
  // With a single candidate there is nothing to resolve; dispatching to it
  // directly keeps its own error instead of a generic mismatch.
  const size_t num_candidates = members.size() - (node.null_index().has_value() ? 1 : 0);
  if (num_candidates == 1) {
    const size_t only = node.null_index() == std::optional<size_t>{0} ? 1 : 0;
    return DispatchNode(members[only], datum, ctx);
  }

  std::optional<size_t> selected;
  size_t num_compatible = 0;
  for (size_t i = 0; i < members.size(); ++i) {
    if (IsCompatible(*members[i], datum)) {
      if (!selected.has_value()) {
        selected = i;
      }
      ++num_compatible;
    }
  }

  if (!selected.has_value()) {
    return SchemaMismatch("{}: no member of {} matches Avro {}", ctx.Where(), node,
                          ::avro::toString(datum.type()));
  }
  if (num_compatible > 1) {
    internal::Logger()->debug("{}: {} union members match Avro {}, using member {}",
                              ctx.Where(), num_compatible,
                              ::avro::toString(datum.type()), selected.value());
  }
  return DispatchNode(members[selected.value()], datum, ctx);
}

Result<int64_t> ReadLong(const SchemaNode& node, const ::avro::GenericDatum& datum,
                         const ParseContext& ctx) {
  switch (datum.type()) {
    case ::avro::AVRO_LONG:
      return datum.value<int64_t>();
    case ::avro::AVRO_INT:
      return static_cast<int64_t>(datum.value<int32_t>());
    default:
      return TypeMismatch(ctx, node, datum);
  }
}

Result<double> ReadDouble(const SchemaNode& node, const ::avro::GenericDatum& datum,
                          const ParseContext& ctx) {
  switch (datum.type()) {
    case ::avro::AVRO_DOUBLE:
      return datum.value<double>();
    case ::avro::AVRO_FLOAT:
      return static_cast<double>(datum.value<float>());
    case ::avro::AVRO_LONG:
      return static_cast<double>(datum.value<int64_t>());
    case ::avro::AVRO_INT:
      return static_cast<double>(datum.value<int32_t>());
    default:
      return TypeMismatch(ctx, node, datum);
  }
}

/// \brief Read a bytes or string value as raw bytes.
Result<std::span<const uint8_t>> ReadBytes(const SchemaNode& node,
                                           const ::avro::GenericDatum& datum,
                                           const ParseContext& ctx) {
  switch (datum.type()) {
    case ::avro::AVRO_BYTES:
      return std::span<const uint8_t>(datum.value<std::vector<uint8_t>>());
    case ::avro::AVRO_STRING: {
      const auto& str = datum.value<std::string>();
      return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()),
                                      str.size());
    }
    default:
      return TypeMismatch(ctx, node, datum);
  }
}

/// \brief Convert a value whose node carries a logical type.
template <typename T>
Result<Value> Decoded(const ParseContext& ctx, Result<T> decoded, Value (*make)(T)) {
  if (!decoded.has_value()) {
    return AtPath(ctx, std::move(decoded.error()));
  }
  return make(std::move(decoded.value()));
}

Result<Value> DispatchInt(const SchemaNode& node, const ::avro::GenericDatum& datum,
                          ParseContext& ctx) {
  if (datum.type() != ::avro::AVRO_INT) {
    return TypeMismatch(ctx, node, datum);
  }
  const auto value = datum.value<int32_t>();
  switch (node.logical_type().kind) {
    case LogicalTypeKind::kDate:
      return Value::Date(DecodeDate(value));
    case LogicalTypeKind::kTimeMillis:
      return Decoded(ctx, DecodeTimeMillis(value, ctx.options.validate_time_of_day),
                     &Value::TimeMillis);
    default:
      return Value::Int(value);
  }
}

Result<Value> DispatchLong(const SchemaNode& node, const ::avro::GenericDatum& datum,
                           ParseContext& ctx) {
  AVROROW_ASSIGN_OR_RAISE(auto value, ReadLong(node, datum, ctx));
  switch (node.logical_type().kind) {
    case LogicalTypeKind::kTimeMicros:
      return Decoded(ctx, DecodeTimeMicros(value, ctx.options.validate_time_of_day),
                     &Value::TimeMicros);
    case LogicalTypeKind::kTimestampMillis:
      return Value::TimestampMillis(DecodeTimestampMillis(value));
    case LogicalTypeKind::kTimestampMicros:
      return Value::TimestampMicros(DecodeTimestampMicros(value));
    default:
      return Value::Long(value);
  }
}

Result<Value> DispatchFixed(const FixedNode& node, const ::avro::GenericDatum& datum,
                            ParseContext& ctx) {
  if (datum.type() != ::avro::AVRO_FIXED) {
    return TypeMismatch(ctx, node, datum);
  }
  const auto& bytes = datum.value<::avro::GenericFixed>().value();
  const auto& logical_type = node.logical_type();
  switch (logical_type.kind) {
    case LogicalTypeKind::kDecimal:
      if (bytes.size() != node.size()) {
        return MalformedLogicalValue("{}: expected {} but got {} bytes", ctx.Where(),
                                     node, bytes.size());
      }
      return Decoded(ctx,
                     DecodeDecimal(bytes, logical_type.precision, logical_type.scale),
                     &Value::Decimal);
    case LogicalTypeKind::kDuration:
      // The decoder checks the length.
      return Decoded(ctx, DecodeDuration(bytes), &Value::Duration);
    default:
      if (bytes.size() != node.size()) {
        return SchemaMismatch("{}: expected {} but got {} bytes", ctx.Where(), node,
                              bytes.size());
      }
      return Value::Binary(bytes);
  }
}

Result<Value> DispatchEnum(const EnumNode& node, const ::avro::GenericDatum& datum,
                           ParseContext& ctx) {
  if (datum.type() != ::avro::AVRO_ENUM) {
    return TypeMismatch(ctx, node, datum);
  }
  const auto& symbol = datum.value<::avro::GenericEnum>().symbol();
  if (std::ranges::find(node.symbols(), symbol) == node.symbols().cend()) {
    return SchemaMismatch("{}: symbol '{}' is not declared by {}", ctx.Where(), symbol,
                          node);
  }
  return Value::String(symbol);
}

/// \brief Convert one value; a closed switch over the Avro type tag.
Result<Value> DispatchNode(const SchemaNodePtr& node, const ::avro::GenericDatum& datum,
                           ParseContext& ctx) {
  switch (node->type()) {
    case AvroType::kUnion:
      return DispatchUnion(static_cast<const UnionNode&>(*node), datum, ctx);
    case AvroType::kRecord:
      return DispatchRecord(node, datum, ctx);
    case AvroType::kArray:
      return DispatchArray(static_cast<const ArrayNode&>(*node), datum, ctx);
    case AvroType::kMap:
      return DispatchMap(static_cast<const MapNode&>(*node), datum, ctx);
    case AvroType::kFixed:
      return DispatchFixed(static_cast<const FixedNode&>(*node), datum, ctx);
    case AvroType::kEnum:
      return DispatchEnum(static_cast<const EnumNode&>(*node), datum, ctx);
    case AvroType::kNull:
      if (datum.type() != ::avro::AVRO_NULL) {
        return TypeMismatch(ctx, *node, datum);
      }
      return Value::Null();
    case AvroType::kBoolean:
      if (datum.type() != ::avro::AVRO_BOOL) {
        return TypeMismatch(ctx, *node, datum);
      }
      return Value::Boolean(datum.value<bool>());
    case AvroType::kInt:
      return DispatchInt(*node, datum, ctx);
    case AvroType::kLong:
      return DispatchLong(*node, datum, ctx);
    case AvroType::kFloat:
      switch (datum.type()) {
        case ::avro::AVRO_FLOAT:
          return Value::Float(datum.value<float>());
        case ::avro::AVRO_LONG:
          return Value::Float(static_cast<float>(datum.value<int64_t>()));
        case ::avro::AVRO_INT:
          return Value::Float(static_cast<float>(datum.value<int32_t>()));
        default:
          return TypeMismatch(ctx, *node, datum);
      }
    case AvroType::kDouble: {
      AVROROW_ASSIGN_OR_RAISE(auto value, ReadDouble(*node, datum, ctx));
      return Value::Double(value);
    }
    case AvroType::kBytes: {
      AVROROW_ASSIGN_OR_RAISE(auto bytes, ReadBytes(*node, datum, ctx));
      const auto& logical_type = node->logical_type();
      if (logical_type.kind == LogicalTypeKind::kDecimal) {
        return Decoded(ctx,
                       DecodeDecimal(bytes, logical_type.precision, logical_type.scale),
                       &Value::Decimal);
      }
      return Value::Binary(Bytes(bytes.begin(), bytes.end()));
    }
    case AvroType::kString:
      switch (datum.type()) {
        case ::avro::AVRO_STRING:
          return Value::String(datum.value<std::string>());
        case ::avro::AVRO_BYTES: {
          const auto& bytes = datum.value<std::vector<uint8_t>>();
          return Value::String(std::string(bytes.begin(), bytes.end()));
        }
        default:
          return TypeMismatch(ctx, *node, datum);
      }
  }
  std::unreachable();
}

}  // namespace

Result<Value> Dispatch(const SchemaNodePtr& node, const ::avro::GenericDatum& datum,
                       const ParserConfig& config) {
  if (node == nullptr) {
    return InvalidArgument("Cannot dispatch a value without a schema node");
  }
  AVROROW_ASSIGN_OR_RAISE(auto options, ReadOptions(config));
  ParseContext ctx{.options = options};
  try {
    return DispatchNode(node, datum, ctx);
  } catch (const ::avro::Exception& e) {
    return UnknownError("{}: failed to read Avro value: {}", ctx.Where(), e.what());
  }
}

Result<Row> ParseRecord(const std::shared_ptr<const RecordNode>& schema,
                        const ::avro::GenericRecord& record, const ParserConfig& config) {
  if (schema == nullptr) {
    return InvalidArgument("Cannot parse a record without a record schema");
  }
  AVROROW_ASSIGN_OR_RAISE(auto options, ReadOptions(config));
  ParseContext ctx{.options = options};
  try {
    return ParseFields(schema, record, ctx);
  } catch (const ::avro::Exception& e) {
    return UnknownError("{}: failed to read Avro record: {}", ctx.Where(), e.what());
  }
}

RecordParser::RecordParser(std::shared_ptr<const RecordNode> schema,
                           int32_t max_nesting_depth, bool validate_time_of_day)
    : schema_(std::move(schema)),
      max_nesting_depth_(max_nesting_depth),
      validate_time_of_day_(validate_time_of_day) {}

Result<RecordParser> RecordParser::Make(std::shared_ptr<const RecordNode> schema,
                                        const ParserConfig& config) {
  if (schema == nullptr) {
    return InvalidArgument("Record parser requires a record schema");
  }
  AVROROW_ASSIGN_OR_RAISE(auto options, ReadOptions(config));
  return RecordParser(std::move(schema), options.max_nesting_depth,
                      options.validate_time_of_day);
}

Result<RecordParser> RecordParser::Make(const ::avro::ValidSchema& schema,
                                        const ParserConfig& config) {
  AVROROW_ASSIGN_OR_RAISE(auto record, FromAvroSchema(schema));
  return Make(std::move(record), config);
}

Result<RecordParser> RecordParser::MakeFromJson(std::string_view json,
                                                const ParserConfig& config) {
  AVROROW_ASSIGN_OR_RAISE(auto record, FromAvroJson(json));
  return Make(std::move(record), config);
}

Result<Row> RecordParser::Parse(const ::avro::GenericDatum& datum) const {
  if (datum.type() != ::avro::AVRO_RECORD) {
    return SchemaMismatch("<root>: expected {} but got Avro {}", *schema_,
                          ::avro::toString(datum.type()));
  }
  return Parse(datum.value<::avro::GenericRecord>());
}

Result<Row> RecordParser::Parse(const ::avro::GenericRecord& record) const {
  ParseContext ctx{.options = {.max_nesting_depth = max_nesting_depth_,
                               .validate_time_of_day = validate_time_of_day_}};
  try {
    return ParseFields(schema_, record, ctx);
  } catch (const ::avro::Exception& e) {
    return UnknownError("{}: failed to read Avro record: {}", ctx.Where(), e.what());
  }
}

}  // namespace avrorow::avro
