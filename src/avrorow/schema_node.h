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

/// \file avrorow/schema_node.h
/// The Avro schema tree consumed by the record parser.  A schema node is a type
/// tag, an optional logical type annotation and, for composite tags, child
/// nodes.  Nodes are immutable once constructed and are shared through
/// std::shared_ptr<const SchemaNode> across any number of parse calls.
///
/// Constructors validate the Avro rules (logical type placement, union shape,
/// unique field names) and throw AvrorowError on violation.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "avrorow/avrorow_export.h"
#include "avrorow/result.h"
#include "avrorow/type_fwd.h"
#include "avrorow/util/formattable.h"

namespace avrorow {

/// \brief A logical type annotation.  Precision and scale are only meaningful
/// for decimals.
struct AVROROW_EXPORT LogicalType {
  LogicalTypeKind kind = LogicalTypeKind::kNone;
  int32_t precision = 0;
  int32_t scale = 0;

  static constexpr int32_t kMaxDecimalPrecision = 38;
  static constexpr size_t kDurationSize = 12;

  static LogicalType None() { return {}; }
  static LogicalType Date() { return {.kind = LogicalTypeKind::kDate}; }
  static LogicalType TimeMillis() { return {.kind = LogicalTypeKind::kTimeMillis}; }
  static LogicalType TimeMicros() { return {.kind = LogicalTypeKind::kTimeMicros}; }
  static LogicalType TimestampMillis() {
    return {.kind = LogicalTypeKind::kTimestampMillis};
  }
  static LogicalType TimestampMicros() {
    return {.kind = LogicalTypeKind::kTimestampMicros};
  }
  static LogicalType Decimal(int32_t precision, int32_t scale) {
    return {.kind = LogicalTypeKind::kDecimal, .precision = precision, .scale = scale};
  }
  static LogicalType Duration() { return {.kind = LogicalTypeKind::kDuration}; }

  bool is_none() const { return kind == LogicalTypeKind::kNone; }

  std::string ToString() const;

  bool operator==(const LogicalType&) const = default;
};

/// \brief Check that a logical type may annotate the given base type.
///
/// \param base The Avro type tag carrying the annotation.
/// \param logical_type The annotation.
/// \param fixed_size The size of the fixed type, ignored for other tags.
/// \return InvalidSchema if the Avro rules forbid the combination.
AVROROW_EXPORT Status ValidateLogicalType(AvroType base, const LogicalType& logical_type,
                                          size_t fixed_size = 0);

/// \brief The number of decimal digits that always fit in a two's-complement
/// integer of the given byte width.
AVROROW_EXPORT int32_t MaxDecimalPrecision(size_t byte_width);

/// \brief Interface for one node of an Avro schema tree.
class AVROROW_EXPORT SchemaNode : public util::Formattable {
 public:
  ~SchemaNode() override = default;

  /// \brief Get the Avro type tag.
  [[nodiscard]] virtual AvroType type() const = 0;

  /// \brief Get the logical type annotation (kNone when absent).
  [[nodiscard]] const LogicalType& logical_type() const { return logical_type_; }

  /// \brief Whether this node admits a null value, i.e. it is null or a union
  /// with a null member.
  [[nodiscard]] virtual bool nullable() const { return false; }

  /// \brief Get the full name of a named type (record, enum, fixed), otherwise
  /// an empty string.
  [[nodiscard]] virtual std::string_view name() const { return {}; }

  /// \brief Compare two nodes for structural equality.
  friend bool operator==(const SchemaNode& lhs, const SchemaNode& rhs) {
    return lhs.Equals(rhs);
  }

 protected:
  SchemaNode() = default;
  explicit SchemaNode(LogicalType logical_type) : logical_type_(logical_type) {}

  [[nodiscard]] virtual bool Equals(const SchemaNode& other) const = 0;

  LogicalType logical_type_;
};

using SchemaNodePtr = std::shared_ptr<const SchemaNode>;

/// \brief A node for the unnamed, non-composite types: null, boolean, int,
/// long, float, double, bytes and string.
class AVROROW_EXPORT PrimitiveNode : public SchemaNode {
 public:
  explicit PrimitiveNode(AvroType type, LogicalType logical_type = {});
  ~PrimitiveNode() override = default;

  AvroType type() const override { return type_; }
  bool nullable() const override { return type_ == AvroType::kNull; }
  std::string ToString() const override;

 protected:
  bool Equals(const SchemaNode& other) const override;

 private:
  AvroType type_;
};

/// \brief A named fixed-size byte sequence.
class AVROROW_EXPORT FixedNode : public SchemaNode {
 public:
  FixedNode(std::string name, size_t size, LogicalType logical_type = {});
  ~FixedNode() override = default;

  AvroType type() const override { return AvroType::kFixed; }
  std::string_view name() const override { return name_; }
  size_t size() const { return size_; }
  std::string ToString() const override;

 protected:
  bool Equals(const SchemaNode& other) const override;

 private:
  std::string name_;
  size_t size_;
};

/// \brief A named enumeration of symbols.
class AVROROW_EXPORT EnumNode : public SchemaNode {
 public:
  EnumNode(std::string name, std::vector<std::string> symbols);
  ~EnumNode() override = default;

  AvroType type() const override { return AvroType::kEnum; }
  std::string_view name() const override { return name_; }
  const std::vector<std::string>& symbols() const { return symbols_; }
  std::string ToString() const override;

 protected:
  bool Equals(const SchemaNode& other) const override;

 private:
  std::string name_;
  std::vector<std::string> symbols_;
};

/// \brief A named field of a record.
class AVROROW_EXPORT RecordField : public util::Formattable {
 public:
  RecordField(std::string name, SchemaNodePtr node);

  [[nodiscard]] std::string_view name() const { return name_; }
  [[nodiscard]] const SchemaNodePtr& node() const { return node_; }
  [[nodiscard]] bool nullable() const { return node_->nullable(); }

  std::string ToString() const override;

  friend bool operator==(const RecordField& lhs, const RecordField& rhs) {
    return lhs.name_ == rhs.name_ && *lhs.node_ == *rhs.node_;
  }

 private:
  std::string name_;
  SchemaNodePtr node_;
};

/// \brief A named record with an ordered list of fields.
class AVROROW_EXPORT RecordNode : public SchemaNode {
 public:
  RecordNode(std::string name, std::vector<RecordField> fields);
  ~RecordNode() override = default;

  AvroType type() const override { return AvroType::kRecord; }
  std::string_view name() const override { return name_; }
  std::span<const RecordField> fields() const { return fields_; }
  size_t num_fields() const { return fields_.size(); }

  /// \brief Get the position of a field by name.
  ///
  /// \note This is O(1) complexity.
  std::optional<size_t> FieldIndex(std::string_view name) const;

  std::string ToString() const override;

 protected:
  bool Equals(const SchemaNode& other) const override;

 private:
  std::string name_;
  std::vector<RecordField> fields_;
  std::unordered_map<std::string, size_t> field_index_;
};

/// \brief An ordered sequence of elements of one type.
class AVROROW_EXPORT ArrayNode : public SchemaNode {
 public:
  explicit ArrayNode(SchemaNodePtr element);
  ~ArrayNode() override = default;

  AvroType type() const override { return AvroType::kArray; }
  const SchemaNodePtr& element() const { return element_; }
  std::string ToString() const override;

 protected:
  bool Equals(const SchemaNode& other) const override;

 private:
  SchemaNodePtr element_;
};

/// \brief A mapping from string keys to values of one type.
class AVROROW_EXPORT MapNode : public SchemaNode {
 public:
  explicit MapNode(SchemaNodePtr value);
  ~MapNode() override = default;

  AvroType type() const override { return AvroType::kMap; }
  const SchemaNodePtr& value() const { return value_; }
  std::string ToString() const override;

 protected:
  bool Equals(const SchemaNode& other) const override;

 private:
  SchemaNodePtr value_;
};

/// \brief One of several member types.  At most one member is null, members
/// are never unions, and unnamed types appear at most once.
class AVROROW_EXPORT UnionNode : public SchemaNode {
 public:
  explicit UnionNode(std::vector<SchemaNodePtr> members);
  ~UnionNode() override = default;

  AvroType type() const override { return AvroType::kUnion; }
  bool nullable() const override { return null_index_.has_value(); }
  std::span<const SchemaNodePtr> members() const { return members_; }

  /// \brief Get the position of the null member, if any.
  std::optional<size_t> null_index() const { return null_index_; }

  /// \brief Get the only non-null member of a two-branch optional union.
  ///
  /// \return nullptr unless the union has exactly one non-null member.
  const SchemaNode* single_non_null_member() const;

  std::string ToString() const override;

 protected:
  bool Equals(const SchemaNode& other) const override;

 private:
  std::vector<SchemaNodePtr> members_;
  std::optional<size_t> null_index_;
};

/// \defgroup schema-factories Factory functions for schema nodes
/// @{

AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& null();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& boolean();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& int32();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& int64();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& float32();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& float64();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& bytes();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& string();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& date();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& time_millis();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& time_micros();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& timestamp_millis();
AVROROW_EXPORT const std::shared_ptr<PrimitiveNode>& timestamp_micros();

/// \brief A decimal backed by Avro bytes.
AVROROW_EXPORT std::shared_ptr<PrimitiveNode> decimal(int32_t precision, int32_t scale);
/// \brief A decimal backed by an Avro fixed of the given size.
AVROROW_EXPORT std::shared_ptr<FixedNode> decimal_fixed(std::string name, size_t size,
                                                        int32_t precision, int32_t scale);
AVROROW_EXPORT std::shared_ptr<FixedNode> fixed(std::string name, size_t size);
AVROROW_EXPORT std::shared_ptr<FixedNode> duration(std::string name);
AVROROW_EXPORT std::shared_ptr<EnumNode> enumeration(std::string name,
                                                     std::vector<std::string> symbols);
AVROROW_EXPORT std::shared_ptr<RecordNode> record(std::string name,
                                                  std::vector<RecordField> fields);
AVROROW_EXPORT std::shared_ptr<ArrayNode> array(SchemaNodePtr element);
AVROROW_EXPORT std::shared_ptr<MapNode> map(SchemaNodePtr value);
AVROROW_EXPORT std::shared_ptr<UnionNode> union_of(std::vector<SchemaNodePtr> members);
/// \brief The common nullable form: a union of null and the given node.
AVROROW_EXPORT std::shared_ptr<UnionNode> optional(SchemaNodePtr node);

/// @}

}  // namespace avrorow
