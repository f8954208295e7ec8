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

#include "avrorow/avro/avro_schema_util.h"

#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <avro/Compiler.hh>
#include <avro/Exception.hh>
#include <avro/LogicalType.hh>
#include <avro/NodeImpl.hh>
#include <avro/Types.hh>
#include <avro/ValidSchema.hh>

#include "avrorow/exception.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep
#include "avrorow/util/macros.h"

namespace avrorow::avro {

namespace {

LogicalType FromAvroLogicalType(const ::avro::LogicalType& logical_type) {
  switch (logical_type.type()) {
    case ::avro::LogicalType::DATE:
      return LogicalType::Date();
    case ::avro::LogicalType::TIME_MILLIS:
      return LogicalType::TimeMillis();
    case ::avro::LogicalType::TIME_MICROS:
      return LogicalType::TimeMicros();
    case ::avro::LogicalType::TIMESTAMP_MILLIS:
      return LogicalType::TimestampMillis();
    case ::avro::LogicalType::TIMESTAMP_MICROS:
      return LogicalType::TimestampMicros();
    case ::avro::LogicalType::DECIMAL:
      return LogicalType::Decimal(static_cast<int32_t>(logical_type.precision()),
                                  static_cast<int32_t>(logical_type.scale()));
    case ::avro::LogicalType::DURATION:
      return LogicalType::Duration();
    default:
      // uuid, local timestamps and custom logical types keep their base type.
      return LogicalType::None();
  }
}

Result<AvroType> FromAvroType(::avro::Type type) {
  switch (type) {
    case ::avro::AVRO_NULL:
      return AvroType::kNull;
    case ::avro::AVRO_BOOL:
      return AvroType::kBoolean;
    case ::avro::AVRO_INT:
      return AvroType::kInt;
    case ::avro::AVRO_LONG:
      return AvroType::kLong;
    case ::avro::AVRO_FLOAT:
      return AvroType::kFloat;
    case ::avro::AVRO_DOUBLE:
      return AvroType::kDouble;
    case ::avro::AVRO_BYTES:
      return AvroType::kBytes;
    case ::avro::AVRO_STRING:
      return AvroType::kString;
    case ::avro::AVRO_FIXED:
      return AvroType::kFixed;
    case ::avro::AVRO_ENUM:
      return AvroType::kEnum;
    case ::avro::AVRO_ARRAY:
      return AvroType::kArray;
    case ::avro::AVRO_MAP:
      return AvroType::kMap;
    case ::avro::AVRO_RECORD:
      return AvroType::kRecord;
    case ::avro::AVRO_UNION:
      return AvroType::kUnion;
    default:
      return InvalidSchema("Unsupported Avro type: {}", ::avro::toString(type));
  }
}

SchemaNodePtr PlainPrimitive(AvroType type) {
  switch (type) {
    case AvroType::kNull:
      return null();
    case AvroType::kBoolean:
      return boolean();
    case AvroType::kInt:
      return int32();
    case AvroType::kLong:
      return int64();
    case AvroType::kFloat:
      return float32();
    case AvroType::kDouble:
      return float64();
    case AvroType::kBytes:
      return bytes();
    default:
      return string();
  }
}

/// \brief Translates one avro-cpp schema tree.  Named types are translated
/// once and shared by every reference to them.
class AvroNodeTranslator {
 public:
  Result<SchemaNodePtr> Translate(const ::avro::NodePtr& node) {
    if (node->type() == ::avro::AVRO_SYMBOLIC) {
      return TranslateSymbolic(node);
    }

    AVROROW_ASSIGN_OR_RAISE(auto type, FromAvroType(node->type()));
    switch (type) {
      case AvroType::kFixed:
        return TranslateFixed(node);
      case AvroType::kEnum:
        return TranslateEnum(node);
      case AvroType::kRecord:
        return TranslateRecord(node);
      case AvroType::kArray: {
        AVROROW_ASSIGN_OR_RAISE(auto element, Translate(node->leafAt(0)));
        return std::make_shared<ArrayNode>(std::move(element));
      }
      case AvroType::kMap: {
        // Leaf 0 is the implicit string key.
        AVROROW_ASSIGN_OR_RAISE(auto value, Translate(node->leafAt(1)));
        return std::make_shared<MapNode>(std::move(value));
      }
      case AvroType::kUnion: {
        std::vector<SchemaNodePtr> members;
        members.reserve(node->leaves());
        for (size_t i = 0; i < node->leaves(); ++i) {
          AVROROW_ASSIGN_OR_RAISE(auto member, Translate(node->leafAt(i)));
          members.push_back(std::move(member));
        }
        return std::make_shared<UnionNode>(std::move(members));
      }
      default:
        return TranslatePrimitive(type, node);
    }
  }

 private:
  Result<SchemaNodePtr> TranslatePrimitive(AvroType type, const ::avro::NodePtr& node) {
    auto logical_type = FromAvroLogicalType(node->logicalType());
    if (logical_type.is_none()) {
      return PlainPrimitive(type);
    }
    AVROROW_RETURN_UNEXPECTED(ValidateLogicalType(type, logical_type));
    return std::make_shared<PrimitiveNode>(type, logical_type);
  }

  Result<SchemaNodePtr> TranslateFixed(const ::avro::NodePtr& node) {
    auto logical_type = FromAvroLogicalType(node->logicalType());
    AVROROW_RETURN_UNEXPECTED(
        ValidateLogicalType(AvroType::kFixed, logical_type, node->fixedSize()));
    return Remember(node, std::make_shared<FixedNode>(node->name().fullname(),
                                                      node->fixedSize(), logical_type));
  }

  Result<SchemaNodePtr> TranslateEnum(const ::avro::NodePtr& node) {
    std::vector<std::string> symbols;
    symbols.reserve(node->names());
    for (size_t i = 0; i < node->names(); ++i) {
      symbols.push_back(node->nameAt(i));
    }
    return Remember(node,
                    std::make_shared<EnumNode>(node->name().fullname(), std::move(symbols)));
  }

  Result<SchemaNodePtr> TranslateRecord(const ::avro::NodePtr& node) {
    const std::string name = node->name().fullname();
    in_progress_.insert(name);

    std::vector<RecordField> fields;
    fields.reserve(node->leaves());
    for (size_t i = 0; i < node->leaves(); ++i) {
      AVROROW_ASSIGN_OR_RAISE(auto field_node, Translate(node->leafAt(i)));
      fields.emplace_back(node->nameAt(i), std::move(field_node));
    }

    in_progress_.erase(name);
    return Remember(node, std::make_shared<RecordNode>(name, std::move(fields)));
  }

  Result<SchemaNodePtr> TranslateSymbolic(const ::avro::NodePtr& node) {
    const std::string name = node->name().fullname();
    if (in_progress_.contains(name)) {
      return InvalidSchema("Recursive reference to {} is not supported", name);
    }
    if (auto it = named_.find(name); it != named_.cend()) {
      return it->second;
    }
    return Translate(::avro::resolveSymbol(node));
  }

  SchemaNodePtr Remember(const ::avro::NodePtr& node, SchemaNodePtr translated) {
    named_.insert_or_assign(node->name().fullname(), translated);
    return translated;
  }

  std::unordered_map<std::string, SchemaNodePtr> named_;
  std::unordered_set<std::string> in_progress_;
};

}  // namespace

Result<SchemaNodePtr> FromAvroNode(const ::avro::NodePtr& node) {
  if (node == nullptr) {
    return InvalidSchema("Avro node is null");
  }
  try {
    return AvroNodeTranslator{}.Translate(node);
  } catch (const ::avro::Exception& e) {
    return InvalidSchema("Cannot translate Avro schema {}: {}", ToString(node), e.what());
  } catch (const AvrorowError& e) {
    return InvalidSchema("Invalid Avro schema {}: {}", ToString(node), e.what());
  }
}

Result<std::shared_ptr<const RecordNode>> FromAvroSchema(
    const ::avro::ValidSchema& schema) {
  const auto& root = schema.root();
  if (root->type() != ::avro::AVRO_RECORD) {
    return InvalidSchema("Root of Avro schema must be a record, got {}",
                         ::avro::toString(root->type()));
  }
  AVROROW_ASSIGN_OR_RAISE(auto node, FromAvroNode(root));
  return std::static_pointer_cast<const RecordNode>(std::move(node));
}

Result<std::shared_ptr<const RecordNode>> FromAvroJson(std::string_view json) {
  ::avro::ValidSchema schema;
  try {
    schema = ::avro::compileJsonSchemaFromString(std::string(json));
  } catch (const ::avro::Exception& e) {
    return InvalidSchema("Cannot compile Avro JSON schema: {}", e.what());
  }
  return FromAvroSchema(schema);
}

std::string ToString(const ::avro::NodePtr& node) {
  std::stringstream ss;
  ss << *node;
  return ss.str();
}

}  // namespace avrorow::avro
