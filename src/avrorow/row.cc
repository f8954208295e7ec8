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

#include "avrorow/row.h"

#include <format>
#include <utility>

#include "avrorow/exception.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep

namespace avrorow {

Row::Row(std::shared_ptr<const RecordNode> schema, std::vector<Value> values)
    : schema_(std::move(schema)), values_(std::move(values)) {
  AVROROW_CHECK_OR_DIE(schema_ != nullptr, "Row must have a record schema");
  AVROROW_CHECK_OR_DIE(values_.size() == schema_->num_fields(),
                       "Row of record {} has {} values but {} fields", schema_->name(),
                       values_.size(), schema_->num_fields());
}

Result<Value> Row::GetField(size_t pos) const {
  if (pos >= values_.size()) {
    return InvalidArgument("Position {} is out of range for row of size {}", pos,
                           values_.size());
  }
  return values_[pos];
}

Result<Value> Row::GetField(std::string_view name) const {
  auto pos = schema_->FieldIndex(name);
  if (!pos.has_value()) {
    return InvalidArgument("Record {} has no field named '{}'", schema_->name(), name);
  }
  return values_[pos.value()];
}

std::string Row::ToString() const {
  std::string repr = "{";
  const auto fields = schema_->fields();
  for (size_t i = 0; i < values_.size(); ++i) {
    if (i > 0) {
      repr += ", ";
    }
    repr += std::format("{}: {}", fields[i].name(), values_[i]);
  }
  repr += "}";
  return repr;
}

}  // namespace avrorow
