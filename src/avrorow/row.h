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

/// \file avrorow/row.h
/// A decoded record: one value per field of a record schema node.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "avrorow/avrorow_export.h"
#include "avrorow/result.h"
#include "avrorow/schema_node.h"
#include "avrorow/type_fwd.h"
#include "avrorow/util/formattable.h"
#include "avrorow/value.h"

namespace avrorow {

/// \brief An ordered sequence of converted values, also addressable by the
/// name of the originating field.  The row always has exactly one value per
/// field of its record schema, in declaration order.
class AVROROW_EXPORT Row : public util::Formattable {
 public:
  /// \brief Construct a row.
  ///
  /// \throws AvrorowError if the schema is null or the number of values
  /// differs from the number of fields.
  Row(std::shared_ptr<const RecordNode> schema, std::vector<Value> values);

  const std::shared_ptr<const RecordNode>& schema() const { return schema_; }

  /// \brief Number of values, always equal to the number of schema fields.
  size_t size() const { return values_.size(); }

  const std::vector<Value>& values() const { return values_; }

  /// \brief Positional access without bounds checking.
  const Value& operator[](size_t pos) const { return values_[pos]; }

  /// \brief Get the value at the given position.
  ///
  /// \return InvalidArgument if pos is out of range.
  Result<Value> GetField(size_t pos) const;

  /// \brief Get the value of the named field.
  ///
  /// \return InvalidArgument if the record has no field with that name.
  Result<Value> GetField(std::string_view name) const;

  std::string ToString() const override;

  friend bool operator==(const Row& lhs, const Row& rhs) {
    return *lhs.schema_ == *rhs.schema_ && lhs.values_ == rhs.values_;
  }

 private:
  std::shared_ptr<const RecordNode> schema_;
  std::vector<Value> values_;
};

}  // namespace avrorow
