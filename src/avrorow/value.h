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

/// \file avrorow/value.h
/// Converted values produced by the record parser.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <arrow/util/decimal.h>

#include "avrorow/avrorow_export.h"
#include "avrorow/type_fwd.h"
#include "avrorow/util/formattable.h"

namespace avrorow {

/// \brief An exact decimal number: unscaled * 10^(-scale).
struct AVROROW_EXPORT Decimal {
  ::arrow::Decimal128 unscaled;
  int32_t precision = 0;
  int32_t scale = 0;

  /// \brief Render with exactly `scale` fractional digits, e.g. "12.30".
  std::string ToString() const;

  bool operator==(const Decimal& other) const = default;
};

/// \brief An Avro duration: three independent unsigned components.
struct AVROROW_EXPORT Duration {
  uint32_t months = 0;
  uint32_t days = 0;
  uint32_t milliseconds = 0;

  bool operator==(const Duration& other) const = default;
};

using Bytes = std::vector<uint8_t>;
using Date = std::chrono::sys_days;
using TimeMillis = std::chrono::milliseconds;
using TimeMicros = std::chrono::microseconds;
using TimestampMillis = std::chrono::sys_time<std::chrono::milliseconds>;
using TimestampMicros = std::chrono::sys_time<std::chrono::microseconds>;
using ValueList = std::vector<Value>;
using ValueMap = std::unordered_map<std::string, Value>;

/// \brief Render a date as an ISO date ("2024-01-31"), or as its day count when
/// it lies outside the years representable by std::chrono::year.
AVROROW_EXPORT std::string FormatDate(Date date);

/// \brief The kind of a converted value.  The order matches the alternatives of
/// Value::Storage.
enum class ValueKind {
  kNull,
  kBoolean,
  kInt,
  kLong,
  kFloat,
  kDouble,
  kString,
  kBytes,
  kDecimal,
  kDate,
  kTimeMillis,
  kTimeMicros,
  kTimestampMillis,
  kTimestampMicros,
  kDuration,
  kRow,
  kList,
  kMap,
};

/// \brief Get the name of a value kind, e.g. "timestamp-micros".
AVROROW_EXPORT std::string_view ToString(ValueKind kind);

/// \brief One converted value.  Nested rows, lists and maps are shared immutable
/// objects, so copying a Value never deep-copies a collection.  Two values are
/// equal when they have the same kind and deeply equal contents.
class AVROROW_EXPORT Value : public util::Formattable {
 public:
  using Storage =
      std::variant<std::monostate, bool, int32_t, int64_t, float, double, std::string,
                   Bytes, ::avrorow::Decimal, ::avrorow::Date, ::avrorow::TimeMillis,
                   ::avrorow::TimeMicros, ::avrorow::TimestampMillis,
                   ::avrorow::TimestampMicros, ::avrorow::Duration,
                   std::shared_ptr<const ::avrorow::Row>, std::shared_ptr<const ValueList>,
                   std::shared_ptr<const ValueMap>>;

  /// \brief Construct a null value.
  Value() = default;

  /// \defgroup value-factories Factory functions for values
  /// @{
  static Value Null() { return {}; }
  static Value Boolean(bool value);
  static Value Int(int32_t value);
  static Value Long(int64_t value);
  static Value Float(float value);
  static Value Double(double value);
  static Value String(std::string value);
  static Value Binary(Bytes value);
  static Value Decimal(::avrorow::Decimal value);
  static Value Date(::avrorow::Date value);
  static Value TimeMillis(::avrorow::TimeMillis value);
  static Value TimeMicros(::avrorow::TimeMicros value);
  static Value TimestampMillis(::avrorow::TimestampMillis value);
  static Value TimestampMicros(::avrorow::TimestampMicros value);
  static Value Duration(::avrorow::Duration value);
  static Value Row(::avrorow::Row value);
  static Value Row(std::shared_ptr<const ::avrorow::Row> value);
  static Value List(ValueList values);
  static Value Map(ValueMap entries);
  /// @}

  ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }
  bool is_null() const { return kind() == ValueKind::kNull; }

  const Storage& storage() const { return storage_; }

  /// \brief Get the payload of the given alternative, or nullptr if the value
  /// holds another kind.
  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&storage_);
  }

  /// \brief Get the nested row.  Throws std::bad_variant_access unless kind()
  /// is kRow.
  const ::avrorow::Row& row() const;
  /// \brief Get the list elements.  Throws std::bad_variant_access unless
  /// kind() is kList.
  const ValueList& list() const;
  /// \brief Get the map entries.  Throws std::bad_variant_access unless kind()
  /// is kMap.
  const ValueMap& map() const;

  std::string ToString() const override;

 private:
  explicit Value(Storage storage) : storage_(std::move(storage)) {}

  Storage storage_;
};

/// \brief Deep structural equality.
AVROROW_EXPORT bool operator==(const Value& lhs, const Value& rhs);

}  // namespace avrorow
