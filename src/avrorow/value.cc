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

#include "avrorow/value.h"

#include <algorithm>
#include <format>
#include <type_traits>

#include "avrorow/row.h"
#include "avrorow/util/formatter.h"
#include "avrorow/util/formatter_internal.h"

namespace avrorow {

namespace {

template <typename T>
struct IsSharedPtr : std::false_type {};

template <typename T>
struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};

// The range of days representable by std::chrono::year_month_day.
constexpr int64_t kMinCivilDays =
    Date{std::chrono::year::min() / 1 / 1}.time_since_epoch().count();
constexpr int64_t kMaxCivilDays =
    Date{std::chrono::year::max() / 12 / 31}.time_since_epoch().count();

bool IsCivilDay(Date date) {
  auto days = date.time_since_epoch().count();
  return days >= kMinCivilDays && days <= kMaxCivilDays;
}

template <typename Unit>
std::string FormatTimestamp(std::chrono::sys_time<Unit> timestamp) {
  if (!IsCivilDay(std::chrono::floor<std::chrono::days>(timestamp))) {
    return std::format("{} since epoch", timestamp.time_since_epoch());
  }
  return std::format("{:%FT%T}Z", timestamp);
}

std::string FormatBytes(const Bytes& bytes) {
  std::string result = "X'";
  for (uint8_t byte : bytes) {
    result += std::format("{:02X}", byte);
  }
  result += "'";
  return result;
}

}  // namespace

std::string FormatDate(Date date) {
  if (!IsCivilDay(date)) {
    return std::format("{}", date.time_since_epoch().count());
  }
  return std::format("{:%F}", date);
}

std::string Decimal::ToString() const {
  std::string digits = unscaled.ToIntegerString();
  const bool negative = !digits.empty() && digits.front() == '-';
  if (negative) {
    digits.erase(0, 1);
  }
  if (scale > 0) {
    const auto num_fraction_digits = static_cast<size_t>(scale);
    if (digits.size() <= num_fraction_digits) {
      digits.insert(0, num_fraction_digits - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - num_fraction_digits, 1, '.');
  }
  return negative ? "-" + digits : digits;
}

std::string_view ToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kBoolean:
      return "boolean";
    case ValueKind::kInt:
      return "int";
    case ValueKind::kLong:
      return "long";
    case ValueKind::kFloat:
      return "float";
    case ValueKind::kDouble:
      return "double";
    case ValueKind::kString:
      return "string";
    case ValueKind::kBytes:
      return "bytes";
    case ValueKind::kDecimal:
      return "decimal";
    case ValueKind::kDate:
      return "date";
    case ValueKind::kTimeMillis:
      return "time-millis";
    case ValueKind::kTimeMicros:
      return "time-micros";
    case ValueKind::kTimestampMillis:
      return "timestamp-millis";
    case ValueKind::kTimestampMicros:
      return "timestamp-micros";
    case ValueKind::kDuration:
      return "duration";
    case ValueKind::kRow:
      return "row";
    case ValueKind::kList:
      return "list";
    case ValueKind::kMap:
      return "map";
  }
  std::unreachable();
}

Value Value::Boolean(bool value) { return Value(Storage(std::in_place_type<bool>, value)); }

Value Value::Int(int32_t value) {
  return Value(Storage(std::in_place_type<int32_t>, value));
}

Value Value::Long(int64_t value) {
  return Value(Storage(std::in_place_type<int64_t>, value));
}

Value Value::Float(float value) { return Value(Storage(std::in_place_type<float>, value)); }

Value Value::Double(double value) {
  return Value(Storage(std::in_place_type<double>, value));
}

Value Value::String(std::string value) {
  return Value(Storage(std::in_place_type<std::string>, std::move(value)));
}

Value Value::Binary(Bytes value) {
  return Value(Storage(std::in_place_type<Bytes>, std::move(value)));
}

Value Value::Decimal(::avrorow::Decimal value) {
  return Value(Storage(std::in_place_type<::avrorow::Decimal>, value));
}

Value Value::Date(::avrorow::Date value) {
  return Value(Storage(std::in_place_type<::avrorow::Date>, value));
}

Value Value::TimeMillis(::avrorow::TimeMillis value) {
  return Value(Storage(std::in_place_type<::avrorow::TimeMillis>, value));
}

Value Value::TimeMicros(::avrorow::TimeMicros value) {
  return Value(Storage(std::in_place_type<::avrorow::TimeMicros>, value));
}

Value Value::TimestampMillis(::avrorow::TimestampMillis value) {
  return Value(Storage(std::in_place_type<::avrorow::TimestampMillis>, value));
}

Value Value::TimestampMicros(::avrorow::TimestampMicros value) {
  return Value(Storage(std::in_place_type<::avrorow::TimestampMicros>, value));
}

Value Value::Duration(::avrorow::Duration value) {
  return Value(Storage(std::in_place_type<::avrorow::Duration>, value));
}

Value Value::Row(::avrorow::Row value) {
  return Row(std::make_shared<const ::avrorow::Row>(std::move(value)));
}

Value Value::Row(std::shared_ptr<const ::avrorow::Row> value) {
  return Value(Storage(std::in_place_type<std::shared_ptr<const ::avrorow::Row>>,
                       std::move(value)));
}

Value Value::List(ValueList values) {
  return Value(Storage(std::in_place_type<std::shared_ptr<const ValueList>>,
                       std::make_shared<const ValueList>(std::move(values))));
}

Value Value::Map(ValueMap entries) {
  return Value(Storage(std::in_place_type<std::shared_ptr<const ValueMap>>,
                       std::make_shared<const ValueMap>(std::move(entries))));
}

const ::avrorow::Row& Value::row() const {
  return *std::get<std::shared_ptr<const ::avrorow::Row>>(storage_);
}

const ValueList& Value::list() const {
  return *std::get<std::shared_ptr<const ValueList>>(storage_);
}

const ValueMap& Value::map() const {
  return *std::get<std::shared_ptr<const ValueMap>>(storage_);
}

std::string Value::ToString() const {
  return std::visit(
      [](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return value ? "true" : "false";
        } else if constexpr (std::is_arithmetic_v<T>) {
          return std::format("{}", value);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return std::format("\"{}\"", value);
        } else if constexpr (std::is_same_v<T, Bytes>) {
          return FormatBytes(value);
        } else if constexpr (std::is_same_v<T, ::avrorow::Decimal>) {
          return value.ToString();
        } else if constexpr (std::is_same_v<T, ::avrorow::Date>) {
          return FormatDate(value);
        } else if constexpr (std::is_same_v<T, ::avrorow::TimeMillis> ||
                             std::is_same_v<T, ::avrorow::TimeMicros>) {
          return std::format("{}", value);
        } else if constexpr (std::is_same_v<T, ::avrorow::TimestampMillis> ||
                             std::is_same_v<T, ::avrorow::TimestampMicros>) {
          return FormatTimestamp(value);
        } else if constexpr (std::is_same_v<T, ::avrorow::Duration>) {
          return std::format("duration(months={}, days={}, millis={})", value.months,
                             value.days, value.milliseconds);
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const ::avrorow::Row>>) {
          return value->ToString();
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const ValueList>>) {
          return FormatRange(*value, ", ", "[", "]");
        } else {
          static_assert(std::is_same_v<T, std::shared_ptr<const ValueMap>>);
          // Sorted by key so that equal maps render identically.
          std::vector<std::pair<std::string_view, const Value*>> entries;
          entries.reserve(value->size());
          for (const auto& [key, entry] : *value) {
            entries.emplace_back(key, &entry);
          }
          std::ranges::sort(entries, {}, [](const auto& e) { return e.first; });
          std::string result = "{";
          for (size_t i = 0; i < entries.size(); ++i) {
            if (i > 0) {
              result += ", ";
            }
            result += std::format("\"{}\": {}", entries[i].first, *entries[i].second);
          }
          result += "}";
          return result;
        }
      },
      storage_);
}

bool operator==(const Value& lhs, const Value& rhs) {
  if (lhs.kind() != rhs.kind()) {
    return false;
  }
  return std::visit(
      [&rhs]<typename T>(const T& left) -> bool {
        const auto& right = std::get<T>(rhs.storage());
        if constexpr (IsSharedPtr<T>::value) {
          return left == right || *left == *right;
        } else {
          return left == right;
        }
      },
      lhs.storage());
}

}  // namespace avrorow
