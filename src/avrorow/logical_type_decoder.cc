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

#include "avrorow/logical_type_decoder.h"

#include <arrow/util/decimal.h>

#include "avrorow/arrow/arrow_error_transform_internal.h"
#include "avrorow/schema_node.h"
#include "avrorow/util/endian.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep
#include "avrorow/util/macros.h"

namespace avrorow {

using ::avrorow::arrow::ToErrorKind;

namespace {

template <typename Unit>
Result<Unit> CheckTimeOfDay(Unit time_of_day, bool validate_range) {
  constexpr Unit kDay = std::chrono::duration_cast<Unit>(std::chrono::days{1});
  if (validate_range && (time_of_day < Unit::zero() || time_of_day >= kDay)) {
    return MalformedLogicalValue("Time of day {} is outside [0, {})", time_of_day, kDay);
  }
  return time_of_day;
}

/// \brief Whether `lead` only repeats the sign bit of the byte after it.
bool IsSignExtension(uint8_t lead, uint8_t next) {
  return (lead == 0x00 && (next & 0x80) == 0) || (lead == 0xFF && (next & 0x80) != 0);
}

}  // namespace

Date DecodeDate(int32_t days_since_epoch) {
  return Date{std::chrono::days{days_since_epoch}};
}

Result<TimeMillis> DecodeTimeMillis(int32_t millis_since_midnight, bool validate_range) {
  return CheckTimeOfDay(TimeMillis{millis_since_midnight}, validate_range);
}

Result<TimeMicros> DecodeTimeMicros(int64_t micros_since_midnight, bool validate_range) {
  return CheckTimeOfDay(TimeMicros{micros_since_midnight}, validate_range);
}

TimestampMillis DecodeTimestampMillis(int64_t millis_since_epoch) {
  return TimestampMillis{std::chrono::milliseconds{millis_since_epoch}};
}

TimestampMicros DecodeTimestampMicros(int64_t micros_since_epoch) {
  return TimestampMicros{std::chrono::microseconds{micros_since_epoch}};
}

Result<Decimal> DecodeDecimal(std::span<const uint8_t> bytes, int32_t precision,
                              int32_t scale) {
  if (bytes.empty()) {
    return MalformedLogicalValue("Decimal value must have at least one byte");
  }
  // Wide fixed types pad with sign extension, which carries no digits.
  while (bytes.size() > kMaxDecimalBytes && IsSignExtension(bytes[0], bytes[1])) {
    bytes = bytes.subspan(1);
  }
  if (bytes.size() > kMaxDecimalBytes) {
    return MalformedLogicalValue("Decimal value of {} bytes exceeds the maximum of {}",
                                 bytes.size(), kMaxDecimalBytes);
  }
  if (precision < 1 || precision > LogicalType::kMaxDecimalPrecision) {
    return MalformedLogicalValue("Invalid decimal precision {}", precision);
  }

  AVROROW_ARROW_ASSIGN_OR_RETURN(
      auto unscaled, ::arrow::Decimal128::FromBigEndian(
                         bytes.data(), static_cast<int32_t>(bytes.size())));
  if (!unscaled.FitsInPrecision(precision)) {
    return MalformedLogicalValue("Unscaled decimal {} does not fit in precision {}",
                                 unscaled.ToIntegerString(), precision);
  }
  return Decimal{.unscaled = unscaled, .precision = precision, .scale = scale};
}

Result<Duration> DecodeDuration(std::span<const uint8_t> bytes) {
  if (bytes.size() != LogicalType::kDurationSize) {
    return MalformedLogicalValue("Duration value must have {} bytes, got {}",
                                 LogicalType::kDurationSize, bytes.size());
  }
  return Duration{
      .months = LoadLittleEndian<uint32_t>(bytes.data()),
      .days = LoadLittleEndian<uint32_t>(bytes.data() + 4),
      .milliseconds = LoadLittleEndian<uint32_t>(bytes.data() + 8),
  };
}

}  // namespace avrorow
