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

/// \file avrorow/logical_type_decoder.h
/// Conversions from Avro-native encodings of logical types into converted
/// values.  Every function is pure; failures are reported as
/// MalformedLogicalValue.

#include <chrono>
#include <cstdint>
#include <span>

#include "avrorow/avrorow_export.h"
#include "avrorow/result.h"
#include "avrorow/value.h"

namespace avrorow {

/// \brief The largest two's-complement unscaled decimal, in bytes.
constexpr size_t kMaxDecimalBytes = 16;

/// \brief Convert days since 1970-01-01.
AVROROW_EXPORT Date DecodeDate(int32_t days_since_epoch);

/// \brief Convert milliseconds since midnight.
///
/// \param validate_range If true, values outside [0, 24h) are rejected.
AVROROW_EXPORT Result<TimeMillis> DecodeTimeMillis(int32_t millis_since_midnight,
                                                   bool validate_range = true);

/// \brief Convert microseconds since midnight.
///
/// \param validate_range If true, values outside [0, 24h) are rejected.
AVROROW_EXPORT Result<TimeMicros> DecodeTimeMicros(int64_t micros_since_midnight,
                                                   bool validate_range = true);

AVROROW_EXPORT TimestampMillis DecodeTimestampMillis(int64_t millis_since_epoch);
AVROROW_EXPORT TimestampMicros DecodeTimestampMicros(int64_t micros_since_epoch);

/// \brief Convert a two's-complement big-endian unscaled integer.
///
/// The buffer must hold 1 to 16 bytes once leading sign-extension bytes are
/// dropped, and the unscaled value may not have more significant digits than
/// `precision`.
AVROROW_EXPORT Result<Decimal> DecodeDecimal(std::span<const uint8_t> bytes,
                                             int32_t precision, int32_t scale);

/// \brief Convert the 12 bytes of an Avro duration: months, days and
/// milliseconds as little-endian unsigned 32-bit integers.
AVROROW_EXPORT Result<Duration> DecodeDuration(std::span<const uint8_t> bytes);

}  // namespace avrorow
