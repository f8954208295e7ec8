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

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>

/// \file avrorow/util/endian.h
/// \brief Reading fixed-width integers out of Avro byte buffers.

namespace avrorow {

/// \brief Convert an integer from little-endian format.
template <std::integral T>
constexpr T FromLittleEndian(T value) {
  if constexpr (std::endian::native == std::endian::little || sizeof(T) == 1) {
    return value;
  } else {
    return std::byteswap(value);
  }
}

/// \brief Convert an integer from big-endian format.
template <std::integral T>
constexpr T FromBigEndian(T value) {
  if constexpr (std::endian::native == std::endian::big || sizeof(T) == 1) {
    return value;
  } else {
    return std::byteswap(value);
  }
}

/// \brief Load a little-endian integer from an unaligned buffer.
///
/// The caller guarantees that `data` points to at least sizeof(T) bytes.
template <std::integral T>
T LoadLittleEndian(const uint8_t* data) {
  T value;
  std::memcpy(&value, data, sizeof(T));
  return FromLittleEndian(value);
}

}  // namespace avrorow
