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

/// \file avrorow/exception.h
/// Exception type for avrorow.  The library reports failures through
/// Result/Status return values; an AvrorowError is only thrown where no return
/// value is available, e.g. when a schema node constructor receives arguments
/// that violate an Avro rule.

#include <format>
#include <stdexcept>
#include <string>

#include "avrorow/avrorow_export.h"

namespace avrorow {

/// \brief Base exception class for exceptions thrown by the avrorow library.
class AVROROW_EXPORT AvrorowError : public std::runtime_error {
 public:
  explicit AvrorowError(const std::string& what) : std::runtime_error(what) {}
};

#define AVROROW_CHECK_OR_DIE(condition, ...)                 \
  do {                                                       \
    if (!(condition)) [[unlikely]] {                         \
      throw avrorow::AvrorowError(std::format(__VA_ARGS__)); \
    }                                                        \
  } while (0)

}  // namespace avrorow
