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

/// \file avrorow/parser_config.h
/// Options controlling how Avro records are converted into rows.

#include <cstdint>
#include <string>
#include <unordered_map>

#include "avrorow/avrorow_export.h"
#include "avrorow/util/config.h"

namespace avrorow {

/// \brief Configuration entries for the record parser.
class AVROROW_EXPORT ParserConfig : public ConfigBase<ParserConfig> {
 public:
  template <typename T>
  using Entry = const ConfigBase<ParserConfig>::Entry<T>;

  /// \brief Maximum number of nested records and collections below the root
  /// record. Deeper values fail with a SchemaMismatch error.
  inline static Entry<int32_t> kMaxNestingDepth{"max-nesting-depth", 64};

  /// \brief Whether time-millis and time-micros values must lie within a day.
  inline static Entry<bool> kValidateTimeOfDay{"validate-time-of-day", true};

  /// \brief Build a configuration from string properties. Unknown keys are kept
  /// but never read.
  static ParserConfig FromMap(const std::unordered_map<std::string, std::string>& props);

  int32_t max_nesting_depth() const { return Get(kMaxNestingDepth); }

  bool validate_time_of_day() const { return Get(kValidateTimeOfDay); }
};

}  // namespace avrorow
