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

#include "avrorow/json_internal.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "avrorow/row.h"
#include "avrorow/value.h"

namespace avrorow {

namespace {

constexpr const char* kMonths = "months";
constexpr const char* kDays = "days";
constexpr const char* kMillis = "millis";

}  // namespace

nlohmann::ordered_json ToJson(const Value& value) {
  switch (value.kind()) {
    case ValueKind::kNull:
      return nullptr;
    case ValueKind::kBoolean:
      return *value.get_if<bool>();
    case ValueKind::kInt:
      return *value.get_if<int32_t>();
    case ValueKind::kLong:
      return *value.get_if<int64_t>();
    case ValueKind::kFloat:
      return *value.get_if<float>();
    case ValueKind::kDouble:
      return *value.get_if<double>();
    case ValueKind::kString:
      return *value.get_if<std::string>();
    case ValueKind::kBytes: {
      nlohmann::ordered_json json = nlohmann::ordered_json::array();
      for (uint8_t byte : *value.get_if<Bytes>()) {
        json.push_back(byte);
      }
      return json;
    }
    case ValueKind::kDecimal:
      return value.get_if<Decimal>()->ToString();
    case ValueKind::kDate:
      return FormatDate(*value.get_if<Date>());
    case ValueKind::kTimeMillis:
      return value.get_if<TimeMillis>()->count();
    case ValueKind::kTimeMicros:
      return value.get_if<TimeMicros>()->count();
    case ValueKind::kTimestampMillis:
      return value.get_if<TimestampMillis>()->time_since_epoch().count();
    case ValueKind::kTimestampMicros:
      return value.get_if<TimestampMicros>()->time_since_epoch().count();
    case ValueKind::kDuration: {
      const auto& duration = *value.get_if<Duration>();
      nlohmann::ordered_json json;
      json[kMonths] = duration.months;
      json[kDays] = duration.days;
      json[kMillis] = duration.milliseconds;
      return json;
    }
    case ValueKind::kRow:
      return ToJson(value.row());
    case ValueKind::kList: {
      nlohmann::ordered_json json = nlohmann::ordered_json::array();
      for (const auto& element : value.list()) {
        json.push_back(ToJson(element));
      }
      return json;
    }
    case ValueKind::kMap: {
      const auto& entries = value.map();
      std::vector<std::string_view> keys;
      keys.reserve(entries.size());
      for (const auto& [key, _] : entries) {
        keys.push_back(key);
      }
      std::ranges::sort(keys);

      nlohmann::ordered_json json = nlohmann::ordered_json::object();
      for (auto key : keys) {
        json[std::string(key)] = ToJson(entries.find(std::string(key))->second);
      }
      return json;
    }
  }
  std::unreachable();
}

nlohmann::ordered_json ToJson(const Row& row) {
  nlohmann::ordered_json json = nlohmann::ordered_json::object();
  const auto fields = row.schema()->fields();
  for (size_t i = 0; i < row.size(); ++i) {
    json[std::string(fields[i].name())] = ToJson(row[i]);
  }
  return json;
}

}  // namespace avrorow
