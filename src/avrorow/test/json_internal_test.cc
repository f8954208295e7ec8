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

#include <chrono>
#include <limits>

#include <avro/Generic.hh>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "avrorow/avro/avro_record_parser.h"
#include "avrorow/row.h"
#include "avrorow/schema_node.h"
#include "avrorow/value.h"
#include "avrorow/test/matchers.h"
#include "avrorow/test/test_common.h"

namespace avrorow {

using nlohmann::ordered_json;

TEST(JsonInternalTest, Scalars) {
  EXPECT_EQ(ToJson(Value::Null()), ordered_json(nullptr));
  EXPECT_EQ(ToJson(Value::Boolean(true)), ordered_json(true));
  EXPECT_EQ(ToJson(Value::Int(std::numeric_limits<int32_t>::min())),
            ordered_json(std::numeric_limits<int32_t>::min()));
  EXPECT_EQ(ToJson(Value::Long(std::numeric_limits<int64_t>::max())),
            ordered_json(std::numeric_limits<int64_t>::max()));
  EXPECT_EQ(ToJson(Value::Double(2.5)), ordered_json(2.5));
  EXPECT_EQ(ToJson(Value::String("text")), ordered_json("text"));
  EXPECT_EQ(ToJson(Value::Binary({0xDE, 0xAD})), ordered_json::parse("[222, 173]"));
}

TEST(JsonInternalTest, LogicalValues) {
  Decimal decimal{.unscaled = ::arrow::Decimal128(1230), .precision = 10, .scale = 2};
  EXPECT_EQ(ToJson(Value::Decimal(decimal)), ordered_json("12.30"));
  EXPECT_EQ(ToJson(Value::Date(Date{std::chrono::days{19753}})),
            ordered_json("2024-01-31"));
  EXPECT_EQ(ToJson(Value::TimeMillis(std::chrono::milliseconds{500})), ordered_json(500));
  EXPECT_EQ(ToJson(Value::TimestampMicros(TimestampMicros{std::chrono::microseconds{-1}})),
            ordered_json(-1));
  EXPECT_EQ(ToJson(Value::Duration({.months = 3, .days = 10, .milliseconds = 500})).dump(),
            R"({"months":3,"days":10,"millis":500})");
}

TEST(JsonInternalTest, Collections) {
  EXPECT_EQ(ToJson(Value::List({})), ordered_json::array());
  EXPECT_EQ(ToJson(Value::Map({})), ordered_json::object());
  EXPECT_EQ(ToJson(Value::List({Value::Int(1), Value::Null()})).dump(), "[1,null]");
  // Map keys are sorted.
  EXPECT_EQ(ToJson(Value::Map({{"zeta", Value::Int(1)}, {"alpha", Value::Int(2)}})).dump(),
            R"({"alpha":2,"zeta":1})");
}

TEST(JsonInternalTest, RowKeepsFieldOrder) {
  auto schema = record("Point", {RecordField("y", int32()), RecordField("x", int32()),
                                 RecordField("label", optional(string()))});
  Row row(schema, {Value::Int(2), Value::Int(1), Value::Null()});
  EXPECT_EQ(ToJson(row).dump(), R"({"y":2,"x":1,"label":null})");
}

TEST(JsonInternalTest, NestedRow) {
  auto schema = CompileSchema(kStateSchemaJson);
  auto parser = avro::RecordParser::Make(schema);
  ASSERT_THAT(parser, IsOk());
  auto row = parser->Parse(MakeStateDatum(schema));
  ASSERT_THAT(row, IsOk());

  auto expected = ordered_json::parse(R"({
    "name": "Utopia",
    "regions": {
      "cities": [
        {"name": "Springfield", "neighborhoods": [
          {"name": "Springfield center", "streets": [
            {"name": "Springfield street 1", "zip": "10001"},
            {"name": "Springfield street 2", "zip": "10002"}
          ]}
        ]},
        {"name": "Shelbyville", "neighborhoods": [
          {"name": "Shelbyville center", "streets": [
            {"name": "Shelbyville street 1", "zip": "10001"},
            {"name": "Shelbyville street 2", "zip": "10002"}
          ]}
        ]}
      ],
      "north": [
        {"name": "Northville", "neighborhoods": [
          {"name": "Northville center", "streets": [
            {"name": "Northville street 1", "zip": "10001"},
            {"name": "Northville street 2", "zip": "10002"}
          ]}
        ]}
      ]
    }
  })");
  EXPECT_EQ(ToJson(row.value()), expected) << ToJson(row.value()).dump(2);
}

}  // namespace avrorow
