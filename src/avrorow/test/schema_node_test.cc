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

#include "avrorow/schema_node.h"

#include <format>
#include <memory>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "avrorow/exception.h"
#include "avrorow/util/formatter.h"  // IWYU pragma: keep
#include "avrorow/test/matchers.h"

namespace avrorow {

TEST(SchemaNodeTest, PrimitiveToString) {
  EXPECT_EQ(null()->ToString(), "null");
  EXPECT_EQ(int32()->ToString(), "int");
  EXPECT_EQ(int64()->ToString(), "long");
  EXPECT_EQ(string()->ToString(), "string");
  EXPECT_EQ(date()->ToString(), "date<int>");
  EXPECT_EQ(time_micros()->ToString(), "time-micros<long>");
  EXPECT_EQ(timestamp_millis()->ToString(), "timestamp-millis<long>");
  EXPECT_EQ(decimal(10, 2)->ToString(), "decimal(10, 2)<bytes>");
  EXPECT_EQ(std::format("{}", *float64()), "double");
}

TEST(SchemaNodeTest, NamedToString) {
  EXPECT_EQ(fixed("Hash", 16)->ToString(), "fixed Hash[16]");
  EXPECT_EQ(duration("Interval")->ToString(), "duration<fixed Interval[12]>");
  EXPECT_EQ(decimal_fixed("Money", 8, 18, 4)->ToString(),
            "decimal(18, 4)<fixed Money[8]>");
  EXPECT_EQ(enumeration("Suit", {"SPADES", "HEARTS"})->ToString(),
            "enum Suit [SPADES, HEARTS]");
}

TEST(SchemaNodeTest, CompositeToString) {
  auto point = record("Point", {RecordField("x", int32()),
                                RecordField("y", optional(float64()))});
  EXPECT_EQ(point->ToString(), "record Point {x: int, y: union<null, double>}");
  EXPECT_EQ(array(string())->ToString(), "array<string>");
  EXPECT_EQ(map(array(int64()))->ToString(), "map<array<long>>");
  EXPECT_EQ(std::format("{}", *union_of({int32(), point})),
            "union<int, record Point {x: int, y: union<null, double>}>");
}

TEST(SchemaNodeTest, LogicalTypePlacement) {
  EXPECT_THAT(ValidateLogicalType(AvroType::kInt, LogicalType::Date()), IsOk());
  EXPECT_THAT(ValidateLogicalType(AvroType::kInt, LogicalType::TimeMillis()), IsOk());
  EXPECT_THAT(ValidateLogicalType(AvroType::kLong, LogicalType::TimeMicros()), IsOk());
  EXPECT_THAT(ValidateLogicalType(AvroType::kLong, LogicalType::TimestampMicros()),
              IsOk());
  EXPECT_THAT(ValidateLogicalType(AvroType::kBytes, LogicalType::Decimal(38, 38)), IsOk());
  EXPECT_THAT(ValidateLogicalType(AvroType::kFixed, LogicalType::Duration(), 12), IsOk());

  auto status = ValidateLogicalType(AvroType::kLong, LogicalType::Date());
  EXPECT_THAT(status, IsError(ErrorKind::kInvalidSchema));
  EXPECT_THAT(status, HasErrorMessage("Logical type date cannot annotate Avro type long"));

  EXPECT_THAT(ValidateLogicalType(AvroType::kString, LogicalType::Decimal(4, 2)),
              IsError(ErrorKind::kInvalidSchema));
  EXPECT_THAT(ValidateLogicalType(AvroType::kBytes, LogicalType::Duration()),
              IsError(ErrorKind::kInvalidSchema));
  EXPECT_THAT(ValidateLogicalType(AvroType::kFixed, LogicalType::Duration(), 11),
              HasErrorMessage("Duration must be a fixed of size 12, got 11"));
}

TEST(SchemaNodeTest, DecimalBounds) {
  EXPECT_THAT(ValidateLogicalType(AvroType::kBytes, LogicalType::Decimal(0, 0)),
              HasErrorMessage("Decimal precision must be in [1, 38], got 0"));
  EXPECT_THAT(ValidateLogicalType(AvroType::kBytes, LogicalType::Decimal(39, 0)),
              IsError(ErrorKind::kInvalidSchema));
  EXPECT_THAT(ValidateLogicalType(AvroType::kBytes, LogicalType::Decimal(4, 5)),
              HasErrorMessage("Decimal scale must be in [0, 4], got 5"));
  EXPECT_THAT(ValidateLogicalType(AvroType::kBytes, LogicalType::Decimal(4, -1)),
              IsError(ErrorKind::kInvalidSchema));

  EXPECT_EQ(MaxDecimalPrecision(0), 0);
  EXPECT_EQ(MaxDecimalPrecision(1), 2);
  EXPECT_EQ(MaxDecimalPrecision(2), 4);
  EXPECT_EQ(MaxDecimalPrecision(4), 9);
  EXPECT_EQ(MaxDecimalPrecision(8), 18);
  EXPECT_EQ(MaxDecimalPrecision(16), 38);

  EXPECT_NO_THROW(decimal_fixed("D4", 4, 9, 0));
  EXPECT_THROW(decimal_fixed("D4", 4, 10, 0), AvrorowError);
}

TEST(SchemaNodeTest, ConstructorsRejectInvalidNodes) {
  EXPECT_THROW(PrimitiveNode(AvroType::kRecord), AvrorowError);
  EXPECT_THROW(PrimitiveNode(AvroType::kString, LogicalType::Date()), AvrorowError);
  EXPECT_THROW(FixedNode("Interval", 11, LogicalType::Duration()), AvrorowError);
  EXPECT_THROW(fixed("", 4), AvrorowError);
  EXPECT_THROW(enumeration("Suit", {"SPADES", "SPADES"}), AvrorowError);
  EXPECT_THROW(RecordField("", int32()), AvrorowError);
  EXPECT_THROW(RecordField("x", nullptr), AvrorowError);
  EXPECT_THROW(array(nullptr), AvrorowError);
  EXPECT_THROW(map(nullptr), AvrorowError);
}

TEST(SchemaNodeTest, RecordFields) {
  auto point = record("Point", {RecordField("x", int32()), RecordField("y", int32()),
                                RecordField("label", optional(string()))});
  EXPECT_EQ(point->num_fields(), 3);
  EXPECT_EQ(point->name(), "Point");
  EXPECT_EQ(point->FieldIndex("y"), 1);
  EXPECT_EQ(point->FieldIndex("label"), 2);
  EXPECT_EQ(point->FieldIndex("z"), std::nullopt);
  EXPECT_FALSE(point->fields()[0].nullable());
  EXPECT_TRUE(point->fields()[2].nullable());

  try {
    record("Point", {RecordField("x", int32()), RecordField("x", int64())});
    FAIL() << "Duplicate field names must be rejected";
  } catch (const AvrorowError& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("Duplicate field name 'x' in record Point"));
  }
}

TEST(SchemaNodeTest, Unions) {
  auto nullable_int = optional(int32());
  EXPECT_TRUE(nullable_int->nullable());
  EXPECT_EQ(nullable_int->null_index(), 0);
  EXPECT_EQ(nullable_int->single_non_null_member(), int32().get());

  auto trailing_null = union_of({string(), null()});
  EXPECT_EQ(trailing_null->null_index(), 1);
  EXPECT_EQ(trailing_null->single_non_null_member(), string().get());

  auto two_records = union_of({record("A", {RecordField("x", int32())}),
                               record("B", {RecordField("y", string())})});
  EXPECT_FALSE(two_records->nullable());
  EXPECT_EQ(two_records->null_index(), std::nullopt);
  EXPECT_EQ(two_records->single_non_null_member(), nullptr);

  EXPECT_THROW(union_of({}), AvrorowError);
  EXPECT_THROW(union_of({int32(), int32()}), AvrorowError);
  EXPECT_THROW(union_of({null(), null()}), AvrorowError);
  EXPECT_THROW(union_of({null(), optional(int32())}), AvrorowError);
  EXPECT_THROW(union_of({fixed("F", 4), fixed("F", 8)}), AvrorowError);
  EXPECT_NO_THROW(union_of({fixed("F", 4), fixed("G", 4)}));
}

TEST(SchemaNodeTest, StructuralEquality) {
  auto make_point = [] {
    return record("Point", {RecordField("x", int32()),
                            RecordField("tags", array(optional(string())))});
  };
  EXPECT_EQ(*make_point(), *make_point());
  EXPECT_NE(*make_point(), *record("Point", {RecordField("x", int32())}));
  EXPECT_NE(*make_point(), *record("Other", {RecordField("x", int32()),
                                             RecordField("tags",
                                                         array(optional(string())))}));

  EXPECT_EQ(*decimal(10, 2), *decimal(10, 2));
  EXPECT_NE(*decimal(10, 2), *decimal(10, 3));
  EXPECT_NE(*decimal(10, 2), *bytes());
  EXPECT_NE(*int32(), *date());
  EXPECT_EQ(*fixed("F", 4), *fixed("F", 4));
  EXPECT_NE(*fixed("F", 4), *fixed("F", 5));
  EXPECT_NE(*map(int32()), *array(int32()));
  EXPECT_EQ(*union_of({null(), int32()}), *optional(int32()));
  EXPECT_NE(*union_of({int32(), null()}), *optional(int32()));
}

}  // namespace avrorow
