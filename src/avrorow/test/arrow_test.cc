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

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <arrow/api.h>
#include <arrow/c/bridge.h>
#include <arrow/json/from_string.h>
#include <avro/Generic.hh>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "avrorow/arrow/row_batch_builder.h"
#include "avrorow/avro/avro_record_parser.h"
#include "avrorow/schema_internal.h"
#include "avrorow/schema_node.h"
#include "avrorow/test/matchers.h"
#include "avrorow/test/test_common.h"

namespace avrorow {

namespace {

constexpr std::string_view kOrderSchemaJson = R"({
  "type": "record",
  "name": "Order",
  "fields": [
    {"name": "id", "type": "long"},
    {"name": "customer", "type": "string"},
    {"name": "note", "type": ["null", "string"]},
    {"name": "amount",
     "type": {"type": "bytes", "logicalType": "decimal", "precision": 10, "scale": 2}},
    {"name": "placed", "type": {"type": "int", "logicalType": "date"}},
    {"name": "at", "type": {"type": "long", "logicalType": "timestamp-millis"}},
    {"name": "code", "type": {"type": "fixed", "name": "Code", "size": 4}},
    {"name": "status", "type": {"type": "enum", "name": "Status", "symbols": ["NEW", "SHIPPED"]}},
    {"name": "items", "type": {"type": "array", "items": {
      "type": "record",
      "name": "Item",
      "fields": [
        {"name": "sku", "type": "string"},
        {"name": "qty", "type": "int"}
      ]
    }}},
    {"name": "attributes", "type": {"type": "map", "values": "string"}},
    {"name": "wait",
     "type": {"type": "fixed", "name": "Wait", "size": 12, "logicalType": "duration"}}
  ]
})";

std::shared_ptr<::arrow::Schema> ImportArrowSchema(const RecordNode& schema) {
  ArrowSchema c_schema;
  auto status = ToArrowSchema(schema, &c_schema);
  if (!status.has_value()) {
    ADD_FAILURE() << status.error().message;
    return nullptr;
  }
  return ::arrow::ImportSchema(&c_schema).ValueOrDie();
}

}  // namespace

struct ToArrowSchemaParam {
  SchemaNodePtr node;
  std::shared_ptr<::arrow::DataType> arrow_type;
  bool nullable = false;
};

class ToArrowSchemaTest : public ::testing::TestWithParam<ToArrowSchemaParam> {};

TEST_P(ToArrowSchemaTest, FieldType) {
  const auto& param = GetParam();
  auto schema = record("Wrapper", {RecordField("foo", param.node)});

  auto arrow_schema = ImportArrowSchema(*schema);
  ASSERT_NE(arrow_schema, nullptr);
  ASSERT_EQ(arrow_schema->num_fields(), 1);

  const auto& field = arrow_schema->field(0);
  EXPECT_EQ(field->name(), "foo");
  EXPECT_EQ(field->nullable(), param.nullable);
  EXPECT_TRUE(field->type()->Equals(*param.arrow_type))
      << field->type()->ToString() << " vs " << param.arrow_type->ToString();
}

INSTANTIATE_TEST_SUITE_P(
    SchemaNodes, ToArrowSchemaTest,
    ::testing::Values(
        ToArrowSchemaParam{.node = boolean(), .arrow_type = ::arrow::boolean()},
        ToArrowSchemaParam{.node = int32(), .arrow_type = ::arrow::int32()},
        ToArrowSchemaParam{.node = int64(), .arrow_type = ::arrow::int64()},
        ToArrowSchemaParam{.node = float32(), .arrow_type = ::arrow::float32()},
        ToArrowSchemaParam{.node = float64(), .arrow_type = ::arrow::float64()},
        ToArrowSchemaParam{.node = string(), .arrow_type = ::arrow::utf8()},
        ToArrowSchemaParam{.node = bytes(), .arrow_type = ::arrow::binary()},
        ToArrowSchemaParam{.node = fixed("Hash", 16),
                           .arrow_type = ::arrow::fixed_size_binary(16)},
        ToArrowSchemaParam{.node = enumeration("Suit", {"SPADES"}),
                           .arrow_type = ::arrow::utf8()},
        ToArrowSchemaParam{.node = decimal(10, 2), .arrow_type = ::arrow::decimal128(10, 2)},
        ToArrowSchemaParam{.node = decimal_fixed("Money", 8, 18, 4),
                           .arrow_type = ::arrow::decimal128(18, 4)},
        ToArrowSchemaParam{.node = date(), .arrow_type = ::arrow::date32()},
        ToArrowSchemaParam{.node = time_millis(),
                           .arrow_type = ::arrow::time32(::arrow::TimeUnit::MILLI)},
        ToArrowSchemaParam{.node = time_micros(),
                           .arrow_type = ::arrow::time64(::arrow::TimeUnit::MICRO)},
        ToArrowSchemaParam{
            .node = timestamp_millis(),
            .arrow_type = ::arrow::timestamp(::arrow::TimeUnit::MILLI, "UTC")},
        ToArrowSchemaParam{
            .node = timestamp_micros(),
            .arrow_type = ::arrow::timestamp(::arrow::TimeUnit::MICRO, "UTC")},
        ToArrowSchemaParam{.node = duration("Interval"),
                           .arrow_type = ::arrow::month_day_nano_interval()},
        ToArrowSchemaParam{.node = optional(int32()),
                           .arrow_type = ::arrow::int32(),
                           .nullable = true},
        ToArrowSchemaParam{.node = union_of({string(), null()}),
                           .arrow_type = ::arrow::utf8(),
                           .nullable = true},
        ToArrowSchemaParam{.node = null(), .arrow_type = ::arrow::null(), .nullable = true}));

TEST(ArrowSchemaTest, NestedTypes) {
  auto item = record("Item", {RecordField("sku", string()),
                              RecordField("qty", optional(int32()))});
  auto schema = record("Order", {RecordField("items", array(item)),
                                 RecordField("tags", map(optional(int64()))),
                                 RecordField("ids", array(optional(int64())))});
  auto arrow_schema = ImportArrowSchema(*schema);
  ASSERT_NE(arrow_schema, nullptr);
  ASSERT_EQ(arrow_schema->num_fields(), 3);

  const auto& items = arrow_schema->field(0);
  ASSERT_EQ(items->type()->id(), ::arrow::Type::LIST);
  const auto& element = items->type()->field(0);
  EXPECT_EQ(element->name(), "item");
  EXPECT_FALSE(element->nullable());
  ASSERT_EQ(element->type()->id(), ::arrow::Type::STRUCT);
  ASSERT_EQ(element->type()->num_fields(), 2);
  EXPECT_EQ(element->type()->field(0)->name(), "sku");
  EXPECT_FALSE(element->type()->field(0)->nullable());
  EXPECT_EQ(element->type()->field(1)->name(), "qty");
  EXPECT_TRUE(element->type()->field(1)->nullable());

  const auto& tags = arrow_schema->field(1);
  ASSERT_EQ(tags->type()->id(), ::arrow::Type::MAP);
  const auto& map_type = static_cast<const ::arrow::MapType&>(*tags->type());
  EXPECT_TRUE(map_type.key_type()->Equals(*::arrow::utf8()));
  EXPECT_FALSE(map_type.key_field()->nullable());
  EXPECT_TRUE(map_type.item_type()->Equals(*::arrow::int64()));
  EXPECT_TRUE(map_type.item_field()->nullable());

  const auto& ids = arrow_schema->field(2);
  ASSERT_EQ(ids->type()->id(), ::arrow::Type::LIST);
  EXPECT_TRUE(ids->type()->field(0)->nullable());
}

TEST(ArrowSchemaTest, MultiMemberUnionIsNotSupported) {
  auto schema = record("Holder", {RecordField("value", union_of({null(), int32(), string()}))});
  ArrowSchema c_schema;
  auto status = ToArrowSchema(*schema, &c_schema);
  EXPECT_THAT(status, IsError(ErrorKind::kNotSupported));
  EXPECT_THAT(status, HasErrorMessage("field 'value'"));
}

class RowBatchBuilderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    avro_schema_ = CompileSchema(kOrderSchemaJson);
    auto parser = avro::RecordParser::Make(avro_schema_);
    ASSERT_THAT(parser, IsOk());
    schema_ = parser->schema();

    ::avro::GenericDatum first(avro_schema_);
    FieldOf(first, "id").value<int64_t>() = 1;
    FieldOf(first, "customer").value<std::string>() = "ann";
    FieldOf(first, "amount").value<std::vector<uint8_t>>() = BigEndianBytes(1230, 2);
    FieldOf(first, "placed").value<int32_t>() = 19753;
    FieldOf(first, "at").value<int64_t>() = 1'700'000'000'000;
    FieldOf(first, "code").value<::avro::GenericFixed>().value() = {'A', 'B', 'C', 'D'};
    auto& item = AppendElement(FieldOf(first, "items"));
    FieldOf(item, "sku").value<std::string>() = "x-1";
    FieldOf(item, "qty").value<int32_t>() = 2;
    AddEntry(FieldOf(first, "attributes"), "b").value<std::string>() = "2";
    AddEntry(FieldOf(first, "attributes"), "a").value<std::string>() = "1";
    FieldOf(first, "wait").value<::avro::GenericFixed>().value() = DurationBytes(3, 10, 500);

    ::avro::GenericDatum second(avro_schema_);
    FieldOf(second, "id").value<int64_t>() = 2;
    FieldOf(second, "customer").value<std::string>() = "bob";
    FieldOf(second, "note").selectBranch(1);
    FieldOf(second, "note").value<std::string>() = "rush";
    FieldOf(second, "amount").value<std::vector<uint8_t>>() = BigEndianBytes(-5, 1);
    FieldOf(second, "code").value<::avro::GenericFixed>().value() = {'W', 'X', 'Y', 'Z'};
    FieldOf(second, "status").value<::avro::GenericEnum>().set("SHIPPED");

    for (const auto* datum : {&first, &second}) {
      auto row = parser->Parse(*datum);
      ASSERT_THAT(row, IsOk());
      rows_.push_back(std::move(row.value()));
    }
  }

  ::avro::ValidSchema avro_schema_;
  std::shared_ptr<const RecordNode> schema_;
  std::vector<Row> rows_;
};

TEST_F(RowBatchBuilderTest, MatchesJsonBatch) {
  auto builder = arrow::RowBatchBuilder::Make(schema_);
  ASSERT_THAT(builder, IsOk());
  for (const auto& row : rows_) {
    ASSERT_THAT((*builder)->Append(row), IsOk());
  }
  EXPECT_EQ((*builder)->num_rows(), 2);

  auto batch = (*builder)->Finish();
  ASSERT_THAT(batch, IsOk());
  EXPECT_EQ((*batch)->num_rows(), 2);
  EXPECT_EQ((*batch)->num_columns(), 11);
  EXPECT_TRUE((*batch)->schema()->Equals(*(*builder)->arrow_schema()));

  auto struct_type = ::arrow::struct_((*builder)->arrow_schema()->fields());
  auto expected = ::arrow::json::ArrayFromJSONString(struct_type, R"([
    {"id": 1, "customer": "ann", "note": null, "amount": "12.30", "placed": 19753,
     "at": 1700000000000, "code": "ABCD", "status": "NEW",
     "items": [{"sku": "x-1", "qty": 2}], "attributes": [["a", "1"], ["b", "2"]],
     "wait": [3, 10, 500000000]},
    {"id": 2, "customer": "bob", "note": "rush", "amount": "-0.05", "placed": 0,
     "at": 0, "code": "WXYZ", "status": "SHIPPED", "items": [], "attributes": [],
     "wait": [0, 0, 0]}
  ])")
                      .ValueOrDie();
  auto actual = (*batch)->ToStructArray().ValueOrDie();
  ASSERT_TRUE(actual->Equals(*expected))
      << "actual: " << actual->ToString() << "\nexpected: " << expected->ToString();

  // The builder is reset by Finish.
  EXPECT_EQ((*builder)->num_rows(), 0);
  ASSERT_THAT((*builder)->Append(rows_[1]), IsOk());
  auto next = (*builder)->Finish();
  ASSERT_THAT(next, IsOk());
  EXPECT_EQ((*next)->num_rows(), 1);
}

TEST_F(RowBatchBuilderTest, RejectsValuesThatDoNotFit) {
  auto builder = arrow::RowBatchBuilder::Make(schema_);
  ASSERT_THAT(builder, IsOk());

  auto values = rows_[0].values();
  values[0] = Value::String("one");
  auto wrong_kind = (*builder)->Append(Row(schema_, values));
  EXPECT_THAT(wrong_kind, IsError(ErrorKind::kInvalidArrowData));
  EXPECT_THAT(wrong_kind, HasErrorMessage("Cannot append string value to column of long"));

  auto null_values = rows_[0].values();
  null_values[1] = Value::Null();
  auto builder_for_null = arrow::RowBatchBuilder::Make(schema_);
  ASSERT_THAT(builder_for_null, IsOk());
  EXPECT_THAT((*builder_for_null)->Append(Row(schema_, null_values)),
              HasErrorMessage("Cannot append null to column of string"));
}

TEST_F(RowBatchBuilderTest, RejectedRowLeavesColumnsAligned) {
  auto expected_builder = arrow::RowBatchBuilder::Make(schema_);
  ASSERT_THAT(expected_builder, IsOk());
  for (const auto& row : rows_) {
    ASSERT_THAT((*expected_builder)->Append(row), IsOk());
  }
  auto expected = (*expected_builder)->Finish();
  ASSERT_THAT(expected, IsOk());

  auto builder = arrow::RowBatchBuilder::Make(schema_);
  ASSERT_THAT(builder, IsOk());
  ASSERT_THAT((*builder)->Append(rows_[0]), IsOk());

  // A valid parse result whose last column has no Arrow counterpart.
  auto values = rows_[1].values();
  values[10] = Value::Duration({.months = 3'000'000'000, .days = 1, .milliseconds = 0});
  auto too_long = (*builder)->Append(Row(schema_, values));
  EXPECT_THAT(too_long, IsError(ErrorKind::kInvalidArrowData));
  EXPECT_THAT(too_long, HasErrorMessage("exceeds Arrow interval"));

  // A bad value nested inside a list element.
  const auto& item_schema = rows_[0][8].list()[0].row().schema();
  values = rows_[1].values();
  values[8] = Value::List(
      {Value::Row(Row(item_schema, {Value::String("x-2"), Value::String("three")}))});
  EXPECT_THAT((*builder)->Append(Row(schema_, values)),
              HasErrorMessage("Cannot append string value to column of int"));
  EXPECT_EQ((*builder)->num_rows(), 1);

  ASSERT_THAT((*builder)->Append(rows_[1]), IsOk());
  auto batch = (*builder)->Finish();
  ASSERT_THAT(batch, IsOk());
  ASSERT_TRUE((*batch)->ValidateFull().ok());
  EXPECT_TRUE((*batch)->Equals(**expected))
      << "actual: " << (*batch)->ToString() << "\nexpected: " << (*expected)->ToString();
}

TEST_F(RowBatchBuilderTest, RejectsRowsOfAnotherSchema) {
  auto builder = arrow::RowBatchBuilder::Make(schema_);
  ASSERT_THAT(builder, IsOk());
  auto other = record("Other", {RecordField("id", int64())});
  EXPECT_THAT((*builder)->Append(Row(other, {Value::Long(1)})),
              IsError(ErrorKind::kInvalidArgument));
}

TEST(RowBatchBuilderMakeTest, InvalidSchemas) {
  EXPECT_THAT(arrow::RowBatchBuilder::Make(nullptr), IsError(ErrorKind::kInvalidArgument));
  auto schema = record("Holder", {RecordField("value", union_of({int32(), string()}))});
  EXPECT_THAT(arrow::RowBatchBuilder::Make(schema), IsError(ErrorKind::kNotSupported));
}

}  // namespace avrorow
