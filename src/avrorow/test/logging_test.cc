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

#include "avrorow/logging.h"

#include <memory>
#include <sstream>

#include <avro/Generic.hh>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "avrorow/avro/avro_record_parser.h"
#include "avrorow/result.h"
#include "avrorow/schema_node.h"
#include "avrorow/test/matchers.h"

namespace avrorow {

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SetLogLevel(LogLevel::kWarn);
    logger_ = spdlog::get("avrorow");
    ASSERT_NE(logger_, nullptr);
    sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
    logger_->sinks().push_back(sink_);
  }

  void TearDown() override {
    auto& sinks = logger_->sinks();
    std::erase(sinks, sink_);
    SetLogLevel(LogLevel::kWarn);
  }

  std::ostringstream output_;
  std::shared_ptr<spdlog::logger> logger_;
  spdlog::sink_ptr sink_;
};

TEST_F(LoggingTest, SetLogLevel) {
  EXPECT_EQ(logger_->level(), spdlog::level::warn);
  SetLogLevel(LogLevel::kDebug);
  EXPECT_EQ(logger_->level(), spdlog::level::debug);
  SetLogLevel(LogLevel::kOff);
  EXPECT_EQ(logger_->level(), spdlog::level::off);
}

TEST_F(LoggingTest, AmbiguousUnionIsLoggedAtDebug) {
  auto node = union_of({int64(), float64()});
  const ::avro::GenericDatum datum(int32_t{5});

  ASSERT_THAT(avro::Dispatch(node, datum), IsOk());
  EXPECT_TRUE(output_.str().empty());

  SetLogLevel(LogLevel::kDebug);
  ASSERT_THAT(avro::Dispatch(node, datum), IsOk());
  logger_->flush();
  EXPECT_NE(output_.str().find("2 union members match Avro int, using member 0"),
            std::string::npos)
      << output_.str();
}

TEST(ErrorKindTest, ToString) {
  EXPECT_EQ(ToString(ErrorKind::kSchemaMismatch), "SchemaMismatch");
  EXPECT_EQ(ToString(ErrorKind::kMissingField), "MissingField");
  EXPECT_EQ(ToString(ErrorKind::kMalformedLogicalValue), "MalformedLogicalValue");
  EXPECT_EQ(ToString(ErrorKind::kInvalidArrowData), "InvalidArrowData");
}

}  // namespace avrorow
