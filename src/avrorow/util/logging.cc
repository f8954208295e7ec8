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

#include <spdlog/sinks/stdout_color_sinks.h>

#include "avrorow/logging.h"
#include "avrorow/util/logging_internal.h"

namespace avrorow {

namespace internal {

std::shared_ptr<spdlog::logger> Logger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return logger;
}

}  // namespace internal

void SetLogLevel(LogLevel level) {
  spdlog::level::level_enum spd_level = spdlog::level::warn;
  switch (level) {
    case LogLevel::kTrace:
      spd_level = spdlog::level::trace;
      break;
    case LogLevel::kDebug:
      spd_level = spdlog::level::debug;
      break;
    case LogLevel::kInfo:
      spd_level = spdlog::level::info;
      break;
    case LogLevel::kWarn:
      spd_level = spdlog::level::warn;
      break;
    case LogLevel::kError:
      spd_level = spdlog::level::err;
      break;
    case LogLevel::kOff:
      spd_level = spdlog::level::off;
      break;
  }
  internal::Logger()->set_level(spd_level);
}

}  // namespace avrorow
