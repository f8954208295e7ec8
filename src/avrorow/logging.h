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

/// \file avrorow/logging.h
/// Control over the diagnostics emitted by the library.  Failures are always
/// returned as errors; the log only carries debug details such as which union
/// branch was picked for an ambiguous value.

#include "avrorow/avrorow_export.h"

namespace avrorow {

enum class LogLevel {
  kTrace,
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

/// \brief Set the level of the "avrorow" logger. The default is kWarn.
AVROROW_EXPORT void SetLogLevel(LogLevel level);

}  // namespace avrorow
