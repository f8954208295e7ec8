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

/// \file avrorow/json_internal.h
/// JSON rendering of converted values and rows.

#include <nlohmann/json.hpp>

#include "avrorow/avrorow_export.h"
#include "avrorow/type_fwd.h"

namespace avrorow {

/// \brief Render a converted value as JSON.
///
/// Scalars map to JSON scalars.  Bytes become an array of byte values, a
/// decimal becomes its decimal string with `scale` fractional digits (e.g.
/// "12.30"), a date becomes an ISO date ("2024-01-31"), times and timestamps
/// become the count of their unit, and a duration becomes
/// {"months": .., "days": .., "millis": ..}.  Lists become arrays and maps
/// become objects with keys in sorted order.
///
/// \param value The value to render.
/// \return An ordered JSON value.
AVROROW_EXPORT nlohmann::ordered_json ToJson(const Value& value);

/// \brief Render a row as a JSON object keyed by field name, in field order.
AVROROW_EXPORT nlohmann::ordered_json ToJson(const Row& row);

}  // namespace avrorow
