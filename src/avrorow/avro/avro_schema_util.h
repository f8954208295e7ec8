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

/// \file avrorow/avro/avro_schema_util.h
/// Translation of avro-cpp schemas into avrorow schema nodes.

#include <memory>
#include <string>
#include <string_view>

#include <avro/Node.hh>

#include "avrorow/avrorow_export.h"
#include "avrorow/result.h"
#include "avrorow/schema_node.h"

namespace avro {
class ValidSchema;
}  // namespace avro

namespace avrorow::avro {

/// \brief Translate an avro-cpp schema node.
///
/// Symbolic references are resolved against the named types seen so far.  A
/// schema that refers to itself is rejected because a converted row cannot be
/// recursive.  Logical types other than date, time-millis, time-micros,
/// timestamp-millis, timestamp-micros, decimal and duration are ignored.
///
/// \return The translated node, or InvalidSchema.
AVROROW_EXPORT Result<SchemaNodePtr> FromAvroNode(const ::avro::NodePtr& node);

/// \brief Translate the root record of an avro-cpp schema.
///
/// \return InvalidSchema if the root is not a record or cannot be translated.
AVROROW_EXPORT Result<std::shared_ptr<const RecordNode>> FromAvroSchema(
    const ::avro::ValidSchema& schema);

/// \brief Compile an Avro JSON schema and translate its root record.
AVROROW_EXPORT Result<std::shared_ptr<const RecordNode>> FromAvroJson(
    std::string_view json);

/// \brief Render an avro-cpp node as its JSON schema text.
AVROROW_EXPORT std::string ToString(const ::avro::NodePtr& node);

}  // namespace avrorow::avro
