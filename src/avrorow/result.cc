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

#include "avrorow/result.h"

#include <utility>

namespace avrorow {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kInvalidArrowData:
      return "InvalidArrowData";
    case ErrorKind::kInvalidSchema:
      return "InvalidSchema";
    case ErrorKind::kMalformedLogicalValue:
      return "MalformedLogicalValue";
    case ErrorKind::kMissingField:
      return "MissingField";
    case ErrorKind::kNotSupported:
      return "NotSupported";
    case ErrorKind::kSchemaMismatch:
      return "SchemaMismatch";
    case ErrorKind::kUnknownError:
      return "UnknownError";
  }
  std::unreachable();
}

}  // namespace avrorow
