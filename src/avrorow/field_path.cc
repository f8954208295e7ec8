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

#include "avrorow/field_path.h"

#include <format>

namespace avrorow {

void FieldPath::PushField(std::string_view name) {
  segments_.push_back({.kind = SegmentKind::kField, .name = std::string(name)});
}

void FieldPath::PushIndex(size_t index) {
  segments_.push_back({.kind = SegmentKind::kIndex, .index = index});
}

void FieldPath::PushKey(std::string_view key) {
  segments_.push_back({.kind = SegmentKind::kKey, .name = std::string(key)});
}

std::string FieldPath::ToString() const {
  std::string repr;
  for (const auto& segment : segments_) {
    switch (segment.kind) {
      case SegmentKind::kField:
        if (!repr.empty()) {
          repr += '.';
        }
        repr += segment.name;
        break;
      case SegmentKind::kIndex:
        repr += std::format("[{}]", segment.index);
        break;
      case SegmentKind::kKey:
        repr += std::format("[\"{}\"]", segment.name);
        break;
    }
  }
  return repr;
}

}  // namespace avrorow
