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

/// \file avrorow/field_path.h
/// The location of a value inside a record, used to prefix parser errors.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "avrorow/avrorow_export.h"
#include "avrorow/util/formattable.h"

namespace avrorow {

/// \brief A path from the record root to a nested value, rendered as field
/// names joined by '.', "[index]" for array elements and "[\"key\"]" for map
/// entries, e.g. `regions["cities"][1].name`.
///
/// The parser keeps one path per parse call and pushes and pops segments while
/// it descends, so the path is only rendered when an error is reported.
class AVROROW_EXPORT FieldPath : public util::Formattable {
 public:
  enum class SegmentKind {
    kField,
    kIndex,
    kKey,
  };

  struct Segment {
    SegmentKind kind;
    std::string name;
    size_t index = 0;

    bool operator==(const Segment& other) const = default;
  };

  FieldPath() = default;

  void PushField(std::string_view name);
  void PushIndex(size_t index);
  void PushKey(std::string_view key);
  void Pop() { segments_.pop_back(); }

  bool empty() const { return segments_.empty(); }
  size_t depth() const { return segments_.size(); }
  const std::vector<Segment>& segments() const { return segments_; }

  std::string ToString() const override;

  bool operator==(const FieldPath& other) const = default;

 private:
  std::vector<Segment> segments_;
};

/// \brief Tags a map key for FieldPathScope.
struct MapKey {
  std::string_view key;
};

/// \brief Pushes one segment on construction and pops it on destruction.
class FieldPathScope {
 public:
  FieldPathScope(FieldPath& path, std::string_view field) : path_(path) {
    path_.PushField(field);
  }
  FieldPathScope(FieldPath& path, size_t index) : path_(path) { path_.PushIndex(index); }
  FieldPathScope(FieldPath& path, MapKey key) : path_(path) { path_.PushKey(key.key); }
  ~FieldPathScope() { path_.Pop(); }

  FieldPathScope(const FieldPathScope&) = delete;
  FieldPathScope& operator=(const FieldPathScope&) = delete;

 private:
  FieldPath& path_;
};

}  // namespace avrorow
