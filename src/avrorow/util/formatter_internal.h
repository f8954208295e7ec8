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

#include <concepts>
#include <format>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>

#include "avrorow/util/formatter.h"

/// \brief Concept for smart pointer types
template <typename T>
concept SmartPointerType = requires(T t) {
  { t.operator->() } -> std::same_as<typename T::element_type*>;
  { *t } -> std::convertible_to<typename T::element_type&>;
  { static_cast<bool>(t) } -> std::same_as<bool>;
  typename T::element_type;
};

/// \brief Format an item, dereferencing smart pointers and rendering an empty
/// one as "null".
template <typename T>
std::string FormatItem(const T& item) {
  if constexpr (SmartPointerType<T>) {
    if (item) {
      return std::format("{}", *item);
    } else {
      return "null";
    }
  } else {
    return std::format("{}", item);
  }
}

/// \brief Join a range of elements with a separator and wrap with delimiters
template <std::ranges::input_range Range>
std::string FormatRange(const Range& range, std::string_view separator,
                        std::string_view prefix, std::string_view suffix) {
  if (std::ranges::empty(range)) {
    return std::format("{}{}", prefix, suffix);
  }

  std::stringstream ss;
  ss << prefix;

  bool first = true;
  for (const auto& element : range) {
    if (!first) {
      ss << separator;
    }
    ss << FormatItem(element);
    first = false;
  }

  ss << suffix;
  return ss.str();
}
