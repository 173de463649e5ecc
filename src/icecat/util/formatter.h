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

/// \file icecat/util/formatter.h
/// std::formatter for the catalog's value types, so ids and statuses can go
/// straight into error and log messages.

#include <concepts>
#include <format>
#include <string_view>
#include <type_traits>

namespace icecat::util {

/// \brief Value types with a ToString() member, e.g. Uuid and the typed ids.
template <typename T>
concept HasToStringMember = requires(const T& value) {
  { value.ToString() } -> std::convertible_to<std::string_view>;
};

/// \brief Enums with a ToString() overload found by argument-dependent lookup,
/// e.g. WarehouseStatus.
template <typename T>
concept HasToStringOverload = std::is_enum_v<T> && requires(const T& value) {
  { ToString(value) } -> std::convertible_to<std::string_view>;
};

}  // namespace icecat::util

template <icecat::util::HasToStringMember T>
struct std::formatter<T> : std::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const T& value, FormatContext& ctx) const {
    return std::formatter<std::string_view>::format(value.ToString(), ctx);
  }
};

template <icecat::util::HasToStringOverload T>
struct std::formatter<T> : std::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const T& value, FormatContext& ctx) const {
    return std::formatter<std::string_view>::format(ToString(value), ctx);
  }
};
