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

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "icecat/icecat_export.h"
#include "icecat/result.h"

/// \file icecat/util/uuid.h
/// \brief UUID (Universally Unique Identifier) representation.

namespace icecat {

class ICECAT_EXPORT Uuid {
 public:
  Uuid() = delete;
  constexpr static size_t kLength = 16;

  explicit Uuid(std::array<uint8_t, kLength> data);

  /// \brief Generate UUID version 7 per RFC 9562, with the current timestamp.
  ///
  /// Version 7 ids sort by creation time, which keeps catalog primary keys
  /// roughly insertion ordered.
  static Uuid GenerateV7();

  /// \brief Generate UUID version 7 per RFC 9562, with the given timestamp.
  ///
  /// \param unix_ts_ms number of milliseconds since start of the UNIX epoch
  static Uuid GenerateV7(uint64_t unix_ts_ms);

  /// \brief Create a UUID from a string, either hyphenated
  /// ("xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx") or 32 hex digits.
  static Result<Uuid> FromString(std::string_view str);

  /// \brief Get the raw bytes of the UUID.
  std::span<const uint8_t> bytes() const { return data_; }

  /// \brief Convert the UUID to the lower-case hyphenated form.
  std::string ToString() const;

  friend bool operator==(const Uuid& lhs, const Uuid& rhs) {
    return lhs.data_ == rhs.data_;
  }

  friend std::strong_ordering operator<=>(const Uuid& lhs, const Uuid& rhs) {
    return lhs.data_ <=> rhs.data_;
  }

  int64_t high_bits() const;
  int64_t low_bits() const;

 private:
  std::array<uint8_t, kLength> data_;
};

}  // namespace icecat

template <>
struct std::hash<icecat::Uuid> {
  size_t operator()(const icecat::Uuid& uuid) const noexcept {
    auto high = static_cast<uint64_t>(uuid.high_bits());
    auto low = static_cast<uint64_t>(uuid.low_bits());
    return std::hash<uint64_t>{}(high ^ (low * 0x9E3779B97F4A7C15ULL));
  }
};
