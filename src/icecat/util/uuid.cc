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

#include "icecat/util/uuid.h"

#include <chrono>
#include <cstdint>
#include <format>
#include <limits>
#include <mutex>
#include <random>
#include <string>

#include "icecat/util/macros.h"

namespace icecat {

namespace {

constexpr std::array<uint8_t, 256> BuildHexTable() {
  std::array<uint8_t, 256> buf{};
  for (int32_t i = 0; i < 256; i++) {
    if (i >= '0' && i <= '9') {
      buf[i] = static_cast<uint8_t>(i - '0');
    } else if (i >= 'a' && i <= 'f') {
      buf[i] = static_cast<uint8_t>(i - 'a' + 10);
    } else if (i >= 'A' && i <= 'F') {
      buf[i] = static_cast<uint8_t>(i - 'A' + 10);
    } else {
      buf[i] = 0xFF;
    }
  }
  return buf;
}

constexpr auto kHexTable = BuildHexTable();

inline uint8_t HexPair(uint8_t high, uint8_t low) {
  return static_cast<uint8_t>((high << 4) | low);
}

// Parse a UUID string without dashes, e.g. "67e5504410b1426f9247bb680e5fe0c8"
Result<Uuid> ParseSimple(std::string_view s) {
  ICECAT_DCHECK(s.size() == 32, "s must be 32 characters long");

  std::array<uint8_t, Uuid::kLength> uuid{};
  for (size_t i = 0; i < Uuid::kLength; i++) {
    uint8_t h1 = kHexTable[static_cast<uint8_t>(s[i * 2])];
    uint8_t h2 = kHexTable[static_cast<uint8_t>(s[i * 2 + 1])];
    if ((h1 | h2) == 0xFF) [[unlikely]] {
      return InvalidArgument("Invalid UUID string: {}", s);
    }
    uuid[i] = HexPair(h1, h2);
  }
  return Uuid(uuid);
}

// Parse a UUID string with dashes, e.g. "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
Result<Uuid> ParseHyphenated(std::string_view s) {
  ICECAT_DCHECK(s.size() == 36, "s must be 36 characters long");

  if (!(s[8] == '-' && s[13] == '-' && s[18] == '-' && s[23] == '-')) [[unlikely]] {
    return InvalidArgument("Invalid UUID string: {}", s);
  }

  // Each entry is the offset of a run of four hex digits.
  constexpr std::array<size_t, 8> positions = {0, 4, 9, 14, 19, 24, 28, 32};
  std::array<uint8_t, Uuid::kLength> uuid{};
  for (size_t j = 0; j < positions.size(); ++j) {
    const size_t pos = positions[j];
    uint8_t h1 = kHexTable[static_cast<uint8_t>(s[pos])];
    uint8_t h2 = kHexTable[static_cast<uint8_t>(s[pos + 1])];
    uint8_t h3 = kHexTable[static_cast<uint8_t>(s[pos + 2])];
    uint8_t h4 = kHexTable[static_cast<uint8_t>(s[pos + 3])];
    if ((h1 | h2 | h3 | h4) == 0xFF) [[unlikely]] {
      return InvalidArgument("Invalid UUID string: {}", s);
    }
    uuid[j * 2] = HexPair(h1, h2);
    uuid[j * 2 + 1] = HexPair(h3, h4);
  }
  return Uuid(uuid);
}

int64_t LoadBigEndian(std::span<const uint8_t> bytes) {
  uint64_t value = 0;
  for (uint8_t b : bytes) {
    value = (value << 8) | b;
  }
  return static_cast<int64_t>(value);
}

}  // namespace

Uuid::Uuid(std::array<uint8_t, kLength> data) : data_(std::move(data)) {}

Uuid Uuid::GenerateV7() {
  auto now = std::chrono::system_clock::now();
  auto unix_ts_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
          .count();
  return GenerateV7(static_cast<uint64_t>(unix_ts_ms));
}

Uuid Uuid::GenerateV7(uint64_t unix_ts_ms) {
  std::array<uint8_t, kLength> uuid = {};

  uuid[0] = (unix_ts_ms >> 40) & 0xFF;
  uuid[1] = (unix_ts_ms >> 32) & 0xFF;
  uuid[2] = (unix_ts_ms >> 24) & 0xFF;
  uuid[3] = (unix_ts_ms >> 16) & 0xFF;
  uuid[4] = (unix_ts_ms >> 8) & 0xFF;
  uuid[5] = unix_ts_ms & 0xFF;

  // Ids are generated from several connections at once in the same process.
  static std::mutex gen_mutex;
  static std::mt19937 gen(std::random_device{}());
  static std::uniform_int_distribution<uint16_t> distrib(
      std::numeric_limits<uint16_t>::min(), std::numeric_limits<uint16_t>::max());
  {
    std::lock_guard lock(gen_mutex);
    // uint8_t is invalid for uniform_int_distribution on Windows
    for (size_t i = 6; i < kLength; i += 2) {
      auto rand = static_cast<uint16_t>(distrib(gen));
      uuid[i] = (rand >> 8) & 0xFF;
      uuid[i + 1] = rand & 0xFF;
    }
  }

  // Set magic numbers for a "version 7" UUID and variant,
  // see https://www.rfc-editor.org/rfc/rfc9562#name-version-field
  uuid[6] = (uuid[6] & 0x0F) | 0x70;
  uuid[8] = (uuid[8] & 0x3F) | 0x80;

  return Uuid(uuid);
}

Result<Uuid> Uuid::FromString(std::string_view str) {
  if (str.size() == 32) {
    return ParseSimple(str);
  } else if (str.size() == 36) {
    return ParseHyphenated(str);
  } else {
    return InvalidArgument("Invalid UUID string: {}", str);
  }
}

std::string Uuid::ToString() const {
  return std::format(
      "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}"
      "{:02x}{:02x}{:02x}",
      data_[0], data_[1], data_[2], data_[3], data_[4], data_[5], data_[6], data_[7],
      data_[8], data_[9], data_[10], data_[11], data_[12], data_[13], data_[14],
      data_[15]);
}

int64_t Uuid::high_bits() const {
  return LoadBigEndian(std::span<const uint8_t>(data_).first<8>());
}

int64_t Uuid::low_bits() const {
  return LoadBigEndian(std::span<const uint8_t>(data_).last<8>());
}

}  // namespace icecat
