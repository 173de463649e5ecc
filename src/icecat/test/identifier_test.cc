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

#include "icecat/identifier.h"

#include <format>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "icecat/test/matchers.h"
#include "icecat/util/formatter.h"
#include "icecat/util/timepoint.h"
#include "icecat/util/uuid.h"

namespace icecat {

TEST(UUIDUtilTest, GenerateV7) {
  auto uuid = Uuid::GenerateV7();
  EXPECT_EQ(uuid.bytes().size(), Uuid::kLength);
  // Version 7 UUIDs have the version number (7) in the 7th byte
  EXPECT_EQ((uuid.bytes()[6] >> 4) & 0x0F, 7);
  // Variant is in the 9th byte, the two most significant bits should be 10
  EXPECT_EQ((uuid.bytes()[8] >> 6) & 0x03, 0b10);
}

TEST(UUIDUtilTest, GenerateV7SortsByTimestamp) {
  auto earlier = Uuid::GenerateV7(1'700'000'000'000);
  auto later = Uuid::GenerateV7(1'700'000'000'001);
  EXPECT_LT(earlier, later);
  EXPECT_EQ(earlier.ToString().substr(0, 13), "018bcfe5-6800");
}

TEST(UUIDUtilTest, FromString) {
  std::vector<std::pair<std::string, std::string>> uuid_string_pairs = {
      {"123e4567-e89b-12d3-a456-426614174000", "123e4567-e89b-12d3-a456-426614174000"},
      {"123e4567e89b12d3a456426614174000", "123e4567-e89b-12d3-a456-426614174000"},
      {"550E8400E29B41D4A716446655440000", "550e8400-e29b-41d4-a716-446655440000"},
      {"F47AC10B-58CC-4372-A567-0E02B2C3D479", "f47ac10b-58cc-4372-a567-0e02b2c3d479"},
  };

  for (const auto& [input_str, expected_str] : uuid_string_pairs) {
    auto result = Uuid::FromString(input_str);
    ASSERT_THAT(result, IsOk());
    EXPECT_EQ(result->ToString(), expected_str);
  }
}

TEST(UUIDUtilTest, FromStringInvalid) {
  std::vector<std::string> invalid_uuid_strings = {
      "123e4567-e89b-12d3-a456-42661417400",    // too short
      "123e4567-e89b-12d3-a456-4266141740000",  // too long
      "g23e4567-e89b-12d3-a456-426614174000",   // invalid character
      "123e4567e89b12d3a45642661417400",        // too short without dashes
      "550e8400-e29b-41d4-a716-44665544000Z",   // invalid character at end
      "------------------------------------",   // dashes only
      "00000000-0000-0000-0000-00-000000000",   // dash inside the last group
      "0000000-00000-0000-0000-000000000000",   // dash out of place
      "",
  };

  for (const auto& uuid_str : invalid_uuid_strings) {
    auto result = Uuid::FromString(uuid_str);
    EXPECT_THAT(result, IsError(ErrorKind::kInvalidArgument));
    EXPECT_THAT(result, HasErrorMessage("Invalid UUID string"));
  }
}

TEST(IdentifierTest, FromString) {
  auto result = WarehouseId::FromString("018bcfe5-6800-7000-8000-000000000001");
  ASSERT_THAT(result, IsOk());
  EXPECT_EQ(result->ToString(), "018bcfe5-6800-7000-8000-000000000001");
  EXPECT_EQ(std::format("{}", *result), "018bcfe5-6800-7000-8000-000000000001");
}

TEST(IdentifierTest, FromStringNamesEntity) {
  auto warehouse = WarehouseId::FromString("not-a-uuid");
  EXPECT_THAT(warehouse, IsError(ErrorKind::kInvalidArgument));
  EXPECT_THAT(warehouse,
              HasErrorMessage("Provided warehouse id is not a valid UUID: 'not-a-uuid'"));

  EXPECT_THAT(TableId::FromString("42"),
              HasErrorMessage("Provided table id is not a valid UUID"));
  EXPECT_THAT(WarehouseId::FromString(std::string(36, '-')),
              IsError(ErrorKind::kInvalidArgument));
}

TEST(IdentifierTest, GeneratedIdsAreDistinct) {
  std::unordered_set<TableId> ids;
  for (int i = 0; i < 100; ++i) {
    ids.insert(TableId::Generate());
  }
  EXPECT_EQ(ids.size(), 100);
}

TEST(IdentifierTest, EqualityAndHash) {
  auto id = TableId::Generate();
  ASSERT_THAT(TableId::FromString(id.ToString()), HasValue(::testing::Eq(id)));

  std::unordered_set<TableId> ids = {id, TableId(id.uuid())};
  EXPECT_EQ(ids.size(), 1);
  EXPECT_NE(id, TableId::Generate());
}

TEST(IdentifierTest, FormatsAsValue) {
  static_assert(std::is_trivially_copyable_v<Uuid>);
  static_assert(std::is_trivially_copyable_v<TableId>);
  static_assert(sizeof(TableId) == Uuid::kLength);

  ICECAT_UNWRAP_OR_FAIL(auto uuid, Uuid::FromString("018bcfe5680070008000000000000001"));
  EXPECT_EQ(std::format("{}", uuid), "018bcfe5-6800-7000-8000-000000000001");
  EXPECT_EQ(std::format("[{:>40}]", TableId(uuid)),
            "[    018bcfe5-6800-7000-8000-000000000001]");
}

TEST(WarehouseStatusTest, Names) {
  EXPECT_EQ(ToString(WarehouseStatus::kActive), "active");
  EXPECT_EQ(ToString(WarehouseStatus::kInactive), "inactive");
  EXPECT_THAT(WarehouseStatusFromString("active"),
              HasValue(::testing::Eq(WarehouseStatus::kActive)));
  EXPECT_THAT(WarehouseStatusFromString("inactive"),
              HasValue(::testing::Eq(WarehouseStatus::kInactive)));
  EXPECT_THAT(WarehouseStatusFromString("Active"), IsError(ErrorKind::kInvalidArgument));
  EXPECT_EQ(std::format("{}", WarehouseStatus::kInactive), "inactive");
}

TEST(TimePointTest, UnixMillisRoundTrip) {
  auto time_point = TimePointMsFromUnixMs(1'700'000'000'123);
  EXPECT_EQ(UnixMsFromTimePointMs(time_point), 1'700'000'000'123);
  EXPECT_GT(CurrentTimePointMs(), time_point);
}

}  // namespace icecat
