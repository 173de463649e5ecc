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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "icecat/catalog_store.h"

namespace icecat {

class MockCatalogStore : public CatalogStore {
 public:
  MockCatalogStore() = default;
  ~MockCatalogStore() override = default;

  MOCK_METHOD(Status, ReplaceReferences,
              (const TableId&, std::span<const TableReference>), (override));

  MOCK_METHOD((Result<std::vector<TableReference>>), LoadReferences, (const TableId&),
              (override));

  MOCK_METHOD((Result<std::vector<TableRecord>>), ReadTables,
              (const WarehouseId&, (const std::unordered_set<TableId>&), bool),
              (override));
};

}  // namespace icecat
