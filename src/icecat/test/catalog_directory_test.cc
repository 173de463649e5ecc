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

#include "icecat/store/catalog_directory.h"

#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "icecat/test/catalog_test_base.h"
#include "icecat/test/matchers.h"

namespace icecat {

class CatalogDirectoryTest : public CatalogTestBase {
 protected:
  CatalogDirectory& directory() { return store_->directory(); }
};

TEST_F(CatalogDirectoryTest, GetWarehouse) {
  ICECAT_UNWRAP_OR_FAIL(auto warehouse, directory().GetWarehouse(warehouse_id_));
  EXPECT_EQ(warehouse.warehouse_id, warehouse_id_);
  EXPECT_EQ(warehouse.project_id, project_id_);
  EXPECT_EQ(warehouse.name, "warehouse");
  EXPECT_EQ(warehouse.storage_profile.value().at("type"), "s3");
  EXPECT_EQ(warehouse.storage_secret_id, "warehouse-secret");
  EXPECT_EQ(warehouse.status, WarehouseStatus::kActive);
}

TEST_F(CatalogDirectoryTest, UnknownWarehouse) {
  EXPECT_THAT(directory().GetWarehouse(WarehouseId::Generate()),
              IsError(ErrorKind::kNotFound));
  EXPECT_THAT(directory().GetWarehouseStatus(WarehouseId::Generate()),
              IsError(ErrorKind::kNotFound));
  EXPECT_THAT(
      directory().SetWarehouseStatus(WarehouseId::Generate(), WarehouseStatus::kInactive),
      IsError(ErrorKind::kNotFound));
}

TEST_F(CatalogDirectoryTest, WarehouseStatusTransitions) {
  ASSERT_THAT(directory().SetWarehouseStatus(warehouse_id_, WarehouseStatus::kInactive),
              IsOk());
  EXPECT_THAT(directory().GetWarehouseStatus(warehouse_id_),
              HasValue(::testing::Eq(WarehouseStatus::kInactive)));

  ASSERT_THAT(directory().SetWarehouseStatus(warehouse_id_, WarehouseStatus::kActive),
              IsOk());
  EXPECT_THAT(directory().GetWarehouseStatus(warehouse_id_),
              HasValue(::testing::Eq(WarehouseStatus::kActive)));
}

TEST_F(CatalogDirectoryTest, DuplicateWarehouse) {
  WarehouseInfo duplicate_id{.warehouse_id = warehouse_id_,
                             .project_id = project_id_,
                             .name = "another",
                             .storage_profile = Document(),
                             .storage_secret_id = std::nullopt};
  EXPECT_THAT(directory().CreateWarehouse(duplicate_id), IsError(ErrorKind::kAlreadyExists));

  WarehouseInfo duplicate_name{.warehouse_id = WarehouseId::Generate(),
                               .project_id = project_id_,
                               .name = "warehouse",
                               .storage_profile = Document(),
                               .storage_secret_id = std::nullopt};
  EXPECT_THAT(directory().CreateWarehouse(duplicate_name),
              IsError(ErrorKind::kAlreadyExists));

  duplicate_name.project_id = ProjectId::Generate();
  EXPECT_THAT(directory().CreateWarehouse(duplicate_name), IsOk());
}

TEST_F(CatalogDirectoryTest, CreateInactiveWarehouse) {
  auto warehouse_id = WarehouseId::Generate();
  AddWarehouse(warehouse_id, "archive", WarehouseStatus::kInactive);
  EXPECT_THAT(directory().GetWarehouseStatus(warehouse_id),
              HasValue(::testing::Eq(WarehouseStatus::kInactive)));
}

TEST_F(CatalogDirectoryTest, NamespaceRequiresWarehouse) {
  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), WarehouseId::Generate(),
                                          {"orphan"}),
              IsError(ErrorKind::kConstraintViolation));
}

TEST_F(CatalogDirectoryTest, NamespaceNames) {
  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_, {}),
              IsError(ErrorKind::kInvalidArgument));
  EXPECT_THAT(
      directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_, {"sales", ""}),
      IsError(ErrorKind::kInvalidArgument));
  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_, {"ns"}),
              IsError(ErrorKind::kAlreadyExists));
  EXPECT_THAT(
      directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_, {"ns", "child"}),
      IsOk());
}

TEST(NamespaceParentTest, DropsLastLevel) {
  EXPECT_EQ(NamespaceParent({"sales"}), std::nullopt);
  EXPECT_EQ(NamespaceParent({"sales", "eu"}), std::vector<std::string>{"sales"});
  EXPECT_EQ(NamespaceParent({"sales", "eu", "daily"}),
            (std::vector<std::string>{"sales", "eu"}));
}

TEST_F(CatalogDirectoryTest, NestedNamespaceRequiresParent) {
  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_,
                                          {"sales", "eu"}),
              IsError(ErrorKind::kConstraintViolation));

  ASSERT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_, {"sales"}),
              IsOk());
  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_,
                                          {"sales", "eu"}),
              IsOk());
  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_,
                                          {"sales", "eu", "daily"}),
              IsOk());
  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_,
                                          {"sales", "us", "daily"}),
              HasErrorMessage("Parent namespace [\"sales\",\"us\"]"));
}

TEST_F(CatalogDirectoryTest, ParentMustBeInSameWarehouse) {
  auto other_warehouse = WarehouseId::Generate();
  AddWarehouse(other_warehouse, "other");
  ASSERT_THAT(
      directory().CreateNamespace(NamespaceId::Generate(), other_warehouse, {"sales"}),
      IsOk());

  EXPECT_THAT(directory().CreateNamespace(NamespaceId::Generate(), warehouse_id_,
                                          {"sales", "eu"}),
              IsError(ErrorKind::kConstraintViolation));
}

TEST_F(CatalogDirectoryTest, TableRequiresNamespace) {
  TableCreation table{.table_id = TableId::Generate(),
                      .namespace_id = NamespaceId::Generate(),
                      .name = "orders",
                      .metadata = Document(nlohmann::json::object()),
                      .metadata_location = std::nullopt};
  EXPECT_THAT(directory().CreateTable(table), IsError(ErrorKind::kConstraintViolation));
}

TEST_F(CatalogDirectoryTest, TableNamesAreUniqueAmongLiveTables) {
  auto first = TableId::Generate();
  AddTable(first, "orders");

  TableCreation same_name{.table_id = TableId::Generate(),
                          .namespace_id = namespace_id_,
                          .name = "orders",
                          .metadata = Document(nlohmann::json::object()),
                          .metadata_location = std::nullopt};
  EXPECT_THAT(directory().CreateTable(same_name), IsError(ErrorKind::kAlreadyExists));

  ASSERT_THAT(directory().MarkTableDeleted(first, CurrentTimePointMs()), IsOk());
  ASSERT_THAT(directory().CreateTable(same_name), IsOk());

  EXPECT_THAT(directory().RestoreTable(first), IsError(ErrorKind::kAlreadyExists));
}

TEST_F(CatalogDirectoryTest, EmptyTableName) {
  TableCreation table{.table_id = TableId::Generate(),
                      .namespace_id = namespace_id_,
                      .name = "",
                      .metadata = Document(),
                      .metadata_location = std::nullopt};
  EXPECT_THAT(directory().CreateTable(table), IsError(ErrorKind::kInvalidArgument));
}

TEST_F(CatalogDirectoryTest, UnknownTable) {
  auto table_id = TableId::Generate();
  EXPECT_THAT(directory().UpdateTableMetadata(table_id, Document(), std::nullopt),
              IsError(ErrorKind::kNotFound));
  EXPECT_THAT(directory().MarkTableDeleted(table_id, CurrentTimePointMs()),
              IsError(ErrorKind::kNotFound));
  EXPECT_THAT(directory().RestoreTable(table_id), IsError(ErrorKind::kNotFound));
}

}  // namespace icecat
