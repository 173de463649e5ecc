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

#include "icecat/batch_coordinator.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "icecat/json_internal.h"
#include "icecat/test/catalog_test_base.h"
#include "icecat/test/matchers.h"
#include "icecat/test/mock_catalog_store.h"

namespace icecat {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::UnorderedElementsAre;

class BatchCoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<MockCatalogStore>();
    coordinator_ = std::make_unique<BatchCoordinator>(store_);
  }

  static TableRecord Record(const TableId& table_id) {
    return TableRecord{.table_id = table_id,
                       .namespace_id = NamespaceId::Generate(),
                       .metadata = Document(),
                       .metadata_location = std::nullopt,
                       .storage_profile = Document(),
                       .storage_secret_id = std::nullopt,
                       .deleted_at = std::nullopt};
  }

  // Captures the batch handed to the store.
  auto CaptureReferences(std::vector<TableReference>* captured) {
    return Invoke([captured](const TableId&, std::span<const TableReference> references) {
      captured->assign(references.begin(), references.end());
      return Status{};
    });
  }

  TableId table_id_ = TableId::Generate();
  WarehouseId warehouse_id_ = WarehouseId::Generate();
  std::shared_ptr<MockCatalogStore> store_;
  std::unique_ptr<BatchCoordinator> coordinator_;
};

TEST_F(BatchCoordinatorTest, ZipsParallelSequences) {
  std::vector<TableReference> captured;
  EXPECT_CALL(*store_, ReplaceReferences(Eq(table_id_), _))
      .WillOnce(CaptureReferences(&captured));

  Document retention(nlohmann::json{{"type", "branch"}});
  ReferenceUpdateRequest request{.table_id = table_id_,
                                 .names = {"main", "v1"},
                                 .snapshot_ids = {102, 100},
                                 .retentions = {retention, Document()}};
  EXPECT_THAT(coordinator_->CommitReferences(request), IsOk());

  EXPECT_THAT(captured,
              ElementsAre(TableReference{.name = "main", .snapshot_id = 102, .retention = retention},
                          TableReference{.name = "v1", .snapshot_id = 100, .retention = Document()}));
}

TEST_F(BatchCoordinatorTest, MismatchedSequencesFailBeforeStorage) {
  EXPECT_CALL(*store_, ReplaceReferences(_, _)).Times(0);

  ReferenceUpdateRequest request{.table_id = table_id_,
                                 .names = {"main", "v1"},
                                 .snapshot_ids = {102},
                                 .retentions = {Document(), Document()}};
  auto status = coordinator_->CommitReferences(request);
  EXPECT_THAT(status, IsError(ErrorKind::kInvalidArgument));
  EXPECT_THAT(status, HasErrorMessage("2 names, 1 snapshot ids and 2 retentions"));

  request.snapshot_ids = {102, 100};
  request.retentions.pop_back();
  EXPECT_THAT(coordinator_->CommitReferences(request), IsError(ErrorKind::kInvalidArgument));
}

TEST_F(BatchCoordinatorTest, PropagatesStoreErrors) {
  EXPECT_CALL(*store_, ReplaceReferences(_, _))
      .WillOnce(Return(StorageUnavailable("database is locked")));

  ReferenceUpdateRequest request{.table_id = table_id_,
                                 .names = {"main"},
                                 .snapshot_ids = {1},
                                 .retentions = {Document()}};
  auto status = coordinator_->CommitReferences(request);
  EXPECT_THAT(status, IsError(ErrorKind::kStorageUnavailable));
  EXPECT_TRUE(IsRetryable(status.error()));
}

TEST_F(BatchCoordinatorTest, CommitsTypedReferencesInNameOrder) {
  std::vector<TableReference> captured;
  EXPECT_CALL(*store_, ReplaceReferences(Eq(table_id_), _))
      .WillOnce(CaptureReferences(&captured));

  std::map<std::string, SnapshotRef> references = {
      {"main",
       SnapshotRef{.snapshot_id = 102,
                   .retention = SnapshotRef::Branch{.min_snapshots_to_keep = 5}}},
      {"audit", SnapshotRef{.snapshot_id = 99,
                            .retention = SnapshotRef::Tag{.max_ref_age_ms = 86'400'000}}},
  };
  EXPECT_THAT(coordinator_->CommitReferences(table_id_, references), IsOk());

  ASSERT_EQ(captured.size(), 2);
  EXPECT_EQ(captured[0].name, "audit");
  EXPECT_EQ(captured[0].snapshot_id, 99);
  EXPECT_EQ(captured[0].retention,
            Document(nlohmann::json{{"type", "tag"}, {"max-ref-age-ms", 86'400'000}}));
  EXPECT_EQ(captured[1].name, "main");
  EXPECT_EQ(captured[1].retention, RetentionDocument(references.at("main")));
}

TEST_F(BatchCoordinatorTest, LoadTablesDeduplicatesIds) {
  auto first = TableId::Generate();
  auto second = TableId::Generate();
  EXPECT_CALL(*store_, ReadTables(Eq(warehouse_id_), UnorderedElementsAre(first, second),
                                  /*include_deleted=*/true))
      .WillOnce(Return(std::vector<TableRecord>{Record(first)}));

  LoadTablesRequest request{.warehouse_id = warehouse_id_,
                            .table_ids = {first, second, first},
                            .include_deleted = true};
  ICECAT_UNWRAP_OR_FAIL(auto records, coordinator_->LoadTables(request));
  ASSERT_EQ(records.size(), 1);
  EXPECT_EQ(records[0].table_id, first);

  EXPECT_THAT(BatchCoordinator::MissingTables(request.table_ids, records),
              ElementsAre(second));
}

TEST_F(BatchCoordinatorTest, LoadTablesPropagatesScopeErrors) {
  EXPECT_CALL(*store_, ReadTables(_, _, _))
      .WillOnce(Return(WarehouseNotActive("Warehouse is not active")));

  LoadTablesRequest request{.warehouse_id = warehouse_id_, .table_ids = {table_id_}};
  EXPECT_THAT(coordinator_->LoadTables(request), IsError(ErrorKind::kWarehouseNotActive));
}

TEST(BatchCoordinatorStaticTest, RequireAllTables) {
  auto found = TableId::Generate();
  auto missing = TableId::Generate();
  std::vector<TableRecord> records = {TableRecord{.table_id = found,
                                                  .namespace_id = NamespaceId::Generate(),
                                                  .metadata = Document(),
                                                  .metadata_location = std::nullopt,
                                                  .storage_profile = Document(),
                                                  .storage_secret_id = std::nullopt,
                                                  .deleted_at = std::nullopt}};

  std::vector<TableId> all_found = {found, found};
  EXPECT_THAT(BatchCoordinator::RequireAllTables(all_found, records), IsOk());

  std::vector<TableId> requested = {missing, found, missing};
  EXPECT_THAT(BatchCoordinator::MissingTables(requested, records), ElementsAre(missing));
  auto status = BatchCoordinator::RequireAllTables(requested, records);
  EXPECT_THAT(status, IsError(ErrorKind::kNotFound));
  EXPECT_THAT(status, HasErrorMessage(missing.ToString()));
}

// Runs the coordinator against the SQLite store.
class BatchCoordinatorStoreTest : public CatalogTestBase {
 protected:
  void SetUp() override {
    CatalogTestBase::SetUp();
    AddTable(table_id_, "orders");
    coordinator_ = std::make_unique<BatchCoordinator>(store_);
  }

  TableId table_id_ = TableId::Generate();
  std::unique_ptr<BatchCoordinator> coordinator_;
};

TEST_F(BatchCoordinatorStoreTest, CommitThenLoad) {
  std::map<std::string, SnapshotRef> references = {
      {"main", SnapshotRef{.snapshot_id = 101, .retention = SnapshotRef::Branch{}}}};
  ASSERT_THAT(coordinator_->CommitReferences(table_id_, references), IsOk());

  references["main"].snapshot_id = 102;
  ASSERT_THAT(coordinator_->CommitReferences(table_id_, references), IsOk());

  ICECAT_UNWRAP_OR_FAIL(auto stored, store_->LoadReferences(table_id_));
  ASSERT_EQ(stored.size(), 1);
  EXPECT_THAT(SnapshotRefFromRetention(stored[0].snapshot_id, stored[0].retention),
              HasValue(Eq(references.at("main"))));

  LoadTablesRequest request{.warehouse_id = warehouse_id_,
                            .table_ids = {table_id_, table_id_}};
  ICECAT_UNWRAP_OR_FAIL(auto records, coordinator_->LoadTables(request));
  EXPECT_THAT(BatchCoordinator::RequireAllTables(request.table_ids, records), IsOk());
}

TEST_F(BatchCoordinatorStoreTest, MismatchedSequencesLeaveReferencesUntouched) {
  ReferenceUpdateRequest seed{.table_id = table_id_,
                              .names = {"main"},
                              .snapshot_ids = {1},
                              .retentions = {BranchRetention(1)}};
  ASSERT_THAT(coordinator_->CommitReferences(seed), IsOk());

  ReferenceUpdateRequest request{.table_id = table_id_,
                                 .names = {"main", "dev"},
                                 .snapshot_ids = {2},
                                 .retentions = {BranchRetention(1)}};
  EXPECT_THAT(coordinator_->CommitReferences(request), IsError(ErrorKind::kInvalidArgument));

  ICECAT_UNWRAP_OR_FAIL(auto stored, store_->LoadReferences(table_id_));
  ASSERT_EQ(stored.size(), 1);
  EXPECT_EQ(stored[0].snapshot_id, 1);
}

}  // namespace icecat
