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

/// \file icecat/batch_coordinator.h
/// Turns caller-shaped batches into single CatalogStore calls.

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "icecat/catalog_store.h"
#include "icecat/document.h"
#include "icecat/icecat_export.h"
#include "icecat/identifier.h"
#include "icecat/result.h"
#include "icecat/snapshot.h"
#include "icecat/table_reference.h"

namespace icecat {

/// \brief Reference updates of one table as parallel sequences: entry i is
/// (names[i], snapshot_ids[i], retentions[i]).
struct ICECAT_EXPORT ReferenceUpdateRequest {
  TableId table_id;
  std::vector<std::string> names;
  std::vector<int64_t> snapshot_ids;
  std::vector<Document> retentions;
};

/// \brief A batch read of tables in one warehouse.
struct ICECAT_EXPORT LoadTablesRequest {
  WarehouseId warehouse_id;
  /// May contain duplicates.
  std::vector<TableId> table_ids;
  bool include_deleted = false;
};

/// \brief Dispatches batched reference writes and table reads to a CatalogStore.
class ICECAT_EXPORT BatchCoordinator {
 public:
  explicit BatchCoordinator(std::shared_ptr<CatalogStore> store);

  /// \brief Replace the references named in `request` in one atomic write.
  ///
  /// \return ErrorKind::kInvalidArgument, before any storage access, if the
  /// three sequences differ in length; otherwise the result of
  /// CatalogStore::ReplaceReferences
  Status CommitReferences(const ReferenceUpdateRequest& request);

  /// \brief Replace typed references in one atomic write.
  ///
  /// Entries are written in name order with the retention document of each
  /// reference.
  Status CommitReferences(const TableId& table_id,
                          const std::map<std::string, SnapshotRef>& references);

  /// \brief Read the requested tables, each distinct id once.
  Result<std::vector<TableRecord>> LoadTables(const LoadTablesRequest& request);

  /// \brief The requested ids that have no record, in request order without
  /// duplicates.
  static std::vector<TableId> MissingTables(std::span<const TableId> requested,
                                            std::span<const TableRecord> records);

  /// \brief Fail with ErrorKind::kNotFound naming the missing tables, if any.
  static Status RequireAllTables(std::span<const TableId> requested,
                                 std::span<const TableRecord> records);

 private:
  std::shared_ptr<CatalogStore> store_;
};

}  // namespace icecat
