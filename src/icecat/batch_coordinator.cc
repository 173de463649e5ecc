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

#include <string>
#include <unordered_set>
#include <utility>

#include "icecat/json_internal.h"
#include "icecat/util/formatter.h"  // IWYU pragma: keep
#include "icecat/util/logging.h"

namespace icecat {

BatchCoordinator::BatchCoordinator(std::shared_ptr<CatalogStore> store)
    : store_(std::move(store)) {}

Status BatchCoordinator::CommitReferences(const ReferenceUpdateRequest& request) {
  if (request.names.size() != request.snapshot_ids.size() ||
      request.names.size() != request.retentions.size()) {
    return InvalidArgument(
        "Reference update of table {} has {} names, {} snapshot ids and {} retentions",
        request.table_id, request.names.size(), request.snapshot_ids.size(),
        request.retentions.size());
  }

  std::vector<TableReference> references;
  references.reserve(request.names.size());
  for (size_t i = 0; i < request.names.size(); ++i) {
    references.push_back(TableReference{.name = request.names[i],
                                        .snapshot_id = request.snapshot_ids[i],
                                        .retention = request.retentions[i]});
  }
  return store_->ReplaceReferences(request.table_id, references);
}

Status BatchCoordinator::CommitReferences(
    const TableId& table_id, const std::map<std::string, SnapshotRef>& references) {
  std::vector<TableReference> entries;
  entries.reserve(references.size());
  for (const auto& [name, ref] : references) {
    entries.push_back(TableReference{.name = name,
                                     .snapshot_id = ref.snapshot_id,
                                     .retention = RetentionDocument(ref)});
  }
  return store_->ReplaceReferences(table_id, entries);
}

Result<std::vector<TableRecord>> BatchCoordinator::LoadTables(
    const LoadTablesRequest& request) {
  std::unordered_set<TableId> table_ids(request.table_ids.begin(), request.table_ids.end());
  if (table_ids.size() != request.table_ids.size()) {
    Logger()->debug("Dropped {} duplicate table id(s) from a read of warehouse {}",
                    request.table_ids.size() - table_ids.size(),
                    request.warehouse_id.ToString());
  }
  return store_->ReadTables(request.warehouse_id, table_ids, request.include_deleted);
}

std::vector<TableId> BatchCoordinator::MissingTables(std::span<const TableId> requested,
                                                     std::span<const TableRecord> records) {
  std::unordered_set<TableId> found;
  for (const auto& record : records) {
    found.insert(record.table_id);
  }
  std::vector<TableId> missing;
  std::unordered_set<TableId> reported;
  for (const auto& table_id : requested) {
    if (!found.contains(table_id) && reported.insert(table_id).second) {
      missing.push_back(table_id);
    }
  }
  return missing;
}

Status BatchCoordinator::RequireAllTables(std::span<const TableId> requested,
                                          std::span<const TableRecord> records) {
  auto missing = MissingTables(requested, records);
  if (missing.empty()) {
    return {};
  }
  std::string ids;
  for (const auto& table_id : missing) {
    if (!ids.empty()) {
      ids += ", ";
    }
    ids += table_id.ToString();
  }
  return NotFound("{} table(s) not found: {}", missing.size(), ids);
}

}  // namespace icecat
