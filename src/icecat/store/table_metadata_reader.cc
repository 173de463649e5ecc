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

#include "icecat/store/table_metadata_reader.h"

#include <nlohmann/json.hpp>

#include "icecat/json_internal.h"
#include "icecat/sqlite/transaction.h"
#include "icecat/store/warehouse_scope_guard.h"
#include "icecat/util/logging.h"
#include "icecat/util/macros.h"

namespace icecat {

namespace {

// ?2 is a JSON array of table ids; ?3 is 1 to include soft-deleted tables.
constexpr std::string_view kReadTablesSql = R"SQL(
SELECT t.table_id, ti.namespace_id, t.metadata, ti.metadata_location,
       w.storage_profile, w.storage_secret_id, ti.deleted_at
FROM "table" t
INNER JOIN tabular ti ON ti.tabular_id = t.table_id
INNER JOIN namespace n ON n.namespace_id = ti.namespace_id
INNER JOIN warehouse w ON w.warehouse_id = n.warehouse_id
WHERE w.warehouse_id = ?1
  AND t.table_id IN (SELECT value FROM json_each(?2))
  AND (?3 OR ti.deleted_at IS NULL)
ORDER BY t.table_id
)SQL";

Result<TableRecord> RecordFromRow(const sqlite::Statement& stmt) {
  ICECAT_ASSIGN_OR_RAISE(auto table_id, TableId::FromString(stmt.ColumnText(0)));
  ICECAT_ASSIGN_OR_RAISE(auto namespace_id, NamespaceId::FromString(stmt.ColumnText(1)));
  ICECAT_ASSIGN_OR_RAISE(auto metadata, Document::Parse(stmt.ColumnText(2)));
  ICECAT_ASSIGN_OR_RAISE(auto storage_profile, Document::Parse(stmt.ColumnText(4)));

  std::optional<TimePointMs> deleted_at;
  if (auto deleted_at_ms = stmt.ColumnOptionalInt64(6); deleted_at_ms.has_value()) {
    deleted_at = TimePointMsFromUnixMs(*deleted_at_ms);
  }

  return TableRecord{.table_id = table_id,
                     .namespace_id = namespace_id,
                     .metadata = std::move(metadata),
                     .metadata_location = stmt.ColumnOptionalText(3),
                     .storage_profile = std::move(storage_profile),
                     .storage_secret_id = stmt.ColumnOptionalText(5),
                     .deleted_at = deleted_at};
}

}  // namespace

Result<std::vector<TableRecord>> TableMetadataReader::ReadTables(
    const WarehouseId& warehouse_id, const std::unordered_set<TableId>& table_ids,
    bool include_deleted) {
  if (table_ids.empty()) {
    return std::vector<TableRecord>{};
  }

  nlohmann::json ids = nlohmann::json::array();
  for (const auto& table_id : table_ids) {
    ids.push_back(table_id.ToString());
  }
  ICECAT_ASSIGN_OR_RAISE(auto ids_json, ToJsonString(ids));

  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kDeferred));
  ICECAT_RETURN_UNEXPECTED(WarehouseScopeGuard(db_).RequireActiveWarehouse(warehouse_id));

  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kReadTablesSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, warehouse_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(2, ids_json));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(3, static_cast<int64_t>(include_deleted ? 1 : 0)));
  std::vector<TableRecord> records;
  while (true) {
    ICECAT_ASSIGN_OR_RAISE(auto has_row, stmt.Step());
    if (!has_row) {
      break;
    }
    ICECAT_ASSIGN_OR_RAISE(auto record, RecordFromRow(stmt));
    records.push_back(std::move(record));
  }
  ICECAT_RETURN_UNEXPECTED(txn.Commit());

  Logger()->debug("Read {} of {} requested table(s) in warehouse {}", records.size(),
                  table_ids.size(), warehouse_id.ToString());
  return records;
}

}  // namespace icecat
