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

#include "icecat/store/reference_store.h"

#include <string>

#include <nlohmann/json.hpp>

#include "icecat/json_internal.h"
#include "icecat/sqlite/transaction.h"
#include "icecat/store/warehouse_scope_guard.h"
#include "icecat/util/formatter.h"  // IWYU pragma: keep
#include "icecat/util/logging.h"
#include "icecat/util/macros.h"

namespace icecat {

namespace {

// ?2 is a JSON array of reference names.
constexpr std::string_view kDeleteReferencesSql = R"SQL(
DELETE FROM table_refs
WHERE table_id = ?1
  AND table_ref_name IN (SELECT value FROM json_each(?2))
)SQL";

// ?2 is a JSON array of {"name", "snapshot_id", "retention"} rows. Rows are
// applied in array order, so a repeated name keeps its last entry. The WHERE
// clause is required by the upsert grammar.
constexpr std::string_view kUpsertReferencesSql = R"SQL(
INSERT INTO table_refs (table_id, table_ref_name, snapshot_id, retention)
SELECT ?1, batch.value ->> '$.name', batch.value ->> '$.snapshot_id',
       batch.value -> '$.retention'
FROM json_each(?2) AS batch
WHERE true
ORDER BY batch.key
ON CONFLICT (table_id, table_ref_name) DO UPDATE
SET snapshot_id = excluded.snapshot_id, retention = excluded.retention
)SQL";

constexpr std::string_view kLoadReferencesSql = R"SQL(
SELECT table_ref_name, snapshot_id, retention
FROM table_refs
WHERE table_id = ?1
ORDER BY table_ref_name
)SQL";

// A batch that cannot be serialized, e.g. a name that is not valid UTF-8, is
// rejected as a malformed request.
Result<std::string> SerializeBatch(const nlohmann::json& json, const TableId& table_id) {
  auto serialized = ToJsonString(json);
  if (!serialized) {
    return InvalidArgument("Invalid reference batch for table {}: {}", table_id,
                           serialized.error().message);
  }
  return serialized;
}

}  // namespace

Status ReferenceStore::ReplaceReferences(const TableId& table_id,
                                         std::span<const TableReference> references) {
  if (references.empty()) {
    return {};
  }

  nlohmann::json names = nlohmann::json::array();
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& reference : references) {
    if (reference.name.empty()) {
      return InvalidArgument("Reference name of table {} must not be empty", table_id);
    }
    names.push_back(reference.name);
    rows.push_back(ToJson(reference));
  }
  ICECAT_ASSIGN_OR_RAISE(auto names_json, SerializeBatch(names, table_id));
  ICECAT_ASSIGN_OR_RAISE(auto rows_json, SerializeBatch(rows, table_id));
  auto table = table_id.ToString();

  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  ICECAT_RETURN_UNEXPECTED(
      WarehouseScopeGuard(db_).RequireActiveWarehouseForTable(table_id));

  ICECAT_ASSIGN_OR_RAISE(auto delete_stmt, db_.Prepare(kDeleteReferencesSql));
  ICECAT_RETURN_UNEXPECTED(delete_stmt.Bind(1, table));
  ICECAT_RETURN_UNEXPECTED(delete_stmt.Bind(2, names_json));
  ICECAT_RETURN_UNEXPECTED(delete_stmt.Execute());
  auto deleted = db_.changes();

  ICECAT_ASSIGN_OR_RAISE(auto upsert_stmt, db_.Prepare(kUpsertReferencesSql));
  ICECAT_RETURN_UNEXPECTED(upsert_stmt.Bind(1, table));
  ICECAT_RETURN_UNEXPECTED(upsert_stmt.Bind(2, rows_json));
  ICECAT_RETURN_UNEXPECTED(upsert_stmt.Execute());

  ICECAT_RETURN_UNEXPECTED(txn.Commit());
  Logger()->debug("Replaced {} reference(s) of table {} ({} previously present)",
                  references.size(), table, deleted);
  return {};
}

Result<std::vector<TableReference>> ReferenceStore::LoadReferences(
    const TableId& table_id) {
  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kDeferred));
  ICECAT_ASSIGN_OR_RAISE(auto scope, WarehouseScopeGuard(db_).ResolveTableScope(table_id));
  if (!scope.has_value()) {
    return NotFound("Table {} not found", table_id);
  }
  ICECAT_RETURN_UNEXPECTED(
      WarehouseScopeGuard::CheckActive(scope->warehouse_id, scope->status));

  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kLoadReferencesSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, table_id.ToString()));
  std::vector<TableReference> references;
  while (true) {
    ICECAT_ASSIGN_OR_RAISE(auto has_row, stmt.Step());
    if (!has_row) {
      break;
    }
    ICECAT_ASSIGN_OR_RAISE(auto retention, Document::Parse(stmt.ColumnText(2)));
    references.push_back(TableReference{.name = stmt.ColumnText(0),
                                        .snapshot_id = stmt.ColumnInt64(1),
                                        .retention = std::move(retention)});
  }
  ICECAT_RETURN_UNEXPECTED(txn.Commit());
  return references;
}

}  // namespace icecat
