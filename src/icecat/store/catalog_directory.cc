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

#include <nlohmann/json.hpp>

#include "icecat/json_internal.h"
#include "icecat/sqlite/transaction.h"
#include "icecat/util/formatter.h"  // IWYU pragma: keep
#include "icecat/util/logging.h"
#include "icecat/util/macros.h"

namespace icecat {

namespace {

constexpr std::string_view kInsertWarehouseSql = R"SQL(
INSERT INTO warehouse
    (warehouse_id, project_id, warehouse_name, storage_profile, storage_secret_id, status)
VALUES (?1, ?2, ?3, ?4, ?5, ?6)
)SQL";

constexpr std::string_view kSelectWarehouseSql = R"SQL(
SELECT project_id, warehouse_name, storage_profile, storage_secret_id, status
FROM warehouse
WHERE warehouse_id = ?1
)SQL";

constexpr std::string_view kUpdateWarehouseStatusSql =
    "UPDATE warehouse SET status = ?2 WHERE warehouse_id = ?1";

constexpr std::string_view kInsertNamespaceSql = R"SQL(
INSERT INTO namespace (namespace_id, warehouse_id, namespace_name)
VALUES (?1, ?2, ?3)
)SQL";

constexpr std::string_view kNamespaceExistsSql = R"SQL(
SELECT 1 FROM namespace WHERE warehouse_id = ?1 AND namespace_name = ?2
)SQL";

constexpr std::string_view kInsertTabularSql = R"SQL(
INSERT INTO tabular (tabular_id, namespace_id, name, metadata_location)
VALUES (?1, ?2, ?3, ?4)
)SQL";

constexpr std::string_view kInsertTableSql =
    R"SQL(INSERT INTO "table" (table_id, metadata) VALUES (?1, ?2))SQL";

constexpr std::string_view kUpdateTableMetadataSql =
    R"SQL(UPDATE "table" SET metadata = ?2 WHERE table_id = ?1)SQL";

constexpr std::string_view kUpdateMetadataLocationSql =
    "UPDATE tabular SET metadata_location = ?2 WHERE tabular_id = ?1";

constexpr std::string_view kUpdateDeletedAtSql =
    "UPDATE tabular SET deleted_at = ?2 WHERE tabular_id = ?1";

}  // namespace

std::optional<std::vector<std::string>> NamespaceParent(
    const std::vector<std::string>& levels) {
  if (levels.size() <= 1) {
    return std::nullopt;
  }
  return std::vector<std::string>(levels.begin(), levels.end() - 1);
}

Status CatalogDirectory::CreateWarehouse(const WarehouseInfo& warehouse) {
  ICECAT_ASSIGN_OR_RAISE(auto storage_profile, warehouse.storage_profile.Serialize());

  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kInsertWarehouseSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, warehouse.warehouse_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(2, warehouse.project_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(3, warehouse.name));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(4, storage_profile));
  ICECAT_RETURN_UNEXPECTED(stmt.BindOptional(5, warehouse.storage_secret_id));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(6, ToString(warehouse.status)));
  ICECAT_RETURN_UNEXPECTED(stmt.Execute());
  ICECAT_RETURN_UNEXPECTED(txn.Commit());

  Logger()->info("Created warehouse '{}' ({})", warehouse.name,
                 warehouse.warehouse_id.ToString());
  return {};
}

Result<WarehouseInfo> CatalogDirectory::GetWarehouse(const WarehouseId& warehouse_id) {
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kSelectWarehouseSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, warehouse_id.ToString()));
  ICECAT_ASSIGN_OR_RAISE(auto found, stmt.Step());
  if (!found) {
    return NotFound("Warehouse {} not found", warehouse_id);
  }
  ICECAT_ASSIGN_OR_RAISE(auto project_id, ProjectId::FromString(stmt.ColumnText(0)));
  ICECAT_ASSIGN_OR_RAISE(auto storage_profile, Document::Parse(stmt.ColumnText(2)));
  ICECAT_ASSIGN_OR_RAISE(auto status, WarehouseStatusFromString(stmt.ColumnText(4)));
  return WarehouseInfo{.warehouse_id = warehouse_id,
                       .project_id = project_id,
                       .name = stmt.ColumnText(1),
                       .storage_profile = std::move(storage_profile),
                       .storage_secret_id = stmt.ColumnOptionalText(3),
                       .status = status};
}

Result<WarehouseStatus> CatalogDirectory::GetWarehouseStatus(
    const WarehouseId& warehouse_id) {
  ICECAT_ASSIGN_OR_RAISE(auto warehouse, GetWarehouse(warehouse_id));
  return warehouse.status;
}

Status CatalogDirectory::SetWarehouseStatus(const WarehouseId& warehouse_id,
                                            WarehouseStatus status) {
  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kUpdateWarehouseStatusSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, warehouse_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(2, ToString(status)));
  ICECAT_RETURN_UNEXPECTED(stmt.Execute());
  if (db_.changes() == 0) {
    return NotFound("Warehouse {} not found", warehouse_id);
  }
  ICECAT_RETURN_UNEXPECTED(txn.Commit());

  Logger()->info("Warehouse {} is now {}", warehouse_id.ToString(), ToString(status));
  return {};
}

Status CatalogDirectory::CreateNamespace(const NamespaceId& namespace_id,
                                         const WarehouseId& warehouse_id,
                                         const std::vector<std::string>& levels) {
  if (levels.empty()) {
    return InvalidArgument("Namespace {} must have a name", namespace_id);
  }
  for (const auto& level : levels) {
    if (level.empty()) {
      return InvalidArgument("Namespace {} has an empty name level", namespace_id);
    }
  }
  ICECAT_ASSIGN_OR_RAISE(auto name, ToJsonString(nlohmann::json(levels)));
  auto parent = NamespaceParent(levels);

  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  if (parent.has_value()) {
    ICECAT_ASSIGN_OR_RAISE(auto parent_name, ToJsonString(nlohmann::json(*parent)));
    ICECAT_ASSIGN_OR_RAISE(auto exists_stmt, db_.Prepare(kNamespaceExistsSql));
    ICECAT_RETURN_UNEXPECTED(exists_stmt.Bind(1, warehouse_id.ToString()));
    ICECAT_RETURN_UNEXPECTED(exists_stmt.Bind(2, parent_name));
    ICECAT_ASSIGN_OR_RAISE(auto parent_exists, exists_stmt.Step());
    if (!parent_exists) {
      return ConstraintViolation("Parent namespace {} of namespace {} does not exist",
                                 parent_name, namespace_id);
    }
  }
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kInsertNamespaceSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, namespace_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(2, warehouse_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(3, name));
  ICECAT_RETURN_UNEXPECTED(stmt.Execute());
  return txn.Commit();
}

Status CatalogDirectory::CreateTable(const TableCreation& table) {
  if (table.name.empty()) {
    return InvalidArgument("Table {} must have a name", table.table_id);
  }
  ICECAT_ASSIGN_OR_RAISE(auto metadata, table.metadata.Serialize());
  auto table_id = table.table_id.ToString();

  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  ICECAT_ASSIGN_OR_RAISE(auto tabular_stmt, db_.Prepare(kInsertTabularSql));
  ICECAT_RETURN_UNEXPECTED(tabular_stmt.Bind(1, table_id));
  ICECAT_RETURN_UNEXPECTED(tabular_stmt.Bind(2, table.namespace_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(tabular_stmt.Bind(3, table.name));
  ICECAT_RETURN_UNEXPECTED(tabular_stmt.BindOptional(4, table.metadata_location));
  ICECAT_RETURN_UNEXPECTED(tabular_stmt.Execute());

  ICECAT_ASSIGN_OR_RAISE(auto table_stmt, db_.Prepare(kInsertTableSql));
  ICECAT_RETURN_UNEXPECTED(table_stmt.Bind(1, table_id));
  ICECAT_RETURN_UNEXPECTED(table_stmt.Bind(2, metadata));
  ICECAT_RETURN_UNEXPECTED(table_stmt.Execute());
  ICECAT_RETURN_UNEXPECTED(txn.Commit());

  Logger()->debug("Created table '{}' ({}) in namespace {}", table.name, table_id,
                  table.namespace_id.ToString());
  return {};
}

Status CatalogDirectory::UpdateTableMetadata(
    const TableId& table_id, const Document& metadata,
    const std::optional<std::string>& metadata_location) {
  ICECAT_ASSIGN_OR_RAISE(auto metadata_json, metadata.Serialize());
  auto id = table_id.ToString();

  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  ICECAT_ASSIGN_OR_RAISE(auto metadata_stmt, db_.Prepare(kUpdateTableMetadataSql));
  ICECAT_RETURN_UNEXPECTED(metadata_stmt.Bind(1, id));
  ICECAT_RETURN_UNEXPECTED(metadata_stmt.Bind(2, metadata_json));
  ICECAT_RETURN_UNEXPECTED(metadata_stmt.Execute());
  if (db_.changes() == 0) {
    return NotFound("Table {} not found", table_id);
  }

  ICECAT_ASSIGN_OR_RAISE(auto location_stmt, db_.Prepare(kUpdateMetadataLocationSql));
  ICECAT_RETURN_UNEXPECTED(location_stmt.Bind(1, id));
  ICECAT_RETURN_UNEXPECTED(location_stmt.BindOptional(2, metadata_location));
  ICECAT_RETURN_UNEXPECTED(location_stmt.Execute());
  return txn.Commit();
}

Status CatalogDirectory::MarkTableDeleted(const TableId& table_id,
                                          TimePointMs deleted_at) {
  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kUpdateDeletedAtSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, table_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(2, UnixMsFromTimePointMs(deleted_at)));
  ICECAT_RETURN_UNEXPECTED(stmt.Execute());
  if (db_.changes() == 0) {
    return NotFound("Table {} not found", table_id);
  }
  ICECAT_RETURN_UNEXPECTED(txn.Commit());

  Logger()->debug("Soft-deleted table {}", table_id.ToString());
  return {};
}

Status CatalogDirectory::RestoreTable(const TableId& table_id) {
  ICECAT_ASSIGN_OR_RAISE(
      auto txn, sqlite::Transaction::Begin(db_, sqlite::TransactionMode::kImmediate));
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kUpdateDeletedAtSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, table_id.ToString()));
  ICECAT_RETURN_UNEXPECTED(stmt.BindNull(2));
  ICECAT_RETURN_UNEXPECTED(stmt.Execute());
  if (db_.changes() == 0) {
    return NotFound("Table {} not found", table_id);
  }
  return txn.Commit();
}

}  // namespace icecat
