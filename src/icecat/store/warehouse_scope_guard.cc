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

#include "icecat/store/warehouse_scope_guard.h"

#include "icecat/util/formatter.h"  // IWYU pragma: keep
#include "icecat/util/logging.h"
#include "icecat/util/macros.h"

namespace icecat {

namespace {

constexpr std::string_view kWarehouseStatusSql =
    "SELECT status FROM warehouse WHERE warehouse_id = ?1";

constexpr std::string_view kTableScopeSql = R"SQL(
SELECT w.warehouse_id, w.status
FROM tabular ti
INNER JOIN namespace n ON n.namespace_id = ti.namespace_id
INNER JOIN warehouse w ON w.warehouse_id = n.warehouse_id
WHERE ti.tabular_id = ?1
)SQL";

}  // namespace

Status WarehouseScopeGuard::CheckActive(const WarehouseId& warehouse_id,
                                        WarehouseStatus status) {
  if (status != WarehouseStatus::kActive) {
    Logger()->debug("Rejected access to inactive warehouse {}", warehouse_id.ToString());
    return WarehouseNotActive("Warehouse {} is not active", warehouse_id);
  }
  return {};
}

Status WarehouseScopeGuard::RequireActiveWarehouse(const WarehouseId& warehouse_id) const {
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kWarehouseStatusSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, warehouse_id.ToString()));
  ICECAT_ASSIGN_OR_RAISE(auto found, stmt.Step());
  if (!found) {
    return NotFound("Warehouse {} not found", warehouse_id);
  }
  ICECAT_ASSIGN_OR_RAISE(auto status, WarehouseStatusFromString(stmt.ColumnText(0)));
  return CheckActive(warehouse_id, status);
}

Result<std::optional<TableScope>> WarehouseScopeGuard::ResolveTableScope(
    const TableId& table_id) const {
  ICECAT_ASSIGN_OR_RAISE(auto stmt, db_.Prepare(kTableScopeSql));
  ICECAT_RETURN_UNEXPECTED(stmt.Bind(1, table_id.ToString()));
  ICECAT_ASSIGN_OR_RAISE(auto found, stmt.Step());
  if (!found) {
    return std::nullopt;
  }
  ICECAT_ASSIGN_OR_RAISE(auto warehouse_id, WarehouseId::FromString(stmt.ColumnText(0)));
  ICECAT_ASSIGN_OR_RAISE(auto status, WarehouseStatusFromString(stmt.ColumnText(1)));
  return TableScope{.warehouse_id = warehouse_id, .status = status};
}

Result<WarehouseId> WarehouseScopeGuard::RequireActiveWarehouseForTable(
    const TableId& table_id) const {
  ICECAT_ASSIGN_OR_RAISE(auto scope, ResolveTableScope(table_id));
  if (!scope.has_value()) {
    return ConstraintViolation("Table {} does not exist", table_id);
  }
  ICECAT_RETURN_UNEXPECTED(CheckActive(scope->warehouse_id, scope->status));
  return scope->warehouse_id;
}

}  // namespace icecat
