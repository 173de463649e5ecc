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

/// \file icecat/store/warehouse_scope_guard.h
/// Warehouse activity checks shared by every catalog read and write.

#include <optional>

#include "icecat/icecat_export.h"
#include "icecat/identifier.h"
#include "icecat/result.h"
#include "icecat/sqlite/database.h"

namespace icecat {

/// \brief The warehouse a table belongs to.
struct ICECAT_EXPORT TableScope {
  WarehouseId warehouse_id;
  WarehouseStatus status;
};

/// \brief Admits an operation only when the warehouse in scope is active.
///
/// The guard issues its lookups on the connection it was given, so when the
/// caller has a transaction open the check and the guarded statements see the
/// same warehouse state.
class ICECAT_EXPORT WarehouseScopeGuard {
 public:
  explicit WarehouseScopeGuard(sqlite::Database& db) : db_(db) {}

  /// \brief Check a status read for `warehouse_id`.
  ///
  /// \return Status::OK for an active warehouse, ErrorKind::kWarehouseNotActive
  /// otherwise
  static Status CheckActive(const WarehouseId& warehouse_id, WarehouseStatus status);

  /// \brief Require `warehouse_id` to exist and be active.
  ///
  /// \return ErrorKind::kNotFound if there is no such warehouse,
  ///         ErrorKind::kWarehouseNotActive if it is inactive
  Status RequireActiveWarehouse(const WarehouseId& warehouse_id) const;

  /// \brief Look up the warehouse owning `table_id`.
  ///
  /// \return the scope, or std::nullopt if there is no such table
  Result<std::optional<TableScope>> ResolveTableScope(const TableId& table_id) const;

  /// \brief Require the warehouse owning `table_id` to be active.
  ///
  /// \return the warehouse id;
  ///         ErrorKind::kConstraintViolation if there is no such table;
  ///         ErrorKind::kWarehouseNotActive if its warehouse is inactive
  Result<WarehouseId> RequireActiveWarehouseForTable(const TableId& table_id) const;

 private:
  sqlite::Database& db_;
};

}  // namespace icecat
