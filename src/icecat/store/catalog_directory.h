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

/// \file icecat/store/catalog_directory.h
/// Warehouses, namespaces and tables: the entities references and reads are
/// scoped to.

#include <optional>
#include <string>
#include <vector>

#include "icecat/document.h"
#include "icecat/icecat_export.h"
#include "icecat/identifier.h"
#include "icecat/result.h"
#include "icecat/sqlite/database.h"
#include "icecat/util/timepoint.h"

namespace icecat {

/// \brief A warehouse row.
struct ICECAT_EXPORT WarehouseInfo {
  WarehouseId warehouse_id;
  ProjectId project_id;
  /// Unique within the project.
  std::string name;
  Document storage_profile;
  std::optional<std::string> storage_secret_id;
  WarehouseStatus status = WarehouseStatus::kActive;
};

/// \brief Input of CatalogDirectory::CreateTable.
struct ICECAT_EXPORT TableCreation {
  TableId table_id;
  NamespaceId namespace_id;
  /// Unique among the live tables of the namespace.
  std::string name;
  Document metadata;
  std::optional<std::string> metadata_location;
};

/// \brief The levels of the enclosing namespace, e.g. {"sales"} for
/// {"sales", "eu"}; std::nullopt for a top-level namespace.
ICECAT_EXPORT std::optional<std::vector<std::string>> NamespaceParent(
    const std::vector<std::string>& levels);

/// \brief Creates and transitions the entities of a catalog.
///
/// Every call runs in its own transaction.
class ICECAT_EXPORT CatalogDirectory {
 public:
  explicit CatalogDirectory(sqlite::Database& db) : db_(db) {}

  /// \brief Create a warehouse.
  ///
  /// \return ErrorKind::kAlreadyExists if the id or the name within the project
  /// is taken
  Status CreateWarehouse(const WarehouseInfo& warehouse);

  /// \brief Load a warehouse.
  ///
  /// \return ErrorKind::kNotFound if there is no such warehouse
  Result<WarehouseInfo> GetWarehouse(const WarehouseId& warehouse_id);

  /// \brief The lifecycle status of a warehouse.
  ///
  /// \return ErrorKind::kNotFound if there is no such warehouse
  Result<WarehouseStatus> GetWarehouseStatus(const WarehouseId& warehouse_id);

  /// \brief Activate or deactivate a warehouse.
  ///
  /// \return ErrorKind::kNotFound if there is no such warehouse
  Status SetWarehouseStatus(const WarehouseId& warehouse_id, WarehouseStatus status);

  /// \brief Create a namespace named by its levels, e.g. {"sales", "eu"}.
  ///
  /// A nested namespace can only be created below an existing one of the same
  /// warehouse.
  ///
  /// \return ErrorKind::kInvalidArgument for an empty name;
  ///         ErrorKind::kConstraintViolation if the warehouse or the parent
  ///         namespace does not exist;
  ///         ErrorKind::kAlreadyExists if the id or name is taken
  Status CreateNamespace(const NamespaceId& namespace_id, const WarehouseId& warehouse_id,
                         const std::vector<std::string>& levels);

  /// \brief Create a table together with its metadata.
  ///
  /// \return ErrorKind::kInvalidArgument for an empty name;
  ///         ErrorKind::kConstraintViolation if the namespace does not exist;
  ///         ErrorKind::kAlreadyExists if the id or name is taken
  Status CreateTable(const TableCreation& table);

  /// \brief Replace the metadata document and location of a table.
  ///
  /// \return ErrorKind::kNotFound if there is no such table
  Status UpdateTableMetadata(const TableId& table_id, const Document& metadata,
                             const std::optional<std::string>& metadata_location);

  /// \brief Soft-delete a table as of `deleted_at`.
  ///
  /// The table and its references stay stored; reads skip it unless asked
  /// to include deleted tables.
  ///
  /// \return ErrorKind::kNotFound if there is no such table
  Status MarkTableDeleted(const TableId& table_id, TimePointMs deleted_at);

  /// \brief Undo a soft-delete.
  ///
  /// \return ErrorKind::kNotFound if there is no such table;
  ///         ErrorKind::kAlreadyExists if a live table of the same name has been
  ///         created since
  Status RestoreTable(const TableId& table_id);

 private:
  sqlite::Database& db_;
};

}  // namespace icecat
