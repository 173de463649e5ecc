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

#include <memory>

#include "icecat/catalog_properties.h"
#include "icecat/catalog_store.h"
#include "icecat/icecat_export.h"
#include "icecat/sqlite/database.h"
#include "icecat/store/catalog_directory.h"
#include "icecat/store/reference_store.h"
#include "icecat/store/table_metadata_reader.h"

/// \file icecat/store/sql_catalog_store.h
/// CatalogStore backed by an SQLite database.

namespace icecat {

/// \brief CatalogStore over one SQLite connection.
///
/// Stores opened on the same database file share their data; each one is used
/// by a single thread.
class ICECAT_EXPORT SqlCatalogStore : public CatalogStore {
 public:
  ~SqlCatalogStore() override;

  SqlCatalogStore(const SqlCatalogStore&) = delete;
  SqlCatalogStore& operator=(const SqlCatalogStore&) = delete;
  SqlCatalogStore(SqlCatalogStore&&) = delete;
  SqlCatalogStore& operator=(SqlCatalogStore&&) = delete;

  /// \brief Open the database named by `config` and create the catalog relations.
  ///
  /// \param config the configuration for the store
  /// \return the store;
  ///         ErrorKind::kInvalidArgument if the configuration is invalid;
  ///         ErrorKind::kStorageUnavailable if the database cannot be opened
  static Result<std::unique_ptr<SqlCatalogStore>> Make(const CatalogProperties& config);

  Status ReplaceReferences(const TableId& table_id,
                           std::span<const TableReference> references) override;

  Result<std::vector<TableReference>> LoadReferences(const TableId& table_id) override;

  Result<std::vector<TableRecord>> ReadTables(const WarehouseId& warehouse_id,
                                              const std::unordered_set<TableId>& table_ids,
                                              bool include_deleted) override;

  /// \brief The warehouses, namespaces and tables of this catalog.
  CatalogDirectory& directory() { return directory_; }

  const CatalogProperties& config() const { return *config_; }

 private:
  SqlCatalogStore(std::unique_ptr<CatalogProperties> config,
                  std::unique_ptr<sqlite::Database> db);

  std::unique_ptr<CatalogProperties> config_;
  std::unique_ptr<sqlite::Database> db_;
  CatalogDirectory directory_;
  ReferenceStore references_;
  TableMetadataReader reader_;
};

}  // namespace icecat
