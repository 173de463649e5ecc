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

#include "icecat/store/sql_catalog_store.h"

#include <utility>

#include "icecat/store/catalog_schema.h"
#include "icecat/util/logging.h"
#include "icecat/util/macros.h"

namespace icecat {

namespace {

constexpr std::string_view kInMemoryPath = ":memory:";

}  // namespace

SqlCatalogStore::SqlCatalogStore(std::unique_ptr<CatalogProperties> config,
                                 std::unique_ptr<sqlite::Database> db)
    : config_(std::move(config)),
      db_(std::move(db)),
      directory_(*db_),
      references_(*db_),
      reader_(*db_) {}

SqlCatalogStore::~SqlCatalogStore() = default;

Result<std::unique_ptr<SqlCatalogStore>> SqlCatalogStore::Make(
    const CatalogProperties& config) {
  ICECAT_RETURN_UNEXPECTED(config.Validate());
  auto final_config = CatalogProperties::FromMap(config.configs());
  ICECAT_RETURN_UNEXPECTED(SetLogLevel(final_config->Get(CatalogProperties::kLogLevel)));

  auto path = final_config->Get(CatalogProperties::kDatabasePath);
  ICECAT_ASSIGN_OR_RAISE(auto db, sqlite::Database::Open(path));
  ICECAT_RETURN_UNEXPECTED(
      db->SetBusyTimeout(final_config->Get(CatalogProperties::kBusyTimeoutMs)));
  if (path != kInMemoryPath) {
    ICECAT_ASSIGN_OR_RAISE(
        auto journal_mode,
        db->SetJournalMode(final_config->Get(CatalogProperties::kJournalMode)));
    Logger()->debug("Catalog database '{}' uses journal mode {}", path, journal_mode);
  }
  ICECAT_RETURN_UNEXPECTED(CreateCatalogSchema(*db));

  Logger()->info("Opened catalog store '{}'", path);
  return std::unique_ptr<SqlCatalogStore>(
      new SqlCatalogStore(std::move(final_config), std::move(db)));
}

Status SqlCatalogStore::ReplaceReferences(const TableId& table_id,
                                          std::span<const TableReference> references) {
  return references_.ReplaceReferences(table_id, references);
}

Result<std::vector<TableReference>> SqlCatalogStore::LoadReferences(
    const TableId& table_id) {
  return references_.LoadReferences(table_id);
}

Result<std::vector<TableRecord>> SqlCatalogStore::ReadTables(
    const WarehouseId& warehouse_id, const std::unordered_set<TableId>& table_ids,
    bool include_deleted) {
  return reader_.ReadTables(warehouse_id, table_ids, include_deleted);
}

}  // namespace icecat
