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

#include <iostream>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "icecat/batch_coordinator.h"
#include "icecat/catalog_properties.h"
#include "icecat/store/sql_catalog_store.h"

int main(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "Usage: " << argv[0] << " <database_path> <warehouse_name> <table_name>"
              << std::endl;
    return 0;
  }

  const std::string database_path = argv[1];
  const std::string warehouse_name = argv[2];
  const std::string table_name = argv[3];

  auto config = icecat::CatalogProperties::FromMap(
      {{icecat::CatalogProperties::kDatabasePath.key(), database_path}});
  auto store_result = icecat::SqlCatalogStore::Make(*config);
  if (!store_result.has_value()) {
    std::cerr << "Failed to open catalog: " << store_result.error().message << std::endl;
    return 1;
  }
  std::shared_ptr<icecat::SqlCatalogStore> store = std::move(store_result.value());

  auto warehouse_id = icecat::WarehouseId::Generate();
  auto namespace_id = icecat::NamespaceId::Generate();
  auto table_id = icecat::TableId::Generate();

  auto& directory = store->directory();
  auto status = directory.CreateWarehouse(
      {.warehouse_id = warehouse_id,
       .project_id = icecat::ProjectId::Generate(),
       .name = warehouse_name,
       .storage_profile = icecat::Document(nlohmann::json{{"type", "file"}}),
       .storage_secret_id = std::nullopt});
  if (status.has_value()) {
    status = directory.CreateNamespace(namespace_id, warehouse_id, {"demo"});
  }
  if (status.has_value()) {
    status = directory.CreateTable(
        {.table_id = table_id,
         .namespace_id = namespace_id,
         .name = table_name,
         .metadata = icecat::Document(nlohmann::json{{"format-version", 2}}),
         .metadata_location = std::nullopt});
  }
  if (!status.has_value()) {
    std::cerr << "Failed to create table: " << status.error().message << std::endl;
    return 1;
  }

  icecat::BatchCoordinator coordinator(store);
  std::map<std::string, icecat::SnapshotRef> references = {
      {std::string(icecat::SnapshotRef::kMainBranch),
       {.snapshot_id = 1, .retention = icecat::SnapshotRef::Branch{}}},
      {"v1", {.snapshot_id = 1, .retention = icecat::SnapshotRef::Tag{}}},
  };
  status = coordinator.CommitReferences(table_id, references);
  if (!status.has_value()) {
    std::cerr << "Failed to commit references: " << status.error().message << std::endl;
    return 1;
  }

  auto load_result = coordinator.LoadTables(
      {.warehouse_id = warehouse_id, .table_ids = {table_id}});
  if (!load_result.has_value()) {
    std::cerr << "Failed to load tables: " << load_result.error().message << std::endl;
    return 1;
  }

  auto references_result = store->LoadReferences(table_id);
  if (!references_result.has_value()) {
    std::cerr << "Failed to load references: " << references_result.error().message
              << std::endl;
    return 1;
  }

  std::cout << "Tables: " << std::endl;
  for (const auto& record : load_result.value()) {
    std::cout << " - " << record.table_id.ToString() << " "
              << record.metadata.value().dump() << std::endl;
  }
  std::cout << "References: " << std::endl;
  for (const auto& reference : references_result.value()) {
    std::cout << " - " << reference.name << " -> " << reference.snapshot_id << " "
              << reference.retention.value().dump() << std::endl;
  }

  return 0;
}
