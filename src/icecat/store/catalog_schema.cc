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

#include "icecat/store/catalog_schema.h"

#include <string_view>

#include "icecat/sqlite/transaction.h"
#include "icecat/util/macros.h"

namespace icecat {

namespace {

constexpr std::string_view kCatalogSchema = R"SQL(
CREATE TABLE IF NOT EXISTS warehouse (
    warehouse_id      TEXT PRIMARY KEY,
    project_id        TEXT NOT NULL,
    warehouse_name    TEXT NOT NULL,
    storage_profile   TEXT NOT NULL,
    storage_secret_id TEXT,
    status            TEXT NOT NULL DEFAULT 'active'
                      CHECK (status IN ('active', 'inactive')),
    UNIQUE (project_id, warehouse_name)
);

CREATE TABLE IF NOT EXISTS namespace (
    namespace_id   TEXT PRIMARY KEY,
    warehouse_id   TEXT NOT NULL REFERENCES warehouse (warehouse_id),
    namespace_name TEXT NOT NULL,
    UNIQUE (warehouse_id, namespace_name)
);

CREATE TABLE IF NOT EXISTS tabular (
    tabular_id        TEXT PRIMARY KEY,
    namespace_id      TEXT NOT NULL REFERENCES namespace (namespace_id),
    name              TEXT NOT NULL,
    metadata_location TEXT,
    deleted_at        INTEGER
);

CREATE UNIQUE INDEX IF NOT EXISTS tabular_live_name_idx
    ON tabular (namespace_id, name) WHERE deleted_at IS NULL;

CREATE TABLE IF NOT EXISTS "table" (
    table_id TEXT PRIMARY KEY REFERENCES tabular (tabular_id) ON DELETE CASCADE,
    metadata TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS table_refs (
    table_id       TEXT NOT NULL REFERENCES "table" (table_id) ON DELETE CASCADE,
    table_ref_name TEXT NOT NULL,
    snapshot_id    INTEGER NOT NULL,
    retention      TEXT NOT NULL,
    PRIMARY KEY (table_id, table_ref_name)
);
)SQL";

}  // namespace

Status CreateCatalogSchema(sqlite::Database& db) {
  ICECAT_ASSIGN_OR_RAISE(auto txn,
                         sqlite::Transaction::Begin(db, sqlite::TransactionMode::kImmediate));
  ICECAT_RETURN_UNEXPECTED(db.Execute(kCatalogSchema));
  return txn.Commit();
}

}  // namespace icecat
