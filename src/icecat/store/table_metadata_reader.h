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

/// \file icecat/store/table_metadata_reader.h
/// Batch reads of table metadata scoped to one warehouse.

#include <unordered_set>
#include <vector>

#include "icecat/icecat_export.h"
#include "icecat/identifier.h"
#include "icecat/result.h"
#include "icecat/sqlite/database.h"
#include "icecat/table_reference.h"

namespace icecat {

/// \brief Reads table metadata together with the storage context of its warehouse.
class ICECAT_EXPORT TableMetadataReader {
 public:
  explicit TableMetadataReader(sqlite::Database& db) : db_(db) {}

  /// \brief Read the tables of `warehouse_id` among `table_ids`.
  ///
  /// Ids that do not exist, belong to another warehouse or are soft-deleted
  /// (unless `include_deleted` is set) are left out of the result without an
  /// error. The result is ordered by table id. An empty id set yields an empty
  /// result without touching storage.
  ///
  /// \return the records found;
  ///         ErrorKind::kNotFound if the warehouse does not exist;
  ///         ErrorKind::kWarehouseNotActive if it is inactive;
  ///         ErrorKind::kJsonParseError if a stored document is corrupt
  Result<std::vector<TableRecord>> ReadTables(const WarehouseId& warehouse_id,
                                              const std::unordered_set<TableId>& table_ids,
                                              bool include_deleted);

 private:
  sqlite::Database& db_;
};

}  // namespace icecat
