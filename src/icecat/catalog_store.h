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

#include <span>
#include <unordered_set>
#include <vector>

#include "icecat/icecat_export.h"
#include "icecat/identifier.h"
#include "icecat/result.h"
#include "icecat/table_reference.h"

namespace icecat {

/// \brief The persistence operations of the catalog core.
///
/// Each call is one transactional unit of work. Implementations are used by
/// one thread at a time.
class ICECAT_EXPORT CatalogStore {
 public:
  virtual ~CatalogStore() = default;

  /// \brief Replace a batch of references of one table atomically.
  ///
  /// \param table_id the table owning the references
  /// \param references the new state of each named reference, applied in order
  /// \return Status::OK once committed (an empty batch is a no-op);
  ///         ErrorKind::kInvalidArgument for an empty reference name;
  ///         ErrorKind::kConstraintViolation if the table does not exist;
  ///         ErrorKind::kWarehouseNotActive if its warehouse is inactive;
  ///         ErrorKind::kStorageUnavailable if nothing was committed;
  ///         ErrorKind::kCommitStateUnknown if the commit outcome is not known
  virtual Status ReplaceReferences(const TableId& table_id,
                                   std::span<const TableReference> references) = 0;

  /// \brief All references of a table, ordered by name.
  ///
  /// \param table_id the table to look up
  /// \return the references;
  ///         ErrorKind::kNotFound if the table does not exist;
  ///         ErrorKind::kWarehouseNotActive if its warehouse is inactive
  virtual Result<std::vector<TableReference>> LoadReferences(const TableId& table_id) = 0;

  /// \brief Read table metadata scoped to one warehouse.
  ///
  /// \param warehouse_id the warehouse the tables must belong to
  /// \param table_ids the tables to read
  /// \param include_deleted whether soft-deleted tables are returned
  /// \return the tables found, ordered by id; requested ids that are missing,
  ///         foreign to the warehouse or soft-deleted are omitted;
  ///         ErrorKind::kNotFound if the warehouse does not exist;
  ///         ErrorKind::kWarehouseNotActive if it is inactive
  virtual Result<std::vector<TableRecord>> ReadTables(
      const WarehouseId& warehouse_id, const std::unordered_set<TableId>& table_ids,
      bool include_deleted) = 0;
};

}  // namespace icecat
