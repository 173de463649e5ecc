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

/// \file icecat/store/reference_store.h
/// Persistence of the named references (branches, tags) of a table.

#include <span>
#include <vector>

#include "icecat/icecat_export.h"
#include "icecat/identifier.h"
#include "icecat/result.h"
#include "icecat/sqlite/database.h"
#include "icecat/table_reference.h"

namespace icecat {

/// \brief Reads and replaces the references of a table.
class ICECAT_EXPORT ReferenceStore {
 public:
  explicit ReferenceStore(sqlite::Database& db) : db_(db) {}

  /// \brief Replace a batch of references of one table atomically.
  ///
  /// Every named reference is first removed and then written with its new
  /// snapshot id and retention, in a single transaction. References of the
  /// table that are not named in the batch are left untouched. If a name
  /// occurs more than once, its last entry wins.
  ///
  /// An empty batch succeeds without touching storage.
  ///
  /// \param table_id the table owning the references
  /// \param references the new state of each named reference
  /// \return Status::OK once committed;
  ///         ErrorKind::kInvalidArgument for an empty reference name;
  ///         ErrorKind::kConstraintViolation if the table does not exist;
  ///         ErrorKind::kWarehouseNotActive if its warehouse is inactive;
  ///         ErrorKind::kStorageUnavailable if the transaction failed and was
  ///         rolled back; ErrorKind::kCommitStateUnknown if the commit
  ///         outcome is not known
  Status ReplaceReferences(const TableId& table_id,
                           std::span<const TableReference> references);

  /// \brief All references of a table, ordered by name.
  ///
  /// \return ErrorKind::kNotFound if the table does not exist,
  ///         ErrorKind::kWarehouseNotActive if its warehouse is inactive
  Result<std::vector<TableReference>> LoadReferences(const TableId& table_id);

 private:
  sqlite::Database& db_;
};

}  // namespace icecat
