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

/// \file icecat/sqlite/transaction.h
/// \brief Scoped SQLite transaction.

#include "icecat/icecat_export.h"
#include "icecat/result.h"
#include "icecat/sqlite/database.h"

namespace icecat::sqlite {

enum class TransactionMode {
  /// Takes locks lazily; used for reads, which then see one snapshot.
  kDeferred,
  /// Takes the database write lock up front, so concurrent writers queue on
  /// the busy timeout instead of failing at their first write.
  kImmediate,
};

/// \brief A transaction that is rolled back unless Commit() succeeds.
class ICECAT_EXPORT Transaction {
 public:
  static Result<Transaction> Begin(Database& db, TransactionMode mode);

  Transaction(Transaction&& other) noexcept;
  Transaction& operator=(Transaction&&) = delete;
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  ~Transaction();

  /// \brief Commit the transaction.
  ///
  /// \return Status::OK once committed;
  ///         the kind of the engine error if the commit failed and the
  ///         transaction was rolled back (kStorageUnavailable for lock
  ///         contention and I/O failures, kConstraintViolation for a deferred
  ///         foreign key violation);
  ///         ErrorKind::kCommitStateUnknown if the engine ended the transaction
  ///         with an error, so whether it was applied is not known.
  Status Commit();

  /// \brief Roll back explicitly. Does nothing once committed or rolled back.
  Status Rollback();

  Database& db() const { return *db_; }

  bool active() const { return active_; }

 private:
  explicit Transaction(Database* db);

  Database* db_;
  bool active_;
};

}  // namespace icecat::sqlite
