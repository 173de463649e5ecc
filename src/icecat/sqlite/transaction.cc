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

#include "icecat/sqlite/transaction.h"

#include <expected>
#include <format>
#include <utility>

#include "icecat/util/logging.h"
#include "icecat/util/macros.h"

namespace icecat::sqlite {

Transaction::Transaction(Database* db) : db_(db), active_(true) {}

Transaction::Transaction(Transaction&& other) noexcept
    : db_(other.db_), active_(std::exchange(other.active_, false)) {}

Transaction::~Transaction() {
  if (!active_) {
    return;
  }
  if (auto status = Rollback(); !status) {
    Logger()->error("Failed to roll back catalog transaction: {}",
                    status.error().message);
  }
}

Result<Transaction> Transaction::Begin(Database& db, TransactionMode mode) {
  ICECAT_RETURN_UNEXPECTED(db.Execute(mode == TransactionMode::kImmediate
                                          ? "BEGIN IMMEDIATE"
                                          : "BEGIN DEFERRED"));
  return Transaction(&db);
}

Status Transaction::Commit() {
  if (!active_) {
    return InvalidArgument("Transaction is not active");
  }
  auto status = db_->Execute("COMMIT");
  if (status) {
    active_ = false;
    return {};
  }

  if (db_->autocommit()) {
    // The engine closed the transaction itself while failing the commit.
    active_ = false;
    Logger()->error("Catalog commit ended in an unknown state: {}",
                    status.error().message);
    return CommitStateUnknown("Commit outcome unknown: {}", status.error().message);
  }

  // The transaction is still open, e.g. after SQLITE_BUSY or a deferred foreign
  // key violation. The engine's classification decides whether a retry can help.
  Logger()->warn("Catalog commit failed, rolling back: {}", status.error().message);
  ICECAT_RETURN_UNEXPECTED(Rollback());
  return std::unexpected<Error>(
      {status.error().kind,
       std::format("Commit failed and was rolled back: {}", status.error().message)});
}

Status Transaction::Rollback() {
  if (!active_) {
    return {};
  }
  active_ = false;
  if (db_->autocommit()) {
    // An error such as SQLITE_FULL may already have rolled the transaction back.
    return {};
  }
  return db_->Execute("ROLLBACK");
}

}  // namespace icecat::sqlite
