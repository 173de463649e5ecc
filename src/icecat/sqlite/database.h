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

/// \file icecat/sqlite/database.h
/// \brief RAII wrappers over an SQLite connection and its prepared statements.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "icecat/icecat_export.h"
#include "icecat/result.h"

struct sqlite3;
struct sqlite3_stmt;

namespace icecat::sqlite {

/// \brief A prepared statement. Parameter indexes are 1-based, column indexes
/// 0-based, as in the SQLite C API.
class ICECAT_EXPORT Statement {
 public:
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  ~Statement();

  Status Bind(int index, std::string_view value);
  Status Bind(int index, int64_t value);
  /// \brief Bind the value, or NULL when unset.
  Status BindOptional(int index, const std::optional<std::string>& value);
  Status BindNull(int index);

  /// \brief Advance to the next row.
  ///
  /// \return true if a row is available, false once the statement is done
  Result<bool> Step();

  /// \brief Run the statement to completion, discarding any rows.
  Status Execute();

  /// \brief Reset the statement so it can be stepped again. Bindings are kept.
  Status Reset();

  bool IsNull(int column) const;
  int64_t ColumnInt64(int column) const;
  std::string ColumnText(int column) const;
  std::optional<std::string> ColumnOptionalText(int column) const;
  std::optional<int64_t> ColumnOptionalInt64(int column) const;

 private:
  friend class Database;
  Statement(sqlite3* db, sqlite3_stmt* stmt);

  sqlite3* db_;
  sqlite3_stmt* stmt_;
};

/// \brief An open SQLite connection.
///
/// A connection is used by one thread at a time; concurrent callers open their
/// own connection to the same database file.
class ICECAT_EXPORT Database {
 public:
  /// \brief Open (and create if missing) the database at `path`.
  ///
  /// Extended result codes and foreign key enforcement are always enabled.
  static Result<std::unique_ptr<Database>> Open(const std::string& path);

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;
  ~Database();

  /// \brief Execute one or more SQL statements that take no parameters.
  Status Execute(std::string_view sql);

  /// \brief Compile a single SQL statement.
  Result<Statement> Prepare(std::string_view sql);

  /// \brief Set how long a statement waits on a lock held by another connection.
  Status SetBusyTimeout(int64_t timeout_ms);

  /// \brief Set the journal mode and return the mode actually in effect.
  ///
  /// In-memory databases always report "memory".
  Result<std::string> SetJournalMode(std::string_view mode);

  /// \brief Rows modified by the most recent INSERT, UPDATE or DELETE.
  int64_t changes() const;

  /// \brief Whether no explicit transaction is open on this connection.
  bool autocommit() const;

  sqlite3* handle() const { return db_; }

 private:
  explicit Database(sqlite3* db);

  sqlite3* db_;
};

}  // namespace icecat::sqlite
