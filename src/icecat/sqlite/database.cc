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

#include "icecat/sqlite/database.h"

#include <format>
#include <limits>
#include <utility>

#include <sqlite3.h>

#include "icecat/sqlite/sqlite_error.h"
#include "icecat/util/logging.h"
#include "icecat/util/macros.h"

namespace icecat::sqlite {

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    sqlite3_finalize(stmt_);
    db_ = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

Statement::~Statement() {
  // finalize returns the error of the last step, which was already reported.
  sqlite3_finalize(stmt_);
}

Status Statement::Bind(int index, std::string_view value) {
  int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                             SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    return SqliteError(db_, rc, std::format("bind text parameter {}", index));
  }
  return {};
}

Status Statement::Bind(int index, int64_t value) {
  int rc = sqlite3_bind_int64(stmt_, index, value);
  if (rc != SQLITE_OK) {
    return SqliteError(db_, rc, std::format("bind integer parameter {}", index));
  }
  return {};
}

Status Statement::BindOptional(int index, const std::optional<std::string>& value) {
  if (!value.has_value()) {
    return BindNull(index);
  }
  return Bind(index, std::string_view(*value));
}

Status Statement::BindNull(int index) {
  int rc = sqlite3_bind_null(stmt_, index);
  if (rc != SQLITE_OK) {
    return SqliteError(db_, rc, std::format("bind null parameter {}", index));
  }
  return {};
}

Result<bool> Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  return SqliteError(db_, rc, "execute statement");
}

Status Statement::Execute() {
  while (true) {
    ICECAT_ASSIGN_OR_RAISE(auto has_row, Step());
    if (!has_row) {
      return {};
    }
  }
}

Status Statement::Reset() {
  int rc = sqlite3_reset(stmt_);
  if (rc != SQLITE_OK) {
    return SqliteError(db_, rc, "reset statement");
  }
  return {};
}

bool Statement::IsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::ColumnInt64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

std::string Statement::ColumnText(int column) const {
  const auto* text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return {};
  }
  int size = sqlite3_column_bytes(stmt_, column);
  return {reinterpret_cast<const char*>(text), static_cast<size_t>(size)};
}

std::optional<std::string> Statement::ColumnOptionalText(int column) const {
  if (IsNull(column)) {
    return std::nullopt;
  }
  return ColumnText(column);
}

std::optional<int64_t> Statement::ColumnOptionalInt64(int column) const {
  if (IsNull(column)) {
    return std::nullopt;
  }
  return ColumnInt64(column);
}

Database::Database(sqlite3* db) : db_(db) {}

Database::~Database() {
  int rc = sqlite3_close(db_);
  if (rc != SQLITE_OK) {
    Logger()->error("Failed to close catalog database: {}", sqlite3_errstr(rc));
  }
}

Result<std::unique_ptr<Database>> Database::Open(const std::string& path) {
  sqlite3* handle = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &handle,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    auto error = SqliteError(handle, rc, std::format("open database '{}'", path));
    // A handle is allocated even when opening fails.
    sqlite3_close(handle);
    return error;
  }

  auto db = std::unique_ptr<Database>(new Database(handle));
  sqlite3_extended_result_codes(handle, 1);
  ICECAT_RETURN_UNEXPECTED(db->Execute("PRAGMA foreign_keys = ON"));
  Logger()->debug("Opened catalog database '{}'", path);
  return db;
}

Status Database::Execute(std::string_view sql) {
  std::string statement(sql);
  char* error_message = nullptr;
  int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &error_message);
  sqlite3_free(error_message);
  if (rc != SQLITE_OK) {
    return SqliteError(db_, rc, "execute SQL");
  }
  return {};
}

Result<Statement> Database::Prepare(std::string_view sql) {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt,
                              nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return SqliteError(db_, rc, "prepare statement");
  }
  return Statement(db_, stmt);
}

Status Database::SetBusyTimeout(int64_t timeout_ms) {
  if (timeout_ms < 0 || timeout_ms > std::numeric_limits<int>::max()) {
    return InvalidArgument("Busy timeout out of range: {}", timeout_ms);
  }
  int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout_ms));
  if (rc != SQLITE_OK) {
    return SqliteError(db_, rc, "set busy timeout");
  }
  return {};
}

Result<std::string> Database::SetJournalMode(std::string_view mode) {
  ICECAT_ASSIGN_OR_RAISE(auto stmt, Prepare(std::format("PRAGMA journal_mode = {}", mode)));
  ICECAT_ASSIGN_OR_RAISE(auto has_row, stmt.Step());
  if (!has_row) {
    return UnknownError("PRAGMA journal_mode returned no row");
  }
  return stmt.ColumnText(0);
}

int64_t Database::changes() const { return sqlite3_changes64(db_); }

bool Database::autocommit() const { return sqlite3_get_autocommit(db_) != 0; }

}  // namespace icecat::sqlite
