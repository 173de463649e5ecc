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

#include "icecat/sqlite/sqlite_error.h"

#include <format>
#include <string>

#include <sqlite3.h>

namespace icecat::sqlite {

ErrorKind ErrorKindFromResultCode(int rc) {
  switch (rc) {
    case SQLITE_CONSTRAINT_FOREIGNKEY:
    case SQLITE_CONSTRAINT_NOTNULL:
      return ErrorKind::kConstraintViolation;
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
      return ErrorKind::kAlreadyExists;
    default:
      break;
  }

  switch (rc & 0xFF) {
    case SQLITE_CONSTRAINT:
      return ErrorKind::kConstraintViolation;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
    case SQLITE_READONLY:
    case SQLITE_PROTOCOL:
    case SQLITE_NOMEM:
    case SQLITE_INTERRUPT:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorKind::kStorageUnavailable;
    default:
      return ErrorKind::kUnknownError;
  }
}

std::unexpected<Error> SqliteError(sqlite3* db, int rc, std::string_view context) {
  // sqlite3_errmsg only describes the most recent failure on the connection.
  std::string detail = db != nullptr && sqlite3_errcode(db) == rc ? sqlite3_errmsg(db)
                                                                  : sqlite3_errstr(rc);
  return std::unexpected<Error>(
      {ErrorKindFromResultCode(rc),
       std::format("Failed to {}: {} (sqlite code {})", context, detail, rc)});
}

}  // namespace icecat::sqlite
