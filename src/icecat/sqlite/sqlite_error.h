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

/// \file icecat/sqlite/sqlite_error.h
/// \brief Translation of SQLite result codes into icecat errors.

#include <expected>
#include <string_view>

#include "icecat/icecat_export.h"
#include "icecat/result.h"

struct sqlite3;

namespace icecat::sqlite {

/// \brief Classify an (extended) SQLite result code.
///
/// Foreign key and NOT NULL violations become kConstraintViolation, primary key
/// and unique violations kAlreadyExists, lock contention and I/O failures
/// kStorageUnavailable; anything else is kUnknownError.
ICECAT_EXPORT ErrorKind ErrorKindFromResultCode(int rc);

/// \brief Build an error for a failed SQLite call.
///
/// \param db the connection the call was made on, used for the detailed
/// message; may be null
/// \param rc the result code returned by the call
/// \param context what was being done, e.g. "prepare statement"
ICECAT_EXPORT std::unexpected<Error> SqliteError(sqlite3* db, int rc,
                                                 std::string_view context);

}  // namespace icecat::sqlite
