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

#include <expected>
#include <format>
#include <string>
#include <string_view>

#include "icecat/icecat_export.h"

namespace icecat {

/// \brief Error types for icecat.
enum class ErrorKind {
  kAlreadyExists,
  /// The storage engine could not tell whether a commit was applied.
  kCommitStateUnknown,
  /// A referenced table, namespace or warehouse does not exist.
  kConstraintViolation,
  kInvalidArgument,
  kJsonParseError,
  kNotFound,
  /// Transport or transaction failure; nothing was committed.
  kStorageUnavailable,
  kWarehouseNotActive,
  kUnknownError,
};

/// \brief Get the name of an error kind, e.g. "InvalidArgument".
ICECAT_EXPORT std::string_view ErrorKindToString(ErrorKind kind);

/// \brief Error with a kind and a message.
struct ICECAT_EXPORT [[nodiscard]] Error {
  ErrorKind kind;
  std::string message;
};

/// /brief Default error trait
template <typename T>
struct DefaultError {
  using type = Error;
};

/// \brief Result alias
template <typename T, typename E = typename DefaultError<T>::type>
using Result = std::expected<T, E>;

using Status = Result<void>;

/// \brief Whether the failed operation is known to have changed nothing and may be
/// retried as is.
///
/// kCommitStateUnknown is never retryable: the caller has to re-read the state first.
ICECAT_EXPORT bool IsRetryable(const Error& error);

/// \brief Macro to define error creation functions
#define DEFINE_ERROR_FUNCTION(name)                                           \
  template <typename... Args>                                                 \
  inline auto name(const std::format_string<Args...> fmt, Args&&... args)     \
      -> std::unexpected<Error> {                                             \
    return std::unexpected<Error>(                                            \
        {ErrorKind::k##name, std::format(fmt, std::forward<Args>(args)...)}); \
  }

DEFINE_ERROR_FUNCTION(AlreadyExists)
DEFINE_ERROR_FUNCTION(CommitStateUnknown)
DEFINE_ERROR_FUNCTION(ConstraintViolation)
DEFINE_ERROR_FUNCTION(InvalidArgument)
DEFINE_ERROR_FUNCTION(JsonParseError)
DEFINE_ERROR_FUNCTION(NotFound)
DEFINE_ERROR_FUNCTION(StorageUnavailable)
DEFINE_ERROR_FUNCTION(WarehouseNotActive)
DEFINE_ERROR_FUNCTION(UnknownError)

#undef DEFINE_ERROR_FUNCTION

}  // namespace icecat
