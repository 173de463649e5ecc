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

#include "icecat/result.h"

namespace icecat {

std::string_view ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kAlreadyExists:
      return "AlreadyExists";
    case ErrorKind::kCommitStateUnknown:
      return "CommitStateUnknown";
    case ErrorKind::kConstraintViolation:
      return "ConstraintViolation";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kJsonParseError:
      return "JsonParseError";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kStorageUnavailable:
      return "StorageUnavailable";
    case ErrorKind::kWarehouseNotActive:
      return "WarehouseNotActive";
    case ErrorKind::kUnknownError:
      return "UnknownError";
  }
  return "UnknownError";
}

bool IsRetryable(const Error& error) {
  return error.kind == ErrorKind::kStorageUnavailable;
}

}  // namespace icecat
