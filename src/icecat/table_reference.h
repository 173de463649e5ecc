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

/// \file icecat/table_reference.h
/// A named reference of one table and the record returned by table reads.

#include <cstdint>
#include <optional>
#include <string>

#include "icecat/document.h"
#include "icecat/icecat_export.h"
#include "icecat/identifier.h"
#include "icecat/util/timepoint.h"

namespace icecat {

/// \brief A branch or tag of a table: `name` is unique per table.
struct ICECAT_EXPORT TableReference {
  std::string name;
  int64_t snapshot_id;
  /// Opaque retention policy, interpreted only by snapshot maintenance.
  Document retention;

  friend bool operator==(const TableReference& lhs, const TableReference& rhs) = default;
};

/// \brief Table metadata joined with the storage context of its warehouse.
struct ICECAT_EXPORT TableRecord {
  TableId table_id;
  NamespaceId namespace_id;
  Document metadata;
  /// Unset while the table's first metadata file has not been written.
  std::optional<std::string> metadata_location;
  Document storage_profile;
  /// Unset for storage profiles that need no credentials.
  std::optional<std::string> storage_secret_id;
  /// Set for soft-deleted tables, which are only returned on request.
  std::optional<TimePointMs> deleted_at;
};

}  // namespace icecat
