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

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "icecat/document.h"
#include "icecat/icecat_export.h"
#include "icecat/result.h"
#include "icecat/snapshot.h"
#include "icecat/table_reference.h"

/// \file icecat/json_internal.h
/// JSON conversions used at the storage boundary.

namespace icecat {

/// \brief Serializes a `SnapshotRef` object to JSON, including its snapshot id.
///
/// \param[in] snapshot_ref The `SnapshotRef` object to be serialized.
/// \return A JSON object representing the `SnapshotRef`.
ICECAT_EXPORT nlohmann::json ToJson(const SnapshotRef& snapshot_ref);

/// \brief Deserializes a JSON object into a `SnapshotRef` object.
///
/// \param[in] json The JSON object representing a `SnapshotRef`.
/// \return A `SnapshotRef` object or an error if the conversion fails.
ICECAT_EXPORT Result<SnapshotRef> SnapshotRefFromJson(const nlohmann::json& json);

/// \brief The retention document of a typed reference.
///
/// This is the reference JSON without its snapshot id, e.g.
/// `{"type": "branch", "min-snapshots-to-keep": 3}`.
ICECAT_EXPORT Document RetentionDocument(const SnapshotRef& snapshot_ref);

/// \brief Rebuild a typed reference from a stored snapshot id and retention document.
///
/// \return the reference, or ErrorKind::kJsonParseError if the retention document is
/// not one produced by RetentionDocument.
ICECAT_EXPORT Result<SnapshotRef> SnapshotRefFromRetention(int64_t snapshot_id,
                                                           const Document& retention);

/// \brief Serializes a reference entry as the storage engine's batch row
/// `{"name": ..., "snapshot_id": ..., "retention": ...}`.
ICECAT_EXPORT nlohmann::json ToJson(const TableReference& reference);

/// \brief Parse a JSON string into a JSON object.
ICECAT_EXPORT Result<nlohmann::json> FromJsonString(std::string_view json_string);

/// \brief Serialize a JSON object into its compact string form.
ICECAT_EXPORT Result<std::string> ToJsonString(const nlohmann::json& json);

}  // namespace icecat
