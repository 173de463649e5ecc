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

#include "icecat/json_internal.h"

#include <nlohmann/json.hpp>

#include "icecat/util/json_util_internal.h"
#include "icecat/util/macros.h"

namespace icecat {

namespace {

constexpr std::string_view kSnapshotId = "snapshot-id";
constexpr std::string_view kType = "type";
constexpr std::string_view kMinSnapshotsToKeep = "min-snapshots-to-keep";
constexpr std::string_view kMaxSnapshotAgeMs = "max-snapshot-age-ms";
constexpr std::string_view kMaxRefAgeMs = "max-ref-age-ms";

// Keys of a batch row handed to the storage engine.
constexpr std::string_view kRowName = "name";
constexpr std::string_view kRowSnapshotId = "snapshot_id";
constexpr std::string_view kRowRetention = "retention";

nlohmann::json RetentionToJson(const SnapshotRef& ref) {
  nlohmann::json json;
  json[kType] = std::string(ToString(ref.type()));
  if (ref.type() == SnapshotRefType::kBranch) {
    const auto& branch = std::get<SnapshotRef::Branch>(ref.retention);
    SetOptionalField(json, kMinSnapshotsToKeep, branch.min_snapshots_to_keep);
    SetOptionalField(json, kMaxSnapshotAgeMs, branch.max_snapshot_age_ms);
    SetOptionalField(json, kMaxRefAgeMs, branch.max_ref_age_ms);
  } else {
    const auto& tag = std::get<SnapshotRef::Tag>(ref.retention);
    SetOptionalField(json, kMaxRefAgeMs, tag.max_ref_age_ms);
  }
  return json;
}

Result<SnapshotRef> RetentionFromJson(int64_t snapshot_id, const nlohmann::json& json) {
  if (!json.is_object()) {
    return JsonParseError("Cannot parse snapshot retention from non-object: {}",
                          SafeDumpJson(json));
  }
  ICECAT_ASSIGN_OR_RAISE(
      auto type,
      GetJsonValue<std::string>(json, kType).and_then(SnapshotRefTypeFromString));
  if (type == SnapshotRefType::kBranch) {
    ICECAT_ASSIGN_OR_RAISE(auto min_snapshots_to_keep,
                           GetJsonValueOptional<int32_t>(json, kMinSnapshotsToKeep));
    ICECAT_ASSIGN_OR_RAISE(auto max_snapshot_age_ms,
                           GetJsonValueOptional<int64_t>(json, kMaxSnapshotAgeMs));
    ICECAT_ASSIGN_OR_RAISE(auto max_ref_age_ms,
                           GetJsonValueOptional<int64_t>(json, kMaxRefAgeMs));
    return SnapshotRef{
        .snapshot_id = snapshot_id,
        .retention = SnapshotRef::Branch{.min_snapshots_to_keep = min_snapshots_to_keep,
                                         .max_snapshot_age_ms = max_snapshot_age_ms,
                                         .max_ref_age_ms = max_ref_age_ms}};
  }
  ICECAT_ASSIGN_OR_RAISE(auto max_ref_age_ms,
                         GetJsonValueOptional<int64_t>(json, kMaxRefAgeMs));
  return SnapshotRef{.snapshot_id = snapshot_id,
                     .retention = SnapshotRef::Tag{.max_ref_age_ms = max_ref_age_ms}};
}

}  // namespace

nlohmann::json ToJson(const SnapshotRef& ref) {
  nlohmann::json json = RetentionToJson(ref);
  json[kSnapshotId] = ref.snapshot_id;
  return json;
}

Result<SnapshotRef> SnapshotRefFromJson(const nlohmann::json& json) {
  ICECAT_ASSIGN_OR_RAISE(auto snapshot_id, GetJsonValue<int64_t>(json, kSnapshotId));
  return RetentionFromJson(snapshot_id, json);
}

Document RetentionDocument(const SnapshotRef& snapshot_ref) {
  return Document(RetentionToJson(snapshot_ref));
}

Result<SnapshotRef> SnapshotRefFromRetention(int64_t snapshot_id,
                                             const Document& retention) {
  return RetentionFromJson(snapshot_id, retention.value());
}

nlohmann::json ToJson(const TableReference& reference) {
  nlohmann::json json;
  json[kRowName] = reference.name;
  json[kRowSnapshotId] = reference.snapshot_id;
  json[kRowRetention] = reference.retention.value();
  return json;
}

Result<nlohmann::json> FromJsonString(std::string_view json_string) {
  auto json =
      nlohmann::json::parse(json_string, /*cb=*/nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded()) [[unlikely]] {
    return JsonParseError("Failed to parse JSON string: {}", json_string);
  }
  return json;
}

Result<std::string> ToJsonString(const nlohmann::json& json) {
  try {
    return json.dump();
  } catch (const std::exception& e) {
    return JsonParseError("Failed to serialize to JSON string: {}", e.what());
  }
}

}  // namespace icecat
