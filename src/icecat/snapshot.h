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

/// \file icecat/snapshot.h
/// Typed snapshot references.  The catalog stores the retention part of a
/// reference as an opaque document; these types are the typed view commit and
/// maintenance code use to produce and read that document.

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "icecat/icecat_export.h"
#include "icecat/result.h"

namespace icecat {

/// \brief The type of snapshot reference
enum class SnapshotRefType {
  /// Branches are mutable named references that move forward as new snapshots
  /// are committed to them.
  kBranch,
  /// Tags are labels for individual snapshots
  kTag,
};

/// \brief Get the snapshot reference type name
ICECAT_EXPORT std::string_view ToString(SnapshotRefType type);

/// \brief Get the snapshot reference type from name
ICECAT_EXPORT Result<SnapshotRefType> SnapshotRefTypeFromString(std::string_view str);

/// \brief A reference to a snapshot, either a branch or a tag.
struct ICECAT_EXPORT SnapshotRef {
  /// Name of the branch every table has.
  static constexpr std::string_view kMainBranch = "main";

  struct ICECAT_EXPORT Branch {
    /// A positive number for the minimum number of snapshots to keep in a branch while
    /// expiring snapshots.
    std::optional<int32_t> min_snapshots_to_keep;
    /// A positive number for the max age of snapshots to keep when expiring,
    /// including the latest snapshot.
    std::optional<int64_t> max_snapshot_age_ms;
    /// For snapshot references except the main branch, a positive number for the max age
    /// of the snapshot reference to keep while expiring snapshots.
    std::optional<int64_t> max_ref_age_ms;

    friend bool operator==(const Branch& lhs, const Branch& rhs) = default;
  };

  struct ICECAT_EXPORT Tag {
    /// A positive number for the max age of the tag to keep while expiring snapshots.
    std::optional<int64_t> max_ref_age_ms;

    friend bool operator==(const Tag& lhs, const Tag& rhs) = default;
  };

  /// A reference's snapshot ID. The tagged snapshot or latest snapshot of a branch.
  int64_t snapshot_id;
  /// Snapshot retention policy
  std::variant<Branch, Tag> retention;

  SnapshotRefType type() const noexcept;

  friend bool operator==(const SnapshotRef& lhs, const SnapshotRef& rhs) = default;
};

}  // namespace icecat
