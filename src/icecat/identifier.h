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

/// \file icecat/identifier.h
/// Strongly typed UUID identifiers for the catalog entities and the warehouse
/// lifecycle status.

#include <compare>
#include <functional>
#include <string>
#include <string_view>

#include "icecat/icecat_export.h"
#include "icecat/result.h"
#include "icecat/util/uuid.h"

namespace icecat {

/// \brief A UUID that can only be compared with ids of the same entity kind.
///
/// \tparam Tag an empty struct with a `kName` member naming the entity, used in
/// parse error messages.
template <typename Tag>
class Identifier {
 public:
  explicit Identifier(Uuid uuid) : uuid_(uuid) {}

  /// \brief Generate a new time-ordered id.
  static Identifier Generate() { return Identifier(Uuid::GenerateV7()); }

  /// \brief Parse an id from its UUID text form.
  static Result<Identifier> FromString(std::string_view str) {
    auto uuid = Uuid::FromString(str);
    if (!uuid.has_value()) {
      return InvalidArgument("Provided {} id is not a valid UUID: '{}'", Tag::kName, str);
    }
    return Identifier(uuid.value());
  }

  const Uuid& uuid() const { return uuid_; }

  std::string ToString() const { return uuid_.ToString(); }

  friend bool operator==(const Identifier& lhs, const Identifier& rhs) {
    return lhs.uuid_ == rhs.uuid_;
  }

  friend std::strong_ordering operator<=>(const Identifier& lhs, const Identifier& rhs) {
    return lhs.uuid_ <=> rhs.uuid_;
  }

 private:
  Uuid uuid_;
};

struct ProjectIdTag {
  static constexpr std::string_view kName = "project";
};
struct WarehouseIdTag {
  static constexpr std::string_view kName = "warehouse";
};
struct NamespaceIdTag {
  static constexpr std::string_view kName = "namespace";
};
struct TableIdTag {
  static constexpr std::string_view kName = "table";
};

using ProjectId = Identifier<ProjectIdTag>;
using WarehouseId = Identifier<WarehouseIdTag>;
using NamespaceId = Identifier<NamespaceIdTag>;
using TableId = Identifier<TableIdTag>;

/// \brief Lifecycle status of a warehouse.
enum class WarehouseStatus {
  /// The warehouse is active and can be used
  kActive,
  /// The warehouse is inactive and cannot be used.
  kInactive,
};

/// \brief Get the stored (kebab-case) name of a warehouse status.
ICECAT_EXPORT std::string_view ToString(WarehouseStatus status);

/// \brief Parse a warehouse status from its stored name.
ICECAT_EXPORT Result<WarehouseStatus> WarehouseStatusFromString(std::string_view str);

}  // namespace icecat

template <typename Tag>
struct std::hash<icecat::Identifier<Tag>> {
  size_t operator()(const icecat::Identifier<Tag>& id) const noexcept {
    return std::hash<icecat::Uuid>{}(id.uuid());
  }
};
