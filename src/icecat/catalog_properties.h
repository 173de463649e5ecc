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

#include <memory>
#include <string>
#include <unordered_map>

#include "icecat/icecat_export.h"
#include "icecat/result.h"
#include "icecat/util/config.h"

/// \file icecat/catalog_properties.h
/// \brief Configuration of a catalog store.

namespace icecat {

/// \brief Configuration class for a SQL catalog store.
class ICECAT_EXPORT CatalogProperties : public ConfigBase<CatalogProperties> {
 public:
  template <typename T>
  using Entry = const ConfigBase<CatalogProperties>::Entry<T>;

  /// \brief Path of the catalog database file, or ":memory:".
  inline static Entry<std::string> kDatabasePath{"database.path", ":memory:"};
  /// \brief How long a statement waits for a lock held by another connection.
  inline static Entry<int64_t> kBusyTimeoutMs{"database.busy-timeout-ms", 5000};
  /// \brief SQLite journal mode. In-memory databases ignore it.
  inline static Entry<std::string> kJournalMode{"database.journal-mode", "wal"};
  /// \brief Level of the "icecat" logger: trace, debug, info, warn, error, critical, off.
  inline static Entry<std::string> kLogLevel{"log.level", "info"};

  /// \brief Create a default CatalogProperties instance.
  static std::unique_ptr<CatalogProperties> default_properties();

  /// \brief Create a CatalogProperties instance from a map of key-value pairs.
  static std::unique_ptr<CatalogProperties> FromMap(
      const std::unordered_map<std::string, std::string>& properties);

  /// \brief Check that every configured value converts and is in range.
  Status Validate() const;

 private:
  CatalogProperties() = default;
};

}  // namespace icecat
