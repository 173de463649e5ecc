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

#include "icecat/catalog_properties.h"

#include <algorithm>
#include <array>
#include <string_view>

#include "icecat/util/macros.h"

namespace icecat {

namespace {

constexpr std::array<std::string_view, 6> kJournalModes = {
    "delete", "truncate", "persist", "memory", "wal", "off"};

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

}  // namespace

std::unique_ptr<CatalogProperties> CatalogProperties::default_properties() {
  return std::unique_ptr<CatalogProperties>(new CatalogProperties());
}

std::unique_ptr<CatalogProperties> CatalogProperties::FromMap(
    const std::unordered_map<std::string, std::string>& properties) {
  auto catalog_config = std::unique_ptr<CatalogProperties>(new CatalogProperties());
  catalog_config->configs_ = properties;
  return catalog_config;
}

Status CatalogProperties::Validate() const {
  ICECAT_ASSIGN_OR_RAISE(auto path, TryGet(kDatabasePath));
  if (path.empty()) {
    return InvalidArgument("Catalog configuration property '{}' must not be empty",
                           kDatabasePath.key());
  }

  ICECAT_ASSIGN_OR_RAISE(auto busy_timeout_ms, TryGet(kBusyTimeoutMs));
  if (busy_timeout_ms < 0) {
    return InvalidArgument("Catalog configuration property '{}' must not be negative: {}",
                           kBusyTimeoutMs.key(), busy_timeout_ms);
  }

  ICECAT_ASSIGN_OR_RAISE(auto journal_mode, TryGet(kJournalMode));
  if (std::ranges::find(kJournalModes, journal_mode) == kJournalModes.end()) {
    return InvalidArgument("Unknown journal mode '{}'", journal_mode);
  }

  ICECAT_ASSIGN_OR_RAISE(auto log_level, TryGet(kLogLevel));
  if (std::ranges::find(kLogLevels, log_level) == kLogLevels.end()) {
    return InvalidArgument("Unknown log level '{}'", log_level);
  }
  return {};
}

}  // namespace icecat
