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

/// \file icecat/store/catalog_schema.h
/// \brief Relations backing the catalog.
///
/// warehouse 1-n namespace 1-n tabular 1-1 table 1-n table_refs. Ids are stored
/// as lower-case hyphenated UUID text, documents as JSON text and timestamps as
/// Unix milliseconds.

#include "icecat/icecat_export.h"
#include "icecat/result.h"
#include "icecat/sqlite/database.h"

namespace icecat {

/// \brief Create the catalog relations if they do not exist yet.
ICECAT_EXPORT Status CreateCatalogSchema(sqlite::Database& db);

}  // namespace icecat
