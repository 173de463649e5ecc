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

#include "icecat/document.h"

#include "icecat/json_internal.h"
#include "icecat/util/macros.h"

namespace icecat {

Result<Document> Document::Parse(std::string_view text) {
  ICECAT_ASSIGN_OR_RAISE(auto json, FromJsonString(text));
  return Document(std::move(json));
}

Result<std::string> Document::Serialize() const { return ToJsonString(value_); }

}  // namespace icecat
