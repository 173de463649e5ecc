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

#include "icecat/identifier.h"

namespace icecat {

std::string_view ToString(WarehouseStatus status) {
  switch (status) {
    case WarehouseStatus::kActive:
      return "active";
    case WarehouseStatus::kInactive:
      return "inactive";
  }
  return "inactive";
}

Result<WarehouseStatus> WarehouseStatusFromString(std::string_view str) {
  if (str == "active") return WarehouseStatus::kActive;
  if (str == "inactive") return WarehouseStatus::kInactive;
  return InvalidArgument("Invalid warehouse status: {}", str);
}

}  // namespace icecat
