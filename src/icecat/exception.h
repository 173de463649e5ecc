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

/// \file icecat/exception.h
/// Common exception types for icecat.  Note that this library primarily uses
/// return values for error handling, not exceptions.  Some operations,
/// however, will throw exceptions in contexts where no other option is
/// available (e.g. a constructor or a config value that cannot be converted).
/// In those cases, an exception type from here will be used.

#include <stdexcept>
#include <string>

#include "icecat/icecat_export.h"

namespace icecat {

/// \brief Base exception class for exceptions thrown by the icecat library.
class ICECAT_EXPORT IcecatError : public std::runtime_error {
 public:
  explicit IcecatError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace icecat
