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

/// \file icecat/util/logging.h
/// \brief The library logger.

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

#include "icecat/icecat_export.h"
#include "icecat/result.h"

namespace icecat {

/// \brief Name under which the library logger is registered with spdlog.
inline constexpr std::string_view kLoggerName = "icecat";

/// \brief The library logger, created on first use and writing to stderr.
///
/// Applications that install their own sink can register a logger named
/// kLoggerName before the first catalog call.
ICECAT_EXPORT std::shared_ptr<spdlog::logger> Logger();

/// \brief Set the level of the library logger from its name ("debug", "info", ...).
ICECAT_EXPORT Status SetLogLevel(std::string_view level);

}  // namespace icecat
