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

/// \file icecat/document.h
/// An opaque structured value (table metadata, storage profile, retention
/// policy) that the catalog stores and returns without interpreting it.

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "icecat/icecat_export.h"
#include "icecat/result.h"

namespace icecat {

/// \brief A JSON document passed through the catalog unparsed in meaning.
///
/// The only place a Document is converted to or from text is the storage
/// boundary (Parse / Serialize).
class ICECAT_EXPORT Document {
 public:
  /// \brief Create a JSON null document.
  Document() = default;

  explicit Document(nlohmann::json value) : value_(std::move(value)) {}

  /// \brief Parse a document from its stored text form.
  ///
  /// \return the document, or ErrorKind::kJsonParseError if the text is not JSON
  static Result<Document> Parse(std::string_view text);

  /// \brief Serialize the document to its compact text form.
  Result<std::string> Serialize() const;

  const nlohmann::json& value() const { return value_; }

  bool is_null() const { return value_.is_null(); }

  friend bool operator==(const Document& lhs, const Document& rhs) {
    return lhs.value_ == rhs.value_;
  }

 private:
  nlohmann::json value_;
};

}  // namespace icecat
