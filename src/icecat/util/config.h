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

/// \file icecat/util/config.h
/// \brief Typed key/value configuration on top of a string map.

#include <format>
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>

#include "icecat/exception.h"
#include "icecat/result.h"

namespace icecat {
namespace internal {

template <typename U>
std::string DefaultToString(const U& val) {
  if constexpr (std::is_same_v<U, bool>) {
    return val ? "true" : "false";
  } else if constexpr (std::is_integral_v<U> || std::is_floating_point_v<U>) {
    return std::to_string(val);
  } else if constexpr (std::is_same_v<U, std::string>) {
    return val;
  } else {
    throw IcecatError(
        std::format("Explicit to_str() is required for {}", typeid(U).name()));
  }
}

template <typename U>
U DefaultFromString(const std::string& val) {
  if constexpr (std::is_same_v<U, std::string>) {
    return val;
  } else if constexpr (std::is_same_v<U, bool>) {
    if (val == "true") return true;
    if (val == "false") return false;
    throw IcecatError(std::format("'{}' is not a boolean", val));
  } else if constexpr (std::is_integral_v<U>) {
    return static_cast<U>(std::stoll(val));
  } else if constexpr (std::is_floating_point_v<U>) {
    return static_cast<U>(std::stod(val));
  } else {
    throw IcecatError(
        std::format("Explicit from_str() is required for {}", typeid(U).name()));
  }
}

}  // namespace internal

/// \brief CRTP base for a set of typed configuration entries.
///
/// Values are kept as strings; an Entry knows its key, its default and how to
/// convert to and from the string form.
template <class ConcreteConfig>
class ConfigBase {
 public:
  template <typename T>
  class Entry {
   public:
    Entry(std::string key, const T& val,
          std::function<std::string(const T&)> to_str = internal::DefaultToString<T>,
          std::function<T(const std::string&)> from_str = internal::DefaultFromString<T>)
        : key_{std::move(key)}, default_{val}, to_str_{to_str}, from_str_{from_str} {}

   private:
    const std::string key_;
    const T default_;
    const std::function<std::string(const T&)> to_str_;
    const std::function<T(const std::string&)> from_str_;

    friend ConfigBase;
    friend ConcreteConfig;

   public:
    const std::string& key() const { return key_; }

    const T& value() const { return default_; }
  };

  template <typename T>
  ConfigBase& Set(const Entry<T>& entry, const T& val) {
    configs_.insert_or_assign(entry.key_, entry.to_str_(val));
    return *this;
  }

  template <typename T>
  ConfigBase& Unset(const Entry<T>& entry) {
    configs_.erase(entry.key_);
    return *this;
  }

  ConfigBase& Reset() {
    configs_.clear();
    return *this;
  }

  /// \brief Get the configured value, or the entry default when unset.
  ///
  /// \throw IcecatError if the stored string cannot be converted.
  template <typename T>
  T Get(const Entry<T>& entry) const {
    auto iter = configs_.find(entry.key_);
    if (iter == configs_.cend()) {
      return entry.default_;
    }
    try {
      return entry.from_str_(iter->second);
    } catch (const IcecatError&) {
      throw;
    } catch (const std::exception& e) {
      throw IcecatError(std::format("Invalid value '{}' for configuration '{}': {}",
                                    iter->second, entry.key_, e.what()));
    }
  }

  /// \brief Same as Get, but reports a bad value as kInvalidArgument.
  template <typename T>
  Result<T> TryGet(const Entry<T>& entry) const {
    try {
      return Get(entry);
    } catch (const IcecatError& e) {
      return InvalidArgument("{}", e.what());
    }
  }

  const std::unordered_map<std::string, std::string>& configs() const { return configs_; }

 protected:
  std::unordered_map<std::string, std::string> configs_;
};

}  // namespace icecat
