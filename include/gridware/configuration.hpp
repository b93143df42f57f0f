// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __GRIDWARE_CONFIGURATION_HPP__
#define __GRIDWARE_CONFIGURATION_HPP__

#include <string>
#include <vector>

#include <stout/error.hpp>
#include <stout/json.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace gridware {

/**
 * Read-only view of the hierarchical configuration service. Keys are
 * addressed by '/' separated paths, e.g. "/Registry/Groups". Values
 * are JSON values; sections are JSON objects.
 *
 * Implementations must be safe to use from multiple threads.
 */
class Configuration
{
public:
  virtual ~Configuration() {}

  // Returns None if the path does not exist and an Error if an
  // intermediate element of the path is not a section.
  virtual Result<JSON::Value> get(const std::string& path) const = 0;

  Result<std::string> getString(const std::string& path) const;

  // Accepts numbers and strings holding a number.
  Result<double> getNumber(const std::string& path) const;

  // Accepts booleans and the strings "true", "false", "yes", "no".
  Result<bool> getBoolean(const std::string& path) const;

  // Accepts arrays of strings and comma separated strings. Entries are
  // trimmed; empty entries are dropped.
  Result<std::vector<std::string>> getList(const std::string& path) const;

  // Returns the names of the sections below the path.
  Result<std::vector<std::string>> getSections(const std::string& path) const;
};


// Turns an absent or invalid value of a key the caller cannot do
// without into an Error naming the key.
template <typename T>
Try<T> require(const Result<T>& result, const std::string& path)
{
  if (result.isError()) {
    return Error(
        "Invalid value of configuration key '" + path + "': " +
        result.error());
  }

  if (result.isNone()) {
    return Error("Missing required configuration key '" + path + "'");
  }

  return result.get();
}

} // namespace gridware {

#endif // __GRIDWARE_CONFIGURATION_HPP__
