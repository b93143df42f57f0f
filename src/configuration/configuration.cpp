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


#include <string>
#include <vector>

#include <gridware/configuration.hpp>

#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/numify.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

using std::string;
using std::vector;

namespace gridware {

Result<string> Configuration::getString(const string& path) const
{
  Result<JSON::Value> value = get(path);
  if (!value.isSome()) {
    return value.isError() ? Result<string>(Error(value.error())) : None();
  }

  if (value->is<JSON::String>()) {
    return value->as<JSON::String>().value;
  }

  if (value->is<JSON::Number>() || value->is<JSON::Boolean>()) {
    return stringify(value.get());
  }

  return Error("Expecting a string");
}


Result<double> Configuration::getNumber(const string& path) const
{
  Result<JSON::Value> value = get(path);
  if (!value.isSome()) {
    return value.isError() ? Result<double>(Error(value.error())) : None();
  }

  if (value->is<JSON::Number>()) {
    return value->as<JSON::Number>().as<double>();
  }

  if (value->is<JSON::String>()) {
    Try<double> number =
      numify<double>(strings::trim(value->as<JSON::String>().value));

    if (number.isError()) {
      return Error("Expecting a number: " + number.error());
    }

    return number.get();
  }

  return Error("Expecting a number");
}


Result<bool> Configuration::getBoolean(const string& path) const
{
  Result<JSON::Value> value = get(path);
  if (!value.isSome()) {
    return value.isError() ? Result<bool>(Error(value.error())) : None();
  }

  if (value->is<JSON::Boolean>()) {
    return value->as<JSON::Boolean>().value;
  }

  if (value->is<JSON::String>()) {
    const string text = strings::lower(
        strings::trim(value->as<JSON::String>().value));

    if (text == "true" || text == "yes") {
      return true;
    } else if (text == "false" || text == "no") {
      return false;
    }
  }

  return Error("Expecting a boolean");
}


Result<vector<string>> Configuration::getList(const string& path) const
{
  Result<JSON::Value> value = get(path);
  if (!value.isSome()) {
    return value.isError()
      ? Result<vector<string>>(Error(value.error()))
      : None();
  }

  vector<string> entries;

  if (value->is<JSON::String>()) {
    entries = strings::split(value->as<JSON::String>().value, ",");
  } else if (value->is<JSON::Array>()) {
    foreach (const JSON::Value& entry, value->as<JSON::Array>().values) {
      if (!entry.is<JSON::String>()) {
        return Error("Expecting a list of strings");
      }

      entries.push_back(entry.as<JSON::String>().value);
    }
  } else {
    return Error("Expecting a list");
  }

  vector<string> result;

  foreach (const string& entry, entries) {
    const string trimmed = strings::trim(entry);
    if (!trimmed.empty()) {
      result.push_back(trimmed);
    }
  }

  return result;
}


Result<vector<string>> Configuration::getSections(const string& path) const
{
  Result<JSON::Value> value = get(path);
  if (!value.isSome()) {
    return value.isError()
      ? Result<vector<string>>(Error(value.error()))
      : None();
  }

  if (!value->is<JSON::Object>()) {
    return Error("Expecting a section");
  }

  vector<string> sections;

  foreachkey (const string& key, value->as<JSON::Object>().values) {
    sections.push_back(key);
  }

  return sections;
}

} // namespace gridware {
