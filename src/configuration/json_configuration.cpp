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

#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/strings.hpp>

#include "configuration/json_configuration.hpp"

using std::string;
using std::vector;

namespace gridware {
namespace internal {

Try<JsonConfiguration> JsonConfiguration::parse(const string& json)
{
  Try<JSON::Object> document = JSON::parse<JSON::Object>(json);
  if (document.isError()) {
    return Error("Failed to parse configuration: " + document.error());
  }

  return JsonConfiguration(document.get());
}


Result<JSON::Value> JsonConfiguration::get(const string& path) const
{
  const vector<string> names = strings::tokenize(path, "/");

  if (names.empty()) {
    return JSON::Value(document);
  }

  const JSON::Object* section = &document;

  for (size_t i = 0; i < names.size(); i++) {
    auto value = section->values.find(names[i]);
    if (value == section->values.end()) {
      return None();
    }

    if (i + 1 == names.size()) {
      return value->second;
    }

    if (!value->second.is<JSON::Object>()) {
      return Error(
          "'" + names[i] + "' of '" + path + "' is not a section");
    }

    section = &value->second.as<JSON::Object>();
  }

  return None();
}

} // namespace internal {
} // namespace gridware {
