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


#include <ostream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include "authorizer/authorizer.hpp"

using std::ostream;
using std::string;
using std::vector;

namespace gridware {
namespace internal {

Try<MethodPolicy> MethodPolicy::parse(const string& text)
{
  string list = strings::trim(text);
  Combinator combinator = ANY;

  if (strings::startsWith(list, "all:")) {
    combinator = ALL;
    list = list.substr(4);
  } else if (strings::startsWith(list, "any:")) {
    list = list.substr(4);
  } else if (list.find(':') != string::npos) {
    return Error("Unknown combinator in policy '" + text + "'");
  }

  hashset<string> required;

  foreach (const string& property, strings::tokenize(list, ",")) {
    const string trimmed = strings::trim(property);
    if (!trimmed.empty()) {
      required.insert(trimmed);
    }
  }

  return MethodPolicy(combinator, required);
}


bool operator==(const MethodPolicy& left, const MethodPolicy& right)
{
  return left.combinator == right.combinator &&
    left.required == right.required;
}


ostream& operator<<(ostream& stream, const MethodPolicy& policy)
{
  return stream << (policy.combinator == MethodPolicy::ALL ? "all:" : "any:")
                << strings::join(",", policy.required);
}


bool authorize(const Credential& credential, const MethodPolicy& policy)
{
  // An empty policy only requires a verified identity, which every
  // credential reaching this point has.
  if (policy.required.empty()) {
    return true;
  }

  switch (policy.combinator) {
    case MethodPolicy::ANY:
      foreach (const string& property, policy.required) {
        if (credential.hasProperty(property)) {
          return true;
        }
      }
      return false;

    case MethodPolicy::ALL:
      foreach (const string& property, policy.required) {
        if (!credential.hasProperty(property)) {
          return false;
        }
      }
      return true;
  }

  return false;
}


Outcome<Nothing> authorized(
    const Credential& credential,
    const MethodPolicy& policy)
{
  if (!authorize(credential, policy)) {
    VLOG(1) << "Denied " << credential << " holding properties "
            << strings::join(",", credential.properties())
            << " against policy " << policy;

    return GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query");
  }

  return Nothing();
}


Try<GroupProperties> groupProperties(const Configuration& configuration)
{
  const string section = "/Registry/Groups";

  Try<vector<string>> groups =
    require(configuration.getSections(section), section);

  if (groups.isError()) {
    return Error(groups.error());
  }

  GroupProperties result;

  foreach (const string& group, groups.get()) {
    const string key = path::join(section, group, "Properties");

    Result<vector<string>> properties = configuration.getList(key);
    if (properties.isError()) {
      return Error(
          "Invalid value of configuration key '" + key + "': " +
          properties.error());
    }

    // A group without properties is valid; it grants nothing.
    result[group] = hashset<string>();

    if (properties.isSome()) {
      foreach (const string& property, properties.get()) {
        result[group].insert(property);
      }
    }
  }

  return result;
}


Try<MethodPolicy> configuredPolicy(
    const Configuration& configuration,
    const string& section,
    const string& method,
    const Option<MethodPolicy>& policy)
{
  const string key = path::join(section, "Authorization", method);

  Result<string> configured = configuration.getString(key);
  if (configured.isError()) {
    return Error(
        "Invalid value of configuration key '" + key + "': " +
        configured.error());
  }

  if (configured.isSome()) {
    return MethodPolicy::parse(configured.get());
  }

  if (policy.isSome()) {
    return policy.get();
  }

  const string fallback = path::join(section, "Authorization", "Default");

  configured = configuration.getString(fallback);
  if (configured.isError()) {
    return Error(
        "Invalid value of configuration key '" + fallback + "': " +
        configured.error());
  }

  if (configured.isSome()) {
    return MethodPolicy::parse(configured.get());
  }

  return MethodPolicy::any({property::SERVICE_ADMINISTRATOR});
}

} // namespace internal {
} // namespace gridware {
