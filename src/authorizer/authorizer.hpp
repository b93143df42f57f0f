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


#ifndef __AUTHORIZER_AUTHORIZER_HPP__
#define __AUTHORIZER_AUTHORIZER_HPP__

#include <ostream>
#include <string>

#include <gridware/configuration.hpp>
#include <gridware/credential.hpp>
#include <gridware/outcome.hpp>

#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace gridware {
namespace internal {

// The properties a caller needs to invoke a method.
struct MethodPolicy
{
  enum Combinator
  {
    ANY, // At least one of the required properties.
    ALL  // Every required property.
  };

  MethodPolicy() : combinator(ANY) {}

  MethodPolicy(Combinator _combinator, const hashset<std::string>& _required)
    : combinator(_combinator), required(_required) {}

  static MethodPolicy any(const hashset<std::string>& required)
  {
    return MethodPolicy(ANY, required);
  }

  static MethodPolicy all(const hashset<std::string>& required)
  {
    return MethodPolicy(ALL, required);
  }

  // Admits every authenticated caller.
  static MethodPolicy authenticated()
  {
    return MethodPolicy();
  }

  // Parses the configuration form of a policy: a comma separated list
  // of properties, optionally prefixed by "any:" or "all:". A bare
  // list means "any". An empty list admits every authenticated caller.
  static Try<MethodPolicy> parse(const std::string& text);

  Combinator combinator;
  hashset<std::string> required;
};


bool operator==(const MethodPolicy& left, const MethodPolicy& right);

std::ostream& operator<<(std::ostream& stream, const MethodPolicy& policy);


bool authorize(const Credential& credential, const MethodPolicy& policy);


// Like 'authorize' but reports a denial as an UNAUTHORIZED failure
// that does not reveal which property was missing.
Outcome<Nothing> authorized(
    const Credential& credential,
    const MethodPolicy& policy);


// Reads the properties of every group below "/Registry/Groups". The
// section is required.
Try<GroupProperties> groupProperties(const Configuration& configuration);


// Returns the policy of 'method' of a service:
//   <section>/Authorization/<method> if configured, else
//   'policy' if given, else
//   <section>/Authorization/Default if configured, else
//   a policy admitting only ServiceAdministrator callers.
Try<MethodPolicy> configuredPolicy(
    const Configuration& configuration,
    const std::string& section,
    const std::string& method,
    const Option<MethodPolicy>& policy);

} // namespace internal {
} // namespace gridware {

#endif // __AUTHORIZER_AUTHORIZER_HPP__
