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


#include <ctype.h>

#include <string>

#include <google/protobuf/repeated_field.h>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/none.hpp>
#include <stout/strings.hpp>

#include "matcher/validation.hpp"

using google::protobuf::RepeatedPtrField;

using std::string;

namespace gridware {
namespace internal {
namespace validation {

namespace {

Option<Error> validateList(
    const RepeatedPtrField<string>& entries,
    const string& field)
{
  foreach (const string& entry, entries) {
    if (strings::trim(entry).empty()) {
      return Error("'" + field + "' must not contain empty entries");
    }
  }

  return None();
}

} // namespace {


Option<Error> validateId(const string& id)
{
  if (id.empty()) {
    return Error("ID must not be empty");
  }

  if (id.size() > 255) {
    return Error("ID must not be longer than 255 characters");
  }

  foreach (char c, id) {
    if (iscntrl(static_cast<unsigned char>(c)) || c == '/') {
      return Error("ID '" + id + "' contains invalid characters");
    }
  }

  return None();
}


namespace job {

Option<Error> validate(const JobRequirements& requirements)
{
  Option<Error> error = validateList(requirements.sites(), "sites");
  if (error.isSome()) {
    return error;
  }

  error = validateList(requirements.banned_sites(), "banned_sites");
  if (error.isSome()) {
    return error;
  }

  error = validateList(requirements.tags(), "tags");
  if (error.isSome()) {
    return error;
  }

  if (requirements.has_platform() &&
      strings::trim(requirements.platform()).empty()) {
    return Error("'platform' must not be empty when set");
  }

  // A whitelist entirely covered by the blacklist can never match.
  if (requirements.sites_size() > 0) {
    hashset<string> banned;
    foreach (const string& site, requirements.banned_sites()) {
      banned.insert(site);
    }

    bool eligible = false;
    foreach (const string& site, requirements.sites()) {
      if (!banned.contains(site)) {
        eligible = true;
        break;
      }
    }

    if (!eligible) {
      return Error("Every site of 'sites' is also in 'banned_sites'");
    }
  }

  return None();
}


Option<Error> validate(const JobInfo& job)
{
  if (!job.IsInitialized()) {
    return Error("Not initialized: " + job.InitializationErrorString());
  }

  if (strings::trim(job.owner()).empty()) {
    return Error("Expecting 'owner' to be present");
  }

  if (strings::trim(job.group()).empty()) {
    return Error("Expecting 'group' to be present");
  }

  if (job.has_idempotency_token() && job.idempotency_token().empty()) {
    return Error("'idempotency_token' must not be empty when set");
  }

  if (job.has_requirements()) {
    return validate(job.requirements());
  }

  return None();
}

} // namespace job {


namespace resource {

Option<Error> validate(const ResourceInfo& resource)
{
  if (!resource.IsInitialized()) {
    return Error("Not initialized: " + resource.InitializationErrorString());
  }

  Option<Error> error = validateId(resource.id().value());
  if (error.isSome()) {
    return Error("Invalid resource ID: " + error->message);
  }

  if (strings::trim(resource.site()).empty()) {
    return Error("Expecting 'site' to be present");
  }

  error = validateList(resource.tags(), "tags");
  if (error.isSome()) {
    return error;
  }

  return validateList(resource.owner_groups(), "owner_groups");
}

} // namespace resource {

} // namespace validation {
} // namespace internal {
} // namespace gridware {
