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

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/none.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include "matcher/requirements.hpp"

using std::string;
using std::vector;

namespace gridware {
namespace internal {

Option<string> mismatch(const JobInfo& job, const ResourceInfo& resource)
{
  if (resource.owner_groups_size() > 0) {
    bool owned = false;
    foreach (const string& group, resource.owner_groups()) {
      if (group == job.group()) {
        owned = true;
        break;
      }
    }

    if (!owned) {
      return "group '" + job.group() + "' is not served by the resource";
    }
  }

  if (!job.has_requirements()) {
    return None();
  }

  const JobRequirements& requirements = job.requirements();

  if (requirements.has_platform() &&
      requirements.platform() != resource.platform()) {
    return "platform '" + resource.platform() + "' instead of '" +
      requirements.platform() + "'";
  }

  if (requirements.sites_size() > 0) {
    bool listed = false;
    foreach (const string& site, requirements.sites()) {
      if (site == resource.site()) {
        listed = true;
        break;
      }
    }

    if (!listed) {
      return "site '" + resource.site() + "' is not requested";
    }
  }

  foreach (const string& site, requirements.banned_sites()) {
    if (site == resource.site()) {
      return "site '" + resource.site() + "' is banned";
    }
  }

  if (requirements.has_min_memory_mb() &&
      resource.memory_mb() < requirements.min_memory_mb()) {
    return stringify(resource.memory_mb()) + " MB of memory instead of " +
      stringify(requirements.min_memory_mb());
  }

  if (requirements.has_min_cpus() &&
      resource.cpus() < requirements.min_cpus()) {
    return stringify(resource.cpus()) + " CPUs instead of " +
      stringify(requirements.min_cpus());
  }

  // A resource that does not announce its remaining CPU time is not
  // limited by it.
  if (requirements.has_cpu_time() &&
      resource.has_cpu_time_left() &&
      resource.cpu_time_left() < requirements.cpu_time()) {
    return stringify(resource.cpu_time_left()) + "s of CPU time instead of " +
      stringify(requirements.cpu_time());
  }

  if (requirements.tags_size() > 0) {
    hashset<string> tags;
    foreach (const string& tag, resource.tags()) {
      tags.insert(tag);
    }

    foreach (const string& tag, requirements.tags()) {
      if (!tags.contains(tag)) {
        return "tag '" + tag + "' is missing";
      }
    }
  }

  return None();
}


bool SiteAccess::permitted(const string& group, const string& site) const
{
  if (!configuration) {
    return true;
  }

  const string key = path::join("/Resources/Sites", site, "AllowedGroups");

  Result<vector<string>> allowed = configuration->getList(key);
  if (allowed.isError()) {
    LOG(WARNING) << "Denying access to site '" << site << "' because of an "
                 << "invalid value of '" << key << "': " << allowed.error();
    return false;
  }

  if (allowed.isNone()) {
    return true;
  }

  foreach (const string& entry, allowed.get()) {
    if (entry == group) {
      return true;
    }
  }

  return false;
}

} // namespace internal {
} // namespace gridware {
