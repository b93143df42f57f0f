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


#ifndef __MATCHER_REQUIREMENTS_HPP__
#define __MATCHER_REQUIREMENTS_HPP__

#include <memory>
#include <string>

#include <gridware/configuration.hpp>
#include <gridware/gridware.hpp>

#include <stout/option.hpp>

namespace gridware {
namespace internal {

// Returns None if the resource satisfies the requirements of the job
// and the reason it does not otherwise.
Option<std::string> mismatch(const JobInfo& job, const ResourceInfo& resource);


inline bool satisfies(const ResourceInfo& resource, const JobInfo& job)
{
  return mismatch(job, resource).isNone();
}


// Decides whether jobs of a group may run at a site. A site restricts
// its groups through "/Resources/Sites/<site>/AllowedGroups"; a site
// without that key admits every group.
class SiteAccess
{
public:
  // Admits every group at every site.
  SiteAccess() {}

  explicit SiteAccess(
      const std::shared_ptr<const Configuration>& _configuration)
    : configuration(_configuration) {}

  bool permitted(const std::string& group, const std::string& site) const;

private:
  std::shared_ptr<const Configuration> configuration;
};

} // namespace internal {
} // namespace gridware {

#endif // __MATCHER_REQUIREMENTS_HPP__
