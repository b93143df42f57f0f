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


#ifndef __MATCHER_MATCHER_HPP__
#define __MATCHER_MATCHER_HPP__

#include <memory>

#include <gridware/configuration.hpp>
#include <gridware/credential.hpp>
#include <gridware/gridware.hpp>
#include <gridware/outcome.hpp>

#include <stout/option.hpp>

#include "authorizer/authorizer.hpp"

#include "matcher/fair_share.hpp"
#include "matcher/job_queue.hpp"
#include "matcher/requirements.hpp"

namespace gridware {
namespace internal {

// Assigns waiting jobs to resources asking for work.
//
// Candidates are taken from the job queue in queue order. Within a
// group of candidates of equal priority, jobs of groups that have
// exceeded their fair share are tried after the jobs of the other
// groups. A candidate claimed concurrently by another resource is
// skipped; after 'maxAttempts' claims the resource is told there is no
// work.
class Matcher
{
public:
  static constexpr size_t DEFAULT_MAX_ATTEMPTS = 10;

  Matcher(
      JobQueue* _queue,
      FairShare* _fairShare,
      const std::shared_ptr<const Configuration>& _configuration,
      const MethodPolicy& _policy =
        MethodPolicy::any({property::GENERIC_PILOT}),
      size_t _maxAttempts = DEFAULT_MAX_ATTEMPTS);

  // Returns the job matched to the resource, or None if there is no
  // work for it. Never waits for jobs to arrive.
  Outcome<Option<JobInfo>> requestMatch(
      const ResourceInfo& resource,
      const Credential& credential);

private:
  JobQueue* queue;
  FairShare* fairShare;
  std::shared_ptr<const Configuration> configuration;
  SiteAccess access;
  const MethodPolicy policy;
  const size_t maxAttempts;
};

} // namespace internal {
} // namespace gridware {

#endif // __MATCHER_MATCHER_HPP__
