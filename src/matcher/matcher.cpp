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


#include <algorithm>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>

#include "matcher/matcher.hpp"

using std::string;
using std::vector;

namespace gridware {
namespace internal {

constexpr size_t Matcher::DEFAULT_MAX_ATTEMPTS;


Matcher::Matcher(
    JobQueue* _queue,
    FairShare* _fairShare,
    const std::shared_ptr<const Configuration>& _configuration,
    const MethodPolicy& _policy,
    size_t _maxAttempts)
  : queue(_queue),
    fairShare(_fairShare),
    configuration(_configuration),
    access(_configuration),
    policy(_policy),
    maxAttempts(_maxAttempts)
{
  CHECK_NOTNULL(queue);
  CHECK_NOTNULL(fairShare);
  CHECK_GT(maxAttempts, 0u);
}


Outcome<Option<JobInfo>> Matcher::requestMatch(
    const ResourceInfo& resource,
    const Credential& credential)
{
  Outcome<Nothing> authorization = authorized(credential, policy);
  if (authorization.isError()) {
    return authorization.error();
  }

  if (resource.has_capacity() && resource.load() >= resource.capacity()) {
    VLOG(1) << "Resource " << resource.id() << " is at capacity ("
            << resource.load() << "/" << resource.capacity() << ")";
    return Option<JobInfo>::none();
  }

  if (configuration) {
    Try<Nothing> configure = fairShare->configure(*configuration);
    if (configure.isError()) {
      LOG(WARNING) << "Keeping the previous fair share settings: "
                   << configure.error();
    }
  }

  JobQueue::Candidates candidates = queue->peekCandidates(resource, access);

  size_t attempts = 0;
  Option<JobInfo> pending = candidates.next();

  while (pending.isSome() && attempts < maxAttempts) {
    // Collect the candidates of equal priority.
    vector<JobInfo> tier = {pending.get()};
    hashset<string> groups = {pending->group()};

    pending = candidates.next();
    while (pending.isSome() && pending->priority() == tier[0].priority()) {
      tier.push_back(pending.get());
      groups.insert(pending->group());
      pending = candidates.next();
    }

    if (groups.size() > 1) {
      const hashset<string> exceeded = fairShare->exceeded(groups);

      std::stable_partition(
          tier.begin(),
          tier.end(),
          [&exceeded](const JobInfo& job) {
            return !exceeded.contains(job.group());
          });
    }

    foreach (const JobInfo& job, tier) {
      if (attempts >= maxAttempts) {
        break;
      }

      attempts++;

      Outcome<JobInfo> claim = queue->claim(job.job_id(), resource.id());

      if (claim.isSome()) {
        fairShare->matched(job.group());

        LOG(INFO) << "Matched job " << job.job_id() << " of group '"
                  << job.group() << "' to resource " << resource.id()
                  << " at site '" << resource.site() << "' of "
                  << credential;

        return Option<JobInfo>(claim.get());
      }

      if (claim.error().code != ErrorInfo::ALREADY_MATCHED) {
        return claim.error().wrap(
            "Failed to claim job " + job.job_id().value());
      }

      VLOG(1) << "Job " << job.job_id() << " was claimed concurrently";
    }
  }

  VLOG(1) << "No work for resource " << resource.id() << " after "
          << attempts << " attempt(s)";

  return Option<JobInfo>::none();
}

} // namespace internal {
} // namespace gridware {
