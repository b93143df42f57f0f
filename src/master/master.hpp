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


#ifndef __MASTER_MASTER_HPP__
#define __MASTER_MASTER_HPP__

#include <memory>
#include <string>

#include <gridware/configuration.hpp>
#include <gridware/gridware.hpp>
#include <gridware/outcome.hpp>

#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "authorizer/authorizer.hpp"

#include "master/constants.hpp"
#include "master/metrics.hpp"

#include "matcher/fair_share.hpp"
#include "matcher/job_queue.hpp"
#include "matcher/matcher.hpp"
#include "matcher/registry.hpp"

#include "service/dispatcher.hpp"
#include "service/handler.hpp"

namespace gridware {
namespace internal {
namespace master {

// The workload service: resources ask for work, users submit and
// follow jobs. Owns the job queue, the resource registry and the
// fair share state the matcher works on.
class Master
{
public:
  // Reads the policies of the methods below 'section'.
  static Try<process::Owned<Master>> create(
      const std::shared_ptr<const Configuration>& configuration,
      const Duration& resourceSilenceTimeout =
        DEFAULT_RESOURCE_SILENCE_TIMEOUT,
      size_t maxMatchAttempts = Matcher::DEFAULT_MAX_ATTEMPTS,
      const std::string& section = SECTION);

  // Installs every method of the service.
  Try<Nothing> install(Dispatcher* dispatcher);

  // Registers the calling agent's resource, or refreshes it.
  Outcome<ResourceInfo> registerOrRefresh(
      const CallContext& context,
      const ResourceInfo& resource);

  // Refreshes the resource and hands it the best job it can run. A
  // response without job means there is no work.
  Outcome<MatchResponse> requestMatch(
      const CallContext& context,
      const ResourceInfo& resource);

  // Accepted only from the agent of the resource the job is matched
  // to. JOB_WAITING hands the job back, JOB_RUNNING starts it and
  // JOB_DONE or JOB_FAILED completes it.
  Outcome<JobStatus> reportStatus(
      const CallContext& context,
      const JobStatus& status);

  // Queues a job owned by the caller, acting for one of its groups.
  Outcome<SubmitResponse> submit(
      const CallContext& context,
      const JobInfo& job);

  // Kills a waiting or matched job of the caller. Job administrators
  // can kill any job.
  Outcome<JobStatus> cancel(
      const CallContext& context,
      const JobID& jobId);

  Outcome<JobStatus> getJobStatus(
      const CallContext& context,
      const JobID& jobId);

  // Releases the jobs matched to, but not started by, an evicted
  // resource.
  void evicted(const ResourceInfo& resource);

  JobQueue* queue() { return &queue_; }

  ResourceRegistry* registry() { return &registry_; }

  const MethodPolicy& policy(const std::string& method) const
  {
    return policies.at(method);
  }

private:
  Master(
      const std::shared_ptr<const Configuration>& configuration,
      const hashmap<std::string, MethodPolicy>& policies,
      const Duration& resourceSilenceTimeout,
      size_t maxMatchAttempts);

  Master(const Master&) = delete;
  Master& operator=(const Master&) = delete;

  // True if the caller is the agent of the resource the job is
  // matched to.
  bool isMatchedAgent(const CallContext& context, const JobStatus& status);

  const std::shared_ptr<const Configuration> configuration;
  const hashmap<std::string, MethodPolicy> policies;

  JobQueue queue_;
  FairShare fairShare;
  ResourceRegistry registry_;
  Matcher matcher;

  Metrics metrics;
};

} // namespace master {
} // namespace internal {
} // namespace gridware {

#endif // __MASTER_MASTER_HPP__
