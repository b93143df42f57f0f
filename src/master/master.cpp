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


#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>

#include "master/master.hpp"

using process::Owned;

using std::shared_ptr;
using std::string;
using std::vector;

namespace gridware {
namespace internal {
namespace master {

// The policies that apply unless configured otherwise.
static hashmap<string, MethodPolicy> defaultPolicies()
{
  hashmap<string, MethodPolicy> policies;

  policies["registerOrRefresh"] =
    MethodPolicy::any({property::GENERIC_PILOT});

  policies["requestMatch"] = MethodPolicy::any({property::GENERIC_PILOT});
  policies["reportStatus"] = MethodPolicy::any({property::GENERIC_PILOT});

  policies["submit"] =
    MethodPolicy::any({property::NORMAL_USER, property::JOB_ADMINISTRATOR});

  // Ownership is checked by the methods themselves.
  policies["cancel"] = MethodPolicy::authenticated();
  policies["getJobStatus"] = MethodPolicy::authenticated();

  return policies;
}


Try<Owned<Master>> Master::create(
    const shared_ptr<const Configuration>& configuration,
    const Duration& resourceSilenceTimeout,
    size_t maxMatchAttempts,
    const string& section)
{
  CHECK_NOTNULL(configuration.get());

  const hashmap<string, MethodPolicy> defaults = defaultPolicies();

  hashmap<string, MethodPolicy> policies;

  foreachpair (const string& method, const MethodPolicy& policy, defaults) {
    Try<MethodPolicy> configured =
      configuredPolicy(*configuration, section, method, policy);

    if (configured.isError()) {
      return Error(
          "Failed to read the policy of '" + method + "': " +
          configured.error());
    }

    if (!(configured.get() == policy)) {
      LOG(INFO) << "Using configured policy " << configured.get()
                << " for '" << method << "'";
    }

    policies[method] = configured.get();
  }

  return Owned<Master>(new Master(
      configuration, policies, resourceSilenceTimeout, maxMatchAttempts));
}


Master::Master(
    const shared_ptr<const Configuration>& _configuration,
    const hashmap<string, MethodPolicy>& _policies,
    const Duration& resourceSilenceTimeout,
    size_t maxMatchAttempts)
  : configuration(_configuration),
    policies(_policies),
    registry_(
        resourceSilenceTimeout,
        [this](const ResourceInfo& resource) { evicted(resource); }),
    matcher(
        &queue_,
        &fairShare,
        _configuration,
        _policies.at("requestMatch"),
        maxMatchAttempts) {}


Try<Nothing> Master::install(Dispatcher* dispatcher)
{
  CHECK_NOTNULL(dispatcher);

  vector<Try<Nothing>> installed = {
    dispatcher->install<ResourceInfo, ResourceInfo>(
        "registerOrRefresh",
        policies.at("registerOrRefresh"),
        lambda::bind(
            &Master::registerOrRefresh, this, lambda::_1, lambda::_2)),

    dispatcher->install<ResourceInfo, MatchResponse>(
        "requestMatch",
        policies.at("requestMatch"),
        lambda::bind(&Master::requestMatch, this, lambda::_1, lambda::_2)),

    dispatcher->install<JobStatus, JobStatus>(
        "reportStatus",
        policies.at("reportStatus"),
        lambda::bind(&Master::reportStatus, this, lambda::_1, lambda::_2)),

    dispatcher->install<JobInfo, SubmitResponse>(
        "submit",
        policies.at("submit"),
        lambda::bind(&Master::submit, this, lambda::_1, lambda::_2)),

    dispatcher->install<JobID, JobStatus>(
        "cancel",
        policies.at("cancel"),
        lambda::bind(&Master::cancel, this, lambda::_1, lambda::_2)),

    dispatcher->install<JobID, JobStatus>(
        "getJobStatus",
        policies.at("getJobStatus"),
        lambda::bind(&Master::getJobStatus, this, lambda::_1, lambda::_2)),
  };

  foreach (const Try<Nothing>& result, installed) {
    if (result.isError()) {
      return Error(result.error());
    }
  }

  return Nothing();
}


Outcome<ResourceInfo> Master::registerOrRefresh(
    const CallContext& context,
    const ResourceInfo& resource)
{
  return registry_.registerOrRefresh(resource, context.credential);
}


Outcome<MatchResponse> Master::requestMatch(
    const CallContext& context,
    const ResourceInfo& resource)
{
  Outcome<ResourceInfo> registered =
    registry_.registerOrRefresh(resource, context.credential);

  if (registered.isError()) {
    return registered.error();
  }

  Outcome<Option<JobInfo>> match =
    matcher.requestMatch(registered.get(), context.credential);

  if (match.isError()) {
    return match.error();
  }

  MatchResponse response;

  if (match->isSome()) {
    ++metrics.jobs_matched;
    response.mutable_job()->CopyFrom(match->get());
  }

  return response;
}


bool Master::isMatchedAgent(
    const CallContext& context,
    const JobStatus& status)
{
  if (!status.has_resource_id()) {
    return false;
  }

  Option<ResourceInfo> resource = registry_.get(status.resource_id());

  return resource.isSome() &&
    resource->agent() == context.credential.identity();
}


Outcome<JobStatus> Master::reportStatus(
    const CallContext& context,
    const JobStatus& update)
{
  ++metrics.status_updates;

  Outcome<JobStatus> status = queue_.status(update.job_id());
  if (status.isError()) {
    ++metrics.invalid_status_updates;
    return status.error();
  }

  if (!isMatchedAgent(context, status.get())) {
    ++metrics.invalid_status_updates;

    LOG(WARNING) << "Ignoring status update " << update.state()
                 << " for job " << update.job_id() << " from " << context
                 << " which does not hold the job";

    return GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query");
  }

  Outcome<Nothing> transition = Nothing();

  switch (update.state()) {
    case JOB_WAITING:
      transition = queue_.release(update.job_id());
      if (transition.isSome()) {
        ++metrics.jobs_released;
      }
      break;
    case JOB_RUNNING:
      transition = queue_.start(update.job_id());
      break;
    case JOB_DONE:
    case JOB_FAILED:
      transition =
        queue_.complete(update.job_id(), update.state(), update.message());
      break;
    default:
      transition = GridError(
          ErrorInfo::INVALID_JOB,
          "Agents cannot report state " + stringify(update.state()));
      break;
  }

  if (transition.isError()) {
    ++metrics.invalid_status_updates;
    return transition.error();
  }

  LOG(INFO) << "Job " << update.job_id() << " is now " << update.state()
            << " as reported by " << context;

  return queue_.status(update.job_id());
}


Outcome<SubmitResponse> Master::submit(
    const CallContext& context,
    const JobInfo& _job)
{
  const Credential& credential = context.credential;

  JobInfo job = _job;

  // The queue assigns these.
  job.clear_job_id();
  job.clear_state();
  job.clear_submitted();
  job.clear_resource_id();

  job.set_owner(credential.identity());

  if (job.group().empty() && credential.groups().size() == 1) {
    job.set_group(*credential.groups().begin());
  }

  if (!credential.groups().contains(job.group())) {
    LOG(WARNING) << "Refusing job of " << context << " for group '"
                 << job.group() << "'";

    return GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query");
  }

  Outcome<JobID> jobId = queue_.enqueue(job);
  if (jobId.isError()) {
    return jobId.error();
  }

  ++metrics.jobs_submitted;

  LOG(INFO) << "Queued job " << jobId.get() << " of " << context;

  SubmitResponse response;
  response.mutable_job_id()->CopyFrom(jobId.get());
  return response;
}


Outcome<JobStatus> Master::cancel(
    const CallContext& context,
    const JobID& jobId)
{
  Outcome<JobInfo> job = queue_.get(jobId);
  if (job.isError()) {
    return job.error();
  }

  if (job->owner() != context.credential.identity() &&
      !context.credential.hasProperty(property::JOB_ADMINISTRATOR)) {
    LOG(WARNING) << "Refusing to kill job " << jobId << " of '"
                 << job->owner() << "' for " << context;

    return GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query");
  }

  Outcome<Nothing> kill =
    queue_.kill(jobId, "Killed by " + context.credential.identity());

  if (kill.isError()) {
    return kill.error();
  }

  ++metrics.jobs_killed;

  LOG(INFO) << "Killed job " << jobId << " for " << context;

  return queue_.status(jobId);
}


Outcome<JobStatus> Master::getJobStatus(
    const CallContext& context,
    const JobID& jobId)
{
  Outcome<JobInfo> job = queue_.get(jobId);
  if (job.isError()) {
    return job.error();
  }

  Outcome<JobStatus> status = queue_.status(jobId);
  if (status.isError()) {
    return status.error();
  }

  if (job->owner() != context.credential.identity() &&
      !context.credential.hasProperty(property::JOB_ADMINISTRATOR) &&
      !isMatchedAgent(context, status.get())) {
    return GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query");
  }

  return status;
}


void Master::evicted(const ResourceInfo& resource)
{
  ++metrics.resources_evicted;

  foreach (const JobID& jobId, queue_.matchedTo(resource.id())) {
    Outcome<Nothing> release = queue_.release(jobId);

    // The agent may have started the job in the meantime.
    if (release.isError()) {
      VLOG(1) << "Not releasing job " << jobId << " of evicted resource "
              << resource.id() << ": " << release.error();
      continue;
    }

    ++metrics.jobs_released;

    LOG(INFO) << "Released job " << jobId << " matched to evicted resource "
              << resource.id();
  }
}

} // namespace master {
} // namespace internal {
} // namespace gridware {
