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


#include "client/workload_client.hpp"

namespace gridware {
namespace internal {

Outcome<ResourceInfo> WorkloadClient::registerOrRefresh(
    const ResourceInfo& resource)
{
  return client->call<ResourceInfo>("registerOrRefresh", resource, timeout);
}


Outcome<Option<JobInfo>> WorkloadClient::requestMatch(
    const ResourceInfo& resource)
{
  Outcome<MatchResponse> response =
    client->call<MatchResponse>("requestMatch", resource, timeout);

  if (response.isError()) {
    return response.error();
  }

  if (!response->has_job()) {
    return Option<JobInfo>::none();
  }

  return Option<JobInfo>(response->job());
}


Outcome<JobStatus> WorkloadClient::reportStatus(const JobStatus& status)
{
  return client->call<JobStatus>("reportStatus", status, timeout);
}


Outcome<JobID> WorkloadClient::submit(const JobInfo& job)
{
  Outcome<SubmitResponse> response =
    client->call<SubmitResponse>("submit", job, timeout);

  if (response.isError()) {
    return response.error();
  }

  return response->job_id();
}


Outcome<JobStatus> WorkloadClient::cancel(const JobID& jobId)
{
  return client->call<JobStatus>("cancel", jobId, timeout);
}


Outcome<JobStatus> WorkloadClient::getJobStatus(const JobID& jobId)
{
  return client->call<JobStatus>("getJobStatus", jobId, timeout);
}

} // namespace internal {
} // namespace gridware {
