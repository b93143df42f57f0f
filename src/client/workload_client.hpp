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


#ifndef __CLIENT_WORKLOAD_CLIENT_HPP__
#define __CLIENT_WORKLOAD_CLIENT_HPP__

#include <gridware/gridware.hpp>
#include <gridware/outcome.hpp>

#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/option.hpp>

#include "transport/client.hpp"

namespace gridware {
namespace internal {

// Typed calls of the workload service.
class WorkloadClient
{
public:
  explicit WorkloadClient(
      const process::Owned<Client>& _client,
      const Option<Duration>& _timeout = None())
    : client(_client), timeout(_timeout) {}

  Outcome<ResourceInfo> registerOrRefresh(const ResourceInfo& resource);

  // Returns None if there is no work for the resource.
  Outcome<Option<JobInfo>> requestMatch(const ResourceInfo& resource);

  Outcome<JobStatus> reportStatus(const JobStatus& status);

  Outcome<JobID> submit(const JobInfo& job);

  Outcome<JobStatus> cancel(const JobID& jobId);

  Outcome<JobStatus> getJobStatus(const JobID& jobId);

private:
  process::Owned<Client> client;
  const Option<Duration> timeout;
};

} // namespace internal {
} // namespace gridware {

#endif // __CLIENT_WORKLOAD_CLIENT_HPP__
