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


#ifndef __MATCHER_REGISTRY_HPP__
#define __MATCHER_REGISTRY_HPP__

#include <mutex>
#include <vector>

#include <gridware/credential.hpp>
#include <gridware/gridware.hpp>
#include <gridware/outcome.hpp>

#include <process/clock.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>

#include "matcher/job_queue.hpp"

namespace gridware {
namespace internal {

// Forward declaration.
class RegistryExpirerProcess;


// The resources currently asking for work. A resource stays
// registered as long as its agent keeps calling in; a resource that
// stays silent for longer than the silence interval is evicted.
class ResourceRegistry
{
public:
  typedef lambda::function<void(const ResourceInfo&)> EvictionCallback;

  ResourceRegistry(
      const Duration& _silence,
      const EvictionCallback& _evicted = EvictionCallback());

  // Stamps the resource with the identity of the agent and the current
  // time. A resource ID already held by a different identity is
  // refused.
  Outcome<ResourceInfo> registerOrRefresh(
      const ResourceInfo& resource,
      const Credential& agent);

  Option<ResourceInfo> get(const ResourceID& resourceId) const;

  // Evicts every resource silent since 'now - silence' and invokes the
  // eviction callback for each of them.
  std::vector<ResourceInfo> expire(
      const process::Time& now = process::Clock::now());

  size_t size() const;

  const Duration& silence() const { return silence_; }

private:
  const Duration silence_;
  const EvictionCallback evicted;

  mutable std::mutex mutex;
  hashmap<ResourceID, ResourceInfo> resources;
};


// Calls 'ResourceRegistry::expire' every 'interval'. Given a queue,
// also purges the jobs that finished more than 'retention' ago.
class RegistryExpirer
{
public:
  RegistryExpirer(
      ResourceRegistry* registry,
      const Duration& interval,
      JobQueue* queue = nullptr,
      const Duration& retention = Days(1));
  ~RegistryExpirer();

private:
  RegistryExpirer(const RegistryExpirer&) = delete;
  RegistryExpirer& operator=(const RegistryExpirer&) = delete;

  RegistryExpirerProcess* process;
};

} // namespace internal {
} // namespace gridware {

#endif // __MATCHER_REGISTRY_HPP__
