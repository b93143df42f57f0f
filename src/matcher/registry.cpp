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


#include <vector>

#include <glog/logging.h>

#include <process/delay.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include "matcher/registry.hpp"
#include "matcher/validation.hpp"

using process::Clock;
using process::Time;

using std::vector;

namespace gridware {
namespace internal {

class RegistryExpirerProcess : public process::Process<RegistryExpirerProcess>
{
public:
  RegistryExpirerProcess(
      ResourceRegistry* _registry,
      const Duration& _interval,
      JobQueue* _queue,
      const Duration& _retention)
    : ProcessBase(process::ID::generate("registry-expirer")),
      registry(_registry),
      interval(_interval),
      queue(_queue),
      retention(_retention) {}

protected:
  void initialize() override
  {
    delay(interval, self(), &RegistryExpirerProcess::expire);
  }

  void expire()
  {
    vector<ResourceInfo> evicted = registry->expire();

    if (!evicted.empty()) {
      LOG(INFO) << "Evicted " << evicted.size() << " silent resource(s)";
    }

    if (queue != nullptr) {
      const size_t purged = queue->purge(Clock::now() - retention);
      if (purged > 0) {
        LOG(INFO) << "Purged " << purged << " job(s) finished more than "
                  << retention << " ago";
      }
    }

    delay(interval, self(), &RegistryExpirerProcess::expire);
  }

private:
  ResourceRegistry* registry;
  const Duration interval;
  JobQueue* queue;
  const Duration retention;
};


ResourceRegistry::ResourceRegistry(
    const Duration& _silence,
    const EvictionCallback& _evicted)
  : silence_(_silence),
    evicted(_evicted) {}


Outcome<ResourceInfo> ResourceRegistry::registerOrRefresh(
    const ResourceInfo& resource,
    const Credential& agent)
{
  Option<Error> error = validation::resource::validate(resource);
  if (error.isSome()) {
    return GridError(
        ErrorInfo::INVALID_JOB,
        "Invalid resource: " + error->message);
  }

  ResourceInfo info = resource;
  info.set_agent(agent.identity());
  info.set_last_seen(Clock::now().secs());

  bool registered = false;

  synchronized (mutex) {
    if (resources.contains(resource.id())) {
      const ResourceInfo& current = resources.at(resource.id());

      if (current.agent() != agent.identity()) {
        LOG(WARNING) << "Refusing resource " << resource.id() << " from "
                     << agent << " as it is held by '" << current.agent()
                     << "'";

        return GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query");
      }
    } else {
      registered = true;
    }

    resources[resource.id()] = info;
  }

  if (registered) {
    LOG(INFO) << "Registered resource " << resource.id() << " at site '"
              << resource.site() << "' for " << agent;
  }

  return info;
}


Option<ResourceInfo> ResourceRegistry::get(const ResourceID& resourceId) const
{
  synchronized (mutex) {
    return resources.get(resourceId);
  }
}


vector<ResourceInfo> ResourceRegistry::expire(const Time& now)
{
  vector<ResourceInfo> expired;

  synchronized (mutex) {
    foreachvalue (const ResourceInfo& resource, resources) {
      if (now.secs() - resource.last_seen() > silence_.secs()) {
        expired.push_back(resource);
      }
    }

    foreach (const ResourceInfo& resource, expired) {
      resources.erase(resource.id());
    }
  }

  // The callback runs without the lock; it may call back into the
  // registry.
  foreach (const ResourceInfo& resource, expired) {
    LOG(INFO) << "Evicting resource " << resource.id() << " of '"
              << resource.agent() << "' silent since "
              << stringify(Time::create(resource.last_seen()).get());

    if (evicted) {
      evicted(resource);
    }
  }

  return expired;
}


size_t ResourceRegistry::size() const
{
  synchronized (mutex) {
    return resources.size();
  }
}


RegistryExpirer::RegistryExpirer(
    ResourceRegistry* registry,
    const Duration& interval,
    JobQueue* queue,
    const Duration& retention)
{
  process = new RegistryExpirerProcess(registry, interval, queue, retention);
  process::spawn(process);
}


RegistryExpirer::~RegistryExpirer()
{
  process::terminate(process);
  process::wait(process);
  delete process;
}

} // namespace internal {
} // namespace gridware {
