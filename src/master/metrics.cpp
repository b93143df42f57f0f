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


#include <process/metrics/metrics.hpp>

#include "master/metrics.hpp"

namespace gridware {
namespace internal {
namespace master {

Metrics::Metrics()
  : jobs_submitted("master/jobs_submitted"),
    jobs_matched("master/jobs_matched"),
    jobs_killed("master/jobs_killed"),
    jobs_released("master/jobs_released"),
    resources_evicted("master/resources_evicted"),
    status_updates("master/status_updates"),
    invalid_status_updates("master/invalid_status_updates")
{
  process::metrics::add(jobs_submitted);
  process::metrics::add(jobs_matched);
  process::metrics::add(jobs_killed);
  process::metrics::add(jobs_released);

  process::metrics::add(resources_evicted);

  process::metrics::add(status_updates);
  process::metrics::add(invalid_status_updates);
}


Metrics::~Metrics()
{
  process::metrics::remove(jobs_submitted);
  process::metrics::remove(jobs_matched);
  process::metrics::remove(jobs_killed);
  process::metrics::remove(jobs_released);

  process::metrics::remove(resources_evicted);

  process::metrics::remove(status_updates);
  process::metrics::remove(invalid_status_updates);
}

} // namespace master {
} // namespace internal {
} // namespace gridware {
