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


#ifndef __MASTER_METRICS_HPP__
#define __MASTER_METRICS_HPP__

#include <process/metrics/counter.hpp>

namespace gridware {
namespace internal {
namespace master {

struct Metrics
{
  Metrics();

  ~Metrics();

  process::metrics::Counter jobs_submitted;
  process::metrics::Counter jobs_matched;
  process::metrics::Counter jobs_killed;
  process::metrics::Counter jobs_released;

  process::metrics::Counter resources_evicted;

  process::metrics::Counter status_updates;
  process::metrics::Counter invalid_status_updates;
};

} // namespace master {
} // namespace internal {
} // namespace gridware {

#endif // __MASTER_METRICS_HPP__
