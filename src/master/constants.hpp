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


#ifndef __MASTER_CONSTANTS_HPP__
#define __MASTER_CONSTANTS_HPP__

#include <stddef.h>

#include <stout/duration.hpp>

namespace gridware {
namespace internal {
namespace master {

// Default port the master listens on.
constexpr int DEFAULT_PORT = 9170;

// Default number of threads running calls.
constexpr size_t DEFAULT_WORKER_THREADS = 8;

// Default timeout of a call that names none.
constexpr Duration DEFAULT_CALL_TIMEOUT = Seconds(60);

// Upper bound of the timeout a caller can ask for.
constexpr Duration DEFAULT_MAX_CALL_TIMEOUT = Minutes(10);

// Time a TLS handshake may take.
constexpr Duration DEFAULT_HANDSHAKE_TIMEOUT = Seconds(30);

// A resource that did not call in for this long is evicted and the
// jobs matched to it are released.
constexpr Duration DEFAULT_RESOURCE_SILENCE_TIMEOUT = Minutes(15);

// How often silent resources are looked for.
constexpr Duration DEFAULT_RESOURCE_EXPIRY_INTERVAL = Minutes(1);

// Finished jobs are forgotten this long after they finished.
constexpr Duration DEFAULT_JOB_RETENTION = Days(1);

// Minimum time between two reads of the configuration file.
constexpr Duration DEFAULT_CONFIGURATION_REFRESH_INTERVAL = Minutes(5);

// Name of the component in logs and metrics.
constexpr char COMPONENT[] = "WorkloadManagement/Matcher";

// Section holding the authorization settings of the component.
constexpr char SECTION[] = "/Systems/WorkloadManagement/Matcher";

} // namespace master {
} // namespace internal {
} // namespace gridware {

#endif // __MASTER_CONSTANTS_HPP__
