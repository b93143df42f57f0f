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


#ifndef __SERVICE_DISPATCHER_HPP__
#define __SERVICE_DISPATCHER_HPP__

#include <memory>
#include <mutex>
#include <string>

#include <gridware/outcome.hpp>

#include <process/future.hpp>

#include <process/metrics/counter.hpp>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "authorizer/authorizer.hpp"

#include "messages/messages.hpp"

#include "service/handler.hpp"
#include "service/worker_pool.hpp"

namespace gridware {
namespace internal {

// Routes calls to the handlers of a service component.
//
// A call is authorized against the policy of its method before any
// handler runs; unknown methods are refused the same way as denied
// ones. Handlers run on a pool of worker threads. A call that takes
// longer than its timeout is answered with TIMEOUT while the handler
// keeps running; its eventual outcome is dropped.
class Dispatcher
{
public:
  static constexpr size_t DEFAULT_WORKERS = 8;

  Dispatcher(
      const std::string& component,
      size_t workers = DEFAULT_WORKERS,
      const Duration& defaultTimeout = Seconds(60),
      const Duration& maxTimeout = Minutes(10));

  ~Dispatcher();

  // Fails if the method is already installed.
  Try<Nothing> install(
      const std::string& method,
      const MethodPolicy& policy,
      const std::shared_ptr<Handler>& handler);

  template <typename Request, typename Response>
  Try<Nothing> install(
      const std::string& method,
      const MethodPolicy& policy,
      const typename ProtobufHandler<Request, Response>::Function& f)
  {
    return install(
        method,
        policy,
        std::make_shared<ProtobufHandler<Request, Response>>(f));
  }

  Option<MethodPolicy> policy(const std::string& method) const;

  // Never fails; every failure is carried by the response.
  process::Future<Response> dispatch(
      const CallContext& context,
      const Call& call);

  const std::string& component() const { return component_; }

  // The timeout applied to a call: the caller's, bounded by the
  // maximum, or the default if the caller gave none.
  Duration timeout(const Call& call) const;

private:
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  struct Method
  {
    MethodPolicy policy;
    std::shared_ptr<Handler> handler;
  };

  struct Metrics
  {
    explicit Metrics(const std::string& component);
    ~Metrics();

    process::metrics::Counter calls;
    process::metrics::Counter unauthorized;
    process::metrics::Counter timeouts;
    process::metrics::Counter internal_errors;
  };

  const std::string component_;
  const Duration defaultTimeout;
  const Duration maxTimeout;

  mutable std::mutex mutex;
  hashmap<std::string, Method> methods;

  Metrics metrics;

  // Destroyed first so that no handler runs once the rest of the
  // dispatcher is gone.
  WorkerPool pool;
};

} // namespace internal {
} // namespace gridware {

#endif // __SERVICE_DISPATCHER_HPP__
