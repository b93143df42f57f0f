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


#include <algorithm>
#include <exception>
#include <memory>
#include <string>

#include <glog/logging.h>

#include <process/future.hpp>
#include <process/promise.hpp>

#include <process/metrics/metrics.hpp>

#include <stout/stopwatch.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/synchronized.hpp>

#include "service/dispatcher.hpp"

using process::Future;
using process::Promise;

using process::metrics::Counter;

using std::shared_ptr;
using std::string;

namespace gridware {
namespace internal {

// Runs a handler, turning an escaping exception into INTERNAL_ERROR.
static Outcome<string> invoke(
    const shared_ptr<Handler>& handler,
    const CallContext& context,
    const Call& call)
{
  try {
    return handler->invoke(context, call);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Handler of '" << call.method() << "' for " << context
               << " threw: " << e.what();
  } catch (...) {
    LOG(ERROR) << "Handler of '" << call.method() << "' for " << context
               << " threw an unknown exception";
  }

  return GridError(
      ErrorInfo::INTERNAL_ERROR,
      "Handler of '" + call.method() + "' failed");
}


Dispatcher::Metrics::Metrics(const string& component)
  : calls("dispatcher/" + strings::lower(component) + "/calls"),
    unauthorized("dispatcher/" + strings::lower(component) + "/unauthorized"),
    timeouts("dispatcher/" + strings::lower(component) + "/timeouts"),
    internal_errors(
        "dispatcher/" + strings::lower(component) + "/internal_errors")
{
  process::metrics::add(calls);
  process::metrics::add(unauthorized);
  process::metrics::add(timeouts);
  process::metrics::add(internal_errors);
}


Dispatcher::Metrics::~Metrics()
{
  process::metrics::remove(calls);
  process::metrics::remove(unauthorized);
  process::metrics::remove(timeouts);
  process::metrics::remove(internal_errors);
}


Dispatcher::Dispatcher(
    const string& component,
    size_t workers,
    const Duration& _defaultTimeout,
    const Duration& _maxTimeout)
  : component_(component),
    defaultTimeout(_defaultTimeout),
    maxTimeout(_maxTimeout),
    metrics(component),
    pool(workers)
{
  CHECK_GT(workers, 0u);
  CHECK_LE(defaultTimeout, maxTimeout);
}


Dispatcher::~Dispatcher() {}


Try<Nothing> Dispatcher::install(
    const string& method,
    const MethodPolicy& policy,
    const shared_ptr<Handler>& handler)
{
  CHECK_NOTNULL(handler.get());

  synchronized (mutex) {
    if (methods.contains(method)) {
      return Error(
          "Method '" + method + "' of " + component_ +
          " is already installed");
    }

    methods[method] = Method{policy, handler};
  }

  VLOG(1) << "Installed " << component_ << ": " << method
          << " with policy " << policy;

  return Nothing();
}


Option<MethodPolicy> Dispatcher::policy(const string& method) const
{
  synchronized (mutex) {
    Option<Method> found = methods.get(method);
    if (found.isNone()) {
      return None();
    }

    return found->policy;
  }
}


Duration Dispatcher::timeout(const Call& call) const
{
  if (!call.has_timeout() || call.timeout() <= 0) {
    return defaultTimeout;
  }

  Try<Duration> timeout = Duration::create(call.timeout());
  if (timeout.isError()) {
    return maxTimeout;
  }

  return std::min(timeout.get(), maxTimeout);
}


Future<Response> Dispatcher::dispatch(
    const CallContext& context,
    const Call& call)
{
  ++metrics.calls;

  LOG(INFO) << "Incoming request " << context << " " << component_ << ": "
            << call.method();

  Stopwatch stopwatch;
  stopwatch.start();

  const string component = component_;
  const string id = call.id();
  const string method = call.method();

  // Logs the response and hands it on.
  auto returning = [=](const Response& response) mutable -> Response {
    if (response.has_error()) {
      LOG(INFO) << "Returning response " << context << " " << component
                << " (" << stopwatch.elapsed().ms() << " ms) ERROR: "
                << response.error().message();
    } else {
      LOG(INFO) << "Returning response " << context << " " << component
                << " (" << stopwatch.elapsed().ms() << " ms) OK";
    }

    return response;
  };

  Option<Method> found;
  synchronized (mutex) {
    found = methods.get(method);
  }

  if (found.isNone()) {
    ++metrics.unauthorized;

    LOG(WARNING) << "Refusing unknown method '" << method << "' of "
                 << component_ << " called by " << context;

    return returning(messages::response(id, Outcome<Nothing>(
        GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query"))));
  }

  Outcome<Nothing> authorization =
    authorized(context.credential, found->policy);

  if (authorization.isError()) {
    ++metrics.unauthorized;

    LOG(WARNING) << "Refusing '" << method << "' of " << component_
                 << " to " << context;

    return returning(messages::response(
        id, Outcome<Nothing>(authorization.error().redact())));
  }

  shared_ptr<Promise<Response>> promise(new Promise<Response>());
  Future<Response> future = promise->future();

  const shared_ptr<Handler> handler = found->handler;
  Counter internal_errors = metrics.internal_errors;

  bool posted = pool.post([=]() mutable {
    Outcome<string> outcome = invoke(handler, context, call);

    if (outcome.isError()) {
      if (outcome.error().code == ErrorInfo::INTERNAL_ERROR) {
        ++internal_errors;
      }

      VLOG(1) << "Call '" << method << "' of " << component << " for "
              << context << " failed: " << outcome.error();

      promise->set(messages::response(
          id, Outcome<string>(outcome.error().redact())));
      return;
    }

    promise->set(messages::response(id, outcome));
  });

  if (!posted) {
    return returning(messages::response(id, Outcome<Nothing>(
        GridError(ErrorInfo::UNAVAILABLE, component_ + " is shutting down"))));
  }

  const Duration timeout = this->timeout(call);
  Counter timeouts = metrics.timeouts;

  return future
    .after(timeout, [=](const Future<Response>&) mutable -> Future<Response> {
      ++timeouts;

      LOG(WARNING) << "Call '" << method << "' of " << component << " for "
                   << context << " timed out after " << timeout;

      return messages::response(id, Outcome<Nothing>(GridError(
          ErrorInfo::TIMEOUT,
          "Call '" + method + "' timed out after " + stringify(timeout))));
    })
    .then(returning);
}

} // namespace internal {
} // namespace gridware {
