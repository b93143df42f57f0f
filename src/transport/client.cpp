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
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

#include "transport/client.hpp"

using process::Owned;

using std::shared_ptr;
using std::string;
using std::vector;

namespace gridware {
namespace internal {

// Allowance for the round trip on top of the timeout of a call.
static const Duration GRACE = Seconds(5);

// Applies when the caller gives no timeout.
static const Duration DEFAULT_TIMEOUT = Seconds(60);


Outcome<Owned<Client>> Client::connect(
    const string& host,
    uint16_t port,
    const tls::Identity& identity,
    const TrustRoots& roots,
    const Duration& timeout)
{
  Try<shared_ptr<tls::Context>> context =
    tls::Context::create(identity, roots, false);

  if (context.isError()) {
    return GridError(
        ErrorInfo::INTERNAL_ERROR,
        "Failed to set up TLS: " + context.error());
  }

  Outcome<shared_ptr<Connection>> connection =
    Connection::connect(host, port, context.get(), timeout);

  if (connection.isError()) {
    return connection.error();
  }

  return Owned<Client>(new Client(connection.get()));
}


Outcome<string> Client::call(
    const string& method,
    const vector<Argument>& arguments,
    const Option<Duration>& timeout)
{
  Call call;
  call.set_id(stringify(++nextId));
  call.set_method(method);

  foreach (const Argument& argument, arguments) {
    call.add_arguments()->CopyFrom(argument);
  }

  if (timeout.isSome()) {
    call.set_timeout(timeout->secs());
  }

  Try<string> serialized = messages::serialize(call);
  if (serialized.isError()) {
    return GridError(ErrorInfo::INVALID_JOB, serialized.error());
  }

  synchronized (mutex) {
    if (connection == nullptr) {
      return GridError(ErrorInfo::UNAVAILABLE, "Connection closed");
    }

    Outcome<Nothing> send = connection->send(serialized.get());
    if (send.isError()) {
      connection.reset();
      return send.error();
    }

    const Duration wait = timeout.getOrElse(DEFAULT_TIMEOUT) + GRACE;

    for (;;) {
      Outcome<Option<string>> message = connection->receive(wait);

      if (message.isError()) {
        LOG(WARNING) << "Closing connection to " << connection->peer()
                     << " after call '" << method << "' failed: "
                     << message.error();

        connection.reset();
        return message.error();
      }

      if (message->isNone()) {
        connection.reset();
        return GridError(
            ErrorInfo::UNAVAILABLE,
            "Connection closed during call '" + method + "'");
      }

      Try<Response> response =
        messages::deserialize<Response>(message->get());

      if (response.isError()) {
        connection.reset();
        return GridError(ErrorInfo::UNAVAILABLE, response.error());
      }

      // Calls are serialized, so any other response is a leftover.
      if (response->id() != call.id()) {
        VLOG(1) << "Dropping response to call " << response->id();
        continue;
      }

      return messages::outcome<string>(response.get());
    }
  }

  UNREACHABLE();
}


void Client::close()
{
  synchronized (mutex) {
    connection.reset();
  }
}

} // namespace internal {
} // namespace gridware {
