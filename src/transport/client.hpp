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


#ifndef __TRANSPORT_CLIENT_HPP__
#define __TRANSPORT_CLIENT_HPP__

#include <stdint.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gridware/credential.hpp>
#include <gridware/outcome.hpp>

#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/option.hpp>

#include "messages/messages.hpp"

#include "service/handler.hpp"

#include "transport/connection.hpp"
#include "transport/tls.hpp"

namespace gridware {
namespace internal {

// The calling side of a connection. Calls are serialized; a call
// waits for its response at most its timeout plus a grace period for
// the round trip.
//
// A connection that broke or timed out is closed and every later call
// fails with UNAVAILABLE. The outcome of a call that failed this way
// is unknown to the caller.
class Client
{
public:
  static Outcome<process::Owned<Client>> connect(
      const std::string& host,
      uint16_t port,
      const tls::Identity& identity,
      const TrustRoots& roots,
      const Duration& timeout = Seconds(30));

  // Returns the payload of the response.
  Outcome<std::string> call(
      const std::string& method,
      const std::vector<Argument>& arguments,
      const Option<Duration>& timeout = None());

  // Calls a method taking and returning a single message.
  template <typename Response, typename Request>
  Outcome<Response> call(
      const std::string& method,
      const Request& request,
      const Option<Duration>& timeout = None())
  {
    Try<Argument> argument = messageArgument(request);
    if (argument.isError()) {
      return GridError(ErrorInfo::INVALID_JOB, argument.error());
    }

    Outcome<std::string> payload = call(method, {argument.get()}, timeout);
    if (payload.isError()) {
      return payload.error();
    }

    Try<Response> response = messages::deserialize<Response>(payload.get());
    if (response.isError()) {
      return GridError(ErrorInfo::INTERNAL_ERROR, response.error());
    }

    return response.get();
  }

  // The credential the server presented.
  const Credential& server() const { return server_; }

  void close();

private:
  explicit Client(const std::shared_ptr<Connection>& _connection)
    : server_(_connection->credential()),
      connection(_connection),
      nextId(0) {}

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  const Credential server_;

  std::mutex mutex;
  std::shared_ptr<Connection> connection;
  std::atomic<uint64_t> nextId;
};

} // namespace internal {
} // namespace gridware {

#endif // __TRANSPORT_CLIENT_HPP__
