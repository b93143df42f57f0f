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


#ifndef __SERVICE_HANDLER_HPP__
#define __SERVICE_HANDLER_HPP__

#include <ostream>
#include <string>

#include <google/protobuf/message.h>

#include <gridware/credential.hpp>
#include <gridware/outcome.hpp>

#include <stout/lambda.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "messages/messages.hpp"

namespace gridware {
namespace internal {

// Who is calling: the credential bound to the connection the call
// arrived on and the address of the peer.
struct CallContext
{
  CallContext(const Credential& _credential, const std::string& _peer)
    : credential(_credential), peer(_peer) {}

  Credential credential;
  std::string peer;
};


// Prints "(peer)[group,...:identity]".
inline std::ostream& operator<<(
    std::ostream& stream,
    const CallContext& context)
{
  return stream << "(" << context.peer << ")"
                << "[" << strings::join(",", context.credential.groups())
                << ":" << context.credential.identity() << "]";
}


// A remote method. The returned payload is put on the wire as is.
class Handler
{
public:
  virtual ~Handler() {}

  virtual Outcome<std::string> invoke(
      const CallContext& context,
      const Call& call) = 0;
};


// Decodes the protobuf message passed as argument 'index'. A missing
// or undecodable argument is an INVALID_JOB failure.
template <typename T>
Outcome<T> argument(const Call& call, int index)
{
  if (index >= call.arguments_size()) {
    return GridError(
        ErrorInfo::INVALID_JOB,
        "Missing argument " + stringify(index) + " of '" +
        call.method() + "'");
  }

  const Argument& argument = call.arguments(index);
  if (argument.value_case() != Argument::kMessage) {
    return GridError(
        ErrorInfo::INVALID_JOB,
        "Argument " + stringify(index) + " of '" + call.method() +
        "' is not a message");
  }

  Try<T> t = messages::deserialize<T>(argument.message());
  if (t.isError()) {
    return GridError(ErrorInfo::INVALID_JOB, t.error());
  }

  // Required fields are not checked by the parser above.
  if (!t->IsInitialized()) {
    return GridError(
        ErrorInfo::INVALID_JOB,
        "Argument " + stringify(index) + " of '" + call.method() +
        "' is missing required fields: " +
        t->InitializationErrorString());
  }

  return t.get();
}


// Returns an argument holding the serialized message.
template <typename T>
Try<Argument> messageArgument(const T& t)
{
  Try<std::string> message = messages::serialize(t);
  if (message.isError()) {
    return Error(message.error());
  }

  Argument argument;
  argument.set_message(message.get());
  return argument;
}


// Adapts a function taking and returning protobuf messages to a
// handler taking a single message argument.
template <typename Request, typename Response>
class ProtobufHandler : public Handler
{
public:
  typedef lambda::function<
      Outcome<Response>(const CallContext&, const Request&)> Function;

  explicit ProtobufHandler(const Function& _f) : f(_f) {}

  Outcome<std::string> invoke(
      const CallContext& context,
      const Call& call) override
  {
    Outcome<Request> request = argument<Request>(call, 0);
    if (request.isError()) {
      return request.error();
    }

    Outcome<Response> response = f(context, request.get());
    if (response.isError()) {
      return response.error();
    }

    Try<std::string> payload = messages::serialize(response.get());
    if (payload.isError()) {
      return GridError(ErrorInfo::INTERNAL_ERROR, payload.error());
    }

    return payload.get();
  }

private:
  Function f;
};

} // namespace internal {
} // namespace gridware {

#endif // __SERVICE_HANDLER_HPP__
