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
#include <ostream>
#include <string>

#include <gridware/outcome.hpp>

using std::ostream;
using std::shared_ptr;
using std::string;

namespace gridware {

GridError::GridError(ErrorInfo::Code _code, const string& message)
  : Error(message), code(_code) {}


GridError::GridError(
    ErrorInfo::Code _code,
    const string& message,
    const GridError& _cause)
  : Error(message),
    code(_code),
    cause(new GridError(_cause)) {}


GridError GridError::wrap(const string& _message) const
{
  return GridError(code, _message, *this);
}


GridError GridError::translate(
    ErrorInfo::Code _code,
    const string& _message) const
{
  return GridError(_code, _message, *this);
}


GridError GridError::redact() const
{
  switch (code) {
    case ErrorInfo::UNAUTHORIZED:
      return GridError(code, "Unauthorized query");
    case ErrorInfo::MALFORMED_CHAIN:
      return GridError(code, "Malformed credential chain");
    case ErrorInfo::INTERNAL_ERROR:
      return GridError(code, "Internal error");
    default:
      break;
  }

  if (cause.get() == nullptr) {
    return *this;
  }

  return GridError(code, message, cause->redact());
}


ErrorInfo GridError::info() const
{
  ErrorInfo info;
  info.set_code(code);
  info.set_message(message);

  if (cause.get() != nullptr) {
    info.mutable_cause()->CopyFrom(cause->info());
  }

  return info;
}


GridError GridError::from(const ErrorInfo& info)
{
  if (info.has_cause()) {
    return GridError(info.code(), info.message(), from(info.cause()));
  }

  return GridError(info.code(), info.message());
}


bool operator==(const GridError& left, const GridError& right)
{
  if (left.code != right.code || left.message != right.message) {
    return false;
  }

  if (left.cause.get() == nullptr || right.cause.get() == nullptr) {
    return left.cause.get() == right.cause.get();
  }

  return *left.cause == *right.cause;
}


ostream& operator<<(ostream& stream, const GridError& error)
{
  stream << error.code << ": " << error.message;

  if (error.cause.get() != nullptr) {
    stream << " (caused by " << *error.cause << ")";
  }

  return stream;
}

} // namespace gridware {
