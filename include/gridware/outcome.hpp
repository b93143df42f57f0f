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

#ifndef __GRIDWARE_OUTCOME_HPP__
#define __GRIDWARE_OUTCOME_HPP__

#include <memory>
#include <ostream>
#include <string>

#include <gridware/gridware.hpp>

#include <stout/error.hpp>
#include <stout/try.hpp>

namespace gridware {

// A failure observable by a caller. Carries one code of the closed
// 'ErrorInfo::Code' set, a message and optionally the failure it was
// derived from.
class GridError : public Error
{
public:
  GridError(ErrorInfo::Code _code, const std::string& message);

  GridError(
      ErrorInfo::Code _code,
      const std::string& message,
      const GridError& _cause);

  // Returns a failure with the same code whose cause is this one.
  GridError wrap(const std::string& message) const;

  // Returns a failure with a different code whose cause is this one.
  GridError translate(
      ErrorInfo::Code code,
      const std::string& message) const;

  // Returns a copy stripped of everything a remote caller must not
  // see. Authorization and chain decoding failures keep only their
  // code and a fixed message; internal errors lose their detail.
  GridError redact() const;

  ErrorInfo info() const;

  static GridError from(const ErrorInfo& info);

  const ErrorInfo::Code code;
  const std::shared_ptr<const GridError> cause;
};


bool operator==(const GridError& left, const GridError& right);


// Prints "CODE: message" followed by the cause chain.
std::ostream& operator<<(std::ostream& stream, const GridError& error);


// The result of every fallible operation: either a value or a
// 'GridError'.
template <typename T>
using Outcome = Try<T, GridError>;


// Lifts a stout 'Try' into an 'Outcome', assigning 'code' to a
// failure.
template <typename T>
Outcome<T> outcome(const Try<T>& t, ErrorInfo::Code code)
{
  if (t.isError()) {
    return GridError(code, t.error());
  }

  return t.get();
}

} // namespace gridware {

#endif // __GRIDWARE_OUTCOME_HPP__
