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


#include <string>

#include <gtest/gtest.h>

#include <gridware/gridware.hpp>
#include <gridware/outcome.hpp>

#include <stout/gtest.hpp>
#include <stout/stringify.hpp>

#include "messages/messages.hpp"

#include "tests/assert.hpp"

using std::string;

namespace gridware {
namespace internal {
namespace tests {

TEST(OutcomeTest, Wrap)
{
  GridError error(ErrorInfo::INVALID_JOB, "Unknown job 42");
  GridError wrapped = error.wrap("Failed to kill job");

  EXPECT_EQ(ErrorInfo::INVALID_JOB, wrapped.code);
  EXPECT_EQ("Failed to kill job", wrapped.message);
  ASSERT_NE(nullptr, wrapped.cause.get());
  EXPECT_EQ(error, *wrapped.cause);

  EXPECT_EQ(
      "INVALID_JOB: Failed to kill job "
      "(caused by INVALID_JOB: Unknown job 42)",
      stringify(wrapped));
}


TEST(OutcomeTest, Translate)
{
  GridError error(ErrorInfo::UNAVAILABLE, "Connection refused");
  GridError translated =
    error.translate(ErrorInfo::TIMEOUT, "Deadline elapsed");

  EXPECT_EQ(ErrorInfo::TIMEOUT, translated.code);
  ASSERT_NE(nullptr, translated.cause.get());
  EXPECT_EQ(ErrorInfo::UNAVAILABLE, translated.cause->code);
}


TEST(OutcomeTest, Redact)
{
  GridError unauthorized(
      ErrorInfo::UNAUTHORIZED,
      "Missing property Operator for /O=Grid/CN=alice");

  EXPECT_EQ(
      GridError(ErrorInfo::UNAUTHORIZED, "Unauthorized query"),
      unauthorized.redact());

  GridError internal = GridError(ErrorInfo::INTERNAL_ERROR, "Segment 0x42")
    .wrap("Failed to store job");

  EXPECT_EQ(
      GridError(ErrorInfo::INTERNAL_ERROR, "Internal error"),
      internal.redact());

  // Redaction applies to causes too.
  GridError invalid = GridError(ErrorInfo::MALFORMED_CHAIN, "Link 1: junk")
    .translate(ErrorInfo::INVALID_JOB, "Invalid job");

  GridError redacted = invalid.redact();
  EXPECT_EQ("Invalid job", redacted.message);
  ASSERT_NE(nullptr, redacted.cause.get());
  EXPECT_EQ("Malformed credential chain", redacted.cause->message);

  GridError timeout(ErrorInfo::TIMEOUT, "Call timed out after 1mins");
  EXPECT_EQ(timeout, timeout.redact());
}


TEST(OutcomeTest, Info)
{
  GridError error = GridError(ErrorInfo::ALREADY_MATCHED, "Job 1 is matched")
    .wrap("Failed to claim job 1");

  ErrorInfo info = error.info();
  EXPECT_EQ(ErrorInfo::ALREADY_MATCHED, info.code());
  EXPECT_EQ("Failed to claim job 1", info.message());
  ASSERT_TRUE(info.has_cause());
  EXPECT_EQ("Job 1 is matched", info.cause().message());

  EXPECT_EQ(error, GridError::from(info));
}


TEST(OutcomeTest, FromTry)
{
  Try<int> t = Error("Not a number");

  Outcome<int> outcome = gridware::outcome(t, ErrorInfo::INVALID_JOB);
  ASSERT_FAILED_WITH(ErrorInfo::INVALID_JOB, outcome);
  EXPECT_EQ("Not a number", outcome.error().message);

  outcome = gridware::outcome(Try<int>(42), ErrorInfo::INVALID_JOB);
  ASSERT_SOME(outcome);
  EXPECT_EQ(42, outcome.get());
}


TEST(MessagesTest, Response)
{
  JobID jobId;
  jobId.set_value("42");

  Response response = messages::response("7", Outcome<JobID>(jobId));
  EXPECT_EQ("7", response.id());
  EXPECT_FALSE(response.has_error());

  Outcome<JobID> outcome = messages::outcome<JobID>(response);
  ASSERT_SOME(outcome);
  EXPECT_EQ(jobId, outcome.get());

  response = messages::response("8", Outcome<JobID>(
      GridError(ErrorInfo::INVALID_JOB, "Unknown job 42")));

  EXPECT_EQ("8", response.id());
  EXPECT_TRUE(response.has_error());
  EXPECT_FALSE(response.has_payload());

  outcome = messages::outcome<JobID>(response);
  ASSERT_FAILED_WITH(ErrorInfo::INVALID_JOB, outcome);
  EXPECT_EQ("Unknown job 42", outcome.error().message);
}


// A payload that does not decode as the expected message is an
// internal error of the server.
TEST(MessagesTest, UndecodablePayload)
{
  Response response;
  response.set_id("1");
  response.set_payload("\xff\xff\xff");

  EXPECT_FAILED_WITH(
      ErrorInfo::INTERNAL_ERROR,
      messages::outcome<JobStatus>(response));

  // Raw payloads are handed back as they are.
  Outcome<string> payload = messages::outcome<string>(response);
  ASSERT_SOME(payload);
  EXPECT_EQ("\xff\xff\xff", payload.get());
}


TEST(MessagesTest, Deserialize)
{
  Call call;
  call.set_id("1");
  call.set_method("submit");
  call.set_timeout(30);
  call.add_arguments()->set_text("hello");
  call.add_arguments()->set_integer(42);

  Try<string> serialized = messages::serialize(call);
  ASSERT_SOME(serialized);

  Try<Call> deserialized = messages::deserialize<Call>(serialized.get());
  ASSERT_SOME(deserialized);

  EXPECT_EQ("submit", deserialized->method());
  ASSERT_EQ(2, deserialized->arguments_size());
  EXPECT_EQ(Argument::kText, deserialized->arguments(0).value_case());
  EXPECT_EQ(42, deserialized->arguments(1).integer());

  EXPECT_ERROR(messages::deserialize<Call>("\x0a\xff"));
}

} // namespace tests {
} // namespace internal {
} // namespace gridware {
