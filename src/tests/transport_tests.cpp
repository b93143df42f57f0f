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

#include <gmock/gmock.h>

#include <gtest/gtest.h>

#include <gridware/configuration.hpp>
#include <gridware/credential.hpp>
#include <gridware/gridware.hpp>

#include <process/clock.hpp>
#include <process/owned.hpp>

#include <stout/check.hpp>
#include <stout/duration.hpp>
#include <stout/gtest.hpp>

#include <stout/os/sleep.hpp>

#include "service/dispatcher.hpp"
#include "service/handler.hpp"

#include "transport/client.hpp"
#include "transport/server.hpp"
#include "transport/tls.hpp"

#include "tests/assert.hpp"
#include "tests/certificates.hpp"
#include "tests/utils.hpp"

using process::Clock;
using process::Owned;

using std::shared_ptr;
using std::string;

namespace gridware {
namespace internal {
namespace tests {

class TransportTest : public ::testing::Test
{
protected:
  TransportTest()
    : ca(authority("Test CA")),
      host(issue(ca, "localhost", None(), Days(1), "Hosts")),
      alice(issue(ca, "alice", string("dteam_user"))),
      dispatcher("Test/Echo", 2) {}

  void SetUp() override
  {
    Try<TrustRoots> parse = TrustRoots::parse(ca.pem());
    ASSERT_SOME(parse);
    roots = parse.get();

    ASSERT_SOME((dispatcher.install<JobID, JobStatus>(
        "echo",
        MethodPolicy::any({property::NORMAL_USER}),
        [this](const CallContext& context, const JobID& jobId) {
          return handler.Call(context, jobId);
        })));

    ON_CALL(handler, Call(testing::_, testing::_))
      .WillByDefault(testing::Invoke(echo));

    Try<shared_ptr<tls::Context>> context =
      tls::Context::create(identity({host}), roots, true);
    ASSERT_SOME(context);

    server.reset(new Server(
        context.get(),
        &dispatcher,
        configuration(R"~(
            {
              "Registry": {
                "Groups": {
                  "dteam_user": { "Properties": "NormalUser" },
                  "visitors": {}
                }
              }
            })~")));

    ASSERT_SOME(server->start("127.0.0.1", 0));
  }

  void TearDown() override
  {
    if (server.get() != nullptr) {
      server->stop();
    }
  }

  // The chain is given leaf first, the key is the one of the leaf.
  static tls::Identity identity(const std::vector<TestCertificate>& chain)
  {
    tls::Identity identity;
    identity.certificates = pem(chain);
    identity.key = chain.front().privateKey();
    return identity;
  }

  static JobID jobId(const string& value)
  {
    JobID jobId;
    jobId.set_value(value);
    return jobId;
  }

  // Echoes the job ID along with the identity of the caller.
  static Outcome<JobStatus> echo(
      const CallContext& context,
      const JobID& jobId)
  {
    JobStatus status;
    status.mutable_job_id()->CopyFrom(jobId);
    status.set_state(JOB_WAITING);
    status.set_message(context.credential.identity());
    return status;
  }

  Outcome<Owned<Client>> connect(const tls::Identity& identity)
  {
    return Client::connect("127.0.0.1", server->port(), identity, roots);
  }

  const TestCertificate ca;
  const TestCertificate host;
  const TestCertificate alice;

  TrustRoots roots;
  Dispatcher dispatcher;
  Owned<Server> server;

  testing::NiceMock<
      testing::MockFunction<
          Outcome<JobStatus>(const CallContext&, const JobID&)>> handler;
};


// A call made with a proxy runs on behalf of the end entity.
TEST_F(TransportTest, Call)
{
  Outcome<Owned<Client>> client = connect(identity({proxy(alice), alice}));
  ASSERT_SOME(client);

  EXPECT_EQ(host.subject(), client.get()->server().identity());

  Outcome<JobStatus> status =
    client.get()->call<JobStatus>("echo", jobId("42"));

  ASSERT_SOME(status);
  EXPECT_EQ(jobId("42"), status->job_id());
  EXPECT_EQ(alice.subject(), status->message());

  // The connection serves further calls.
  status = client.get()->call<JobStatus>("echo", jobId("43"));

  ASSERT_SOME(status);
  EXPECT_EQ(jobId("43"), status->job_id());
}


TEST_F(TransportTest, Unauthorized)
{
  EXPECT_CALL(handler, Call(testing::_, testing::_))
    .Times(0);

  TestCertificate bob = issue(ca, "bob", string("visitors"));

  Outcome<Owned<Client>> client = connect(identity({bob}));
  ASSERT_SOME(client);

  Outcome<JobStatus> status =
    client.get()->call<JobStatus>("echo", jobId("42"));

  ASSERT_FAILED_WITH(ErrorInfo::UNAUTHORIZED, status);

  // A refused call leaves the connection usable.
  status = client.get()->call<JobStatus>("unknown", jobId("42"));
  ASSERT_FAILED_WITH(ErrorInfo::UNAUTHORIZED, status);
}


// The server refuses a client chain that does not lead to its roots.
// Depending on the TLS version the refusal shows during the handshake
// or on the first call.
TEST_F(TransportTest, UntrustedClient)
{
  EXPECT_CALL(handler, Call(testing::_, testing::_))
    .Times(0);

  TestCertificate rogue = authority("Rogue CA");
  TestCertificate mallory = issue(rogue, "alice", string("dteam_user"));

  Outcome<Owned<Client>> client = connect(identity({mallory}));

  if (client.isSome()) {
    Outcome<JobStatus> status =
      client.get()->call<JobStatus>("echo", jobId("42"));

    ASSERT_FAILED_WITH(ErrorInfo::UNAVAILABLE, status);
  }
}


// A user cannot present a certificate it signed itself for another
// name.
TEST_F(TransportTest, ForgedIdentity)
{
  EXPECT_CALL(handler, Call(testing::_, testing::_))
    .Times(0);

  TestCertificate forged = issue(alice, "admin", string("dteam_user"));

  Outcome<Owned<Client>> client = connect(identity({forged, alice}));

  if (client.isSome()) {
    Outcome<JobStatus> status =
      client.get()->call<JobStatus>("echo", jobId("42"));

    ASSERT_FAILED_WITH(ErrorInfo::UNAVAILABLE, status);
  }
}


TEST_F(TransportTest, UntrustedServer)
{
  TestCertificate rogue = authority("Rogue CA");

  Try<TrustRoots> other = TrustRoots::parse(rogue.pem());
  ASSERT_SOME(other);

  Outcome<Owned<Client>> client = Client::connect(
      "127.0.0.1", server->port(), identity({alice}), other.get());

  ASSERT_FAILED_WITH(ErrorInfo::UNTRUSTED_ISSUER, client);
}


// Once the credential of an established connection expires the
// server answers the next call with the expiry and hangs up.
TEST_F(TransportTest, ExpiredCredential)
{
  Outcome<Owned<Client>> client =
    connect(identity({proxy(alice, None(), Hours(1)), alice}));

  ASSERT_SOME(client);

  ASSERT_SOME(client.get()->call<JobStatus>("echo", jobId("42")));

  Clock::pause();
  Clock::advance(Hours(2));

  Outcome<JobStatus> status =
    client.get()->call<JobStatus>("echo", jobId("43"));

  ASSERT_FAILED_WITH(ErrorInfo::EXPIRED_CHAIN, status);

  status = client.get()->call<JobStatus>("echo", jobId("44"));
  ASSERT_FAILED_WITH(ErrorInfo::UNAVAILABLE, status);

  Clock::resume();
}


TEST_F(TransportTest, Close)
{
  Outcome<Owned<Client>> client = connect(identity({alice}));
  ASSERT_SOME(client);

  client.get()->close();

  Outcome<JobStatus> status =
    client.get()->call<JobStatus>("echo", jobId("42"));

  ASSERT_FAILED_WITH(ErrorInfo::UNAVAILABLE, status);
}

// The threads of closed connections are joined while the server
// runs, not only when it stops.
TEST_F(TransportTest, ConnectionThreadsJoined)
{
  for (int i = 0; i < 20; i++) {
    Outcome<Owned<Client>> client = connect(identity({alice}));
    ASSERT_SOME(client);

    ASSERT_SOME(client.get()->call<JobStatus>("echo", jobId("42")));
  }

  // Each connection thread exits once its client hung up.
  Duration waited = Duration::zero();
  while (server->running() > 0 && waited < Seconds(15)) {
    os::sleep(Milliseconds(10));
    waited += Milliseconds(10);
  }

  EXPECT_EQ(0u, server->running());

  // The server keeps accepting.
  Outcome<Owned<Client>> client = connect(identity({alice}));
  ASSERT_SOME(client);
  EXPECT_SOME(client.get()->call<JobStatus>("echo", jobId("43")));
}

} // namespace tests {
} // namespace internal {
} // namespace gridware {
