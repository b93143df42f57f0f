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
#include <vector>

#include <gtest/gtest.h>

#include <gridware/credential.hpp>

#include <process/clock.hpp>

#include <stout/check.hpp>
#include <stout/gtest.hpp>
#include <stout/hashset.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/write.hpp>

#include "tests/assert.hpp"
#include "tests/certificates.hpp"
#include "tests/utils.hpp"

using process::Clock;
using process::Time;

using std::string;
using std::vector;

namespace gridware {
namespace internal {
namespace tests {

class CredentialTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    ca = authority("Test CA");
  }

  TrustRoots roots() const
  {
    Try<TrustRoots> roots = TrustRoots::parse(ca.pem());
    CHECK_SOME(roots);
    return roots.get();
  }

  TestCertificate ca;
};


TEST_F(CredentialTest, Parse)
{
  TestCertificate user = issue(ca, "alice", string("dteam_user"));

  Outcome<Credential> credential = Credential::parse(pem({user, ca}));
  ASSERT_SOME(credential);

  EXPECT_EQ("/O=Grid/OU=Users/CN=alice", credential->identity());
  EXPECT_EQ(2u, credential->chain().size());
  EXPECT_EQ(hashset<string>({"dteam_user"}), credential->groups());
  EXPECT_TRUE(credential->properties().empty());
  EXPECT_FALSE(credential->chain()[0].proxy);

  // Without the authority in the chain the leaf alone is kept.
  credential = Credential::parse(user.pem());
  ASSERT_SOME(credential);
  EXPECT_EQ(1u, credential->chain().size());
}


TEST_F(CredentialTest, ParseIgnoresPrivateKey)
{
  TestCertificate user = issue(ca, "alice");

  Outcome<Credential> credential =
    Credential::parse(user.pem() + user.privateKey());

  ASSERT_SOME(credential);
  EXPECT_EQ(user.subject(), credential->identity());
}


TEST_F(CredentialTest, ParseMalformed)
{
  EXPECT_FAILED_WITH(ErrorInfo::MALFORMED_CHAIN, Credential::parse(""));

  EXPECT_FAILED_WITH(
      ErrorInfo::MALFORMED_CHAIN,
      Credential::parse(
          "-----BEGIN CERTIFICATE-----\n"
          "bm90IGEgY2VydGlmaWNhdGU=\n"
          "-----END CERTIFICATE-----\n"));

  EXPECT_FAILED_WITH(
      ErrorInfo::MALFORMED_CHAIN,
      Credential::create({"not a certificate"}));

  // The links have to be chained together.
  TestCertificate other = authority("Other CA");
  TestCertificate user = issue(ca, "alice");

  EXPECT_FAILED_WITH(
      ErrorInfo::MALFORMED_CHAIN,
      Credential::parse(pem({user, other})));
}


// The identity of a delegated chain is the end entity certificate,
// not the proxies in front of it.
TEST_F(CredentialTest, ProxyIdentity)
{
  TestCertificate user = issue(ca, "alice", string("dteam_user"));
  TestCertificate first = proxy(user);
  TestCertificate second = proxy(first);

  Outcome<Credential> credential =
    Credential::parse(pem({second, first, user}));

  ASSERT_SOME(credential);

  EXPECT_EQ(user.subject(), credential->identity());
  EXPECT_EQ(3u, credential->chain().size());
  EXPECT_TRUE(credential->chain()[0].proxy);
  EXPECT_TRUE(credential->chain()[1].proxy);
  EXPECT_FALSE(credential->chain()[2].proxy);

  EXPECT_SOME(validate(credential.get(), roots()));
}


// A chain made of proxies only holds no identity.
TEST_F(CredentialTest, ProxyWithoutEndEntity)
{
  TestCertificate user = issue(ca, "alice");
  TestCertificate delegated = proxy(user);

  EXPECT_FAILED_WITH(
      ErrorInfo::MALFORMED_CHAIN,
      Credential::parse(delegated.pem()));
}


// Groups are read from the leaf-most link carrying them.
TEST_F(CredentialTest, Groups)
{
  TestCertificate user = issue(ca, "alice", string("dteam_user, lhcb_user"));
  TestCertificate inherited = proxy(user);
  TestCertificate narrowed = proxy(user, string("lhcb_user"));

  Outcome<Credential> credential = Credential::parse(pem({inherited, user}));
  ASSERT_SOME(credential);
  EXPECT_EQ(
      hashset<string>({"dteam_user", "lhcb_user"}),
      credential->groups());

  credential = Credential::parse(pem({narrowed, user}));
  ASSERT_SOME(credential);
  EXPECT_EQ(hashset<string>({"lhcb_user"}), credential->groups());
  EXPECT_SOME(validate(credential.get(), roots()));

  credential = Credential::parse(issue(ca, "bob").pem());
  ASSERT_SOME(credential);
  EXPECT_TRUE(credential->groups().empty());
}


TEST_F(CredentialTest, Grant)
{
  TestCertificate user = issue(ca, "alice", string("dteam_user,admins"));

  Outcome<Credential> credential = Credential::parse(user.pem());
  ASSERT_SOME(credential);

  GroupProperties groups;
  groups["dteam_user"] = {property::NORMAL_USER};
  groups["admins"] = {property::JOB_ADMINISTRATOR, property::NORMAL_USER};
  groups["dteam_pilot"] = {property::GENERIC_PILOT};

  const hashset<string> granted = properties(credential.get(), groups);

  EXPECT_EQ(
      hashset<string>({property::NORMAL_USER, property::JOB_ADMINISTRATOR}),
      granted);

  Credential authorized = credential->grant(granted);

  EXPECT_TRUE(authorized.hasProperty(property::JOB_ADMINISTRATOR));
  EXPECT_FALSE(authorized.hasProperty(property::GENERIC_PILOT));

  // The original credential is left untouched.
  EXPECT_FALSE(credential->hasProperty(property::NORMAL_USER));
  EXPECT_EQ(credential->identity(), authorized.identity());
}


TEST_F(CredentialTest, Validate)
{
  TestCertificate user = issue(ca, "alice");

  Outcome<Credential> credential = Credential::parse(pem({user, ca}));
  ASSERT_SOME(credential);

  EXPECT_SOME(validate(credential.get(), roots()));
  EXPECT_TRUE(verify(credential.get(), roots()));

  // Anchored by issuer when the root is not part of the chain.
  credential = Credential::parse(user.pem());
  ASSERT_SOME(credential);

  EXPECT_SOME(validate(credential.get(), roots()));
}


TEST_F(CredentialTest, ValidateExpired)
{
  TestCertificate user = issue(ca, "alice", None(), Days(1));
  TestCertificate delegated = proxy(user, None(), Hours(1));

  Outcome<Credential> credential = Credential::parse(pem({delegated, user}));
  ASSERT_SOME(credential);

  // The expiry of the chain is the one of its shortest lived link.
  const Time expiry = credential->expiry();
  EXPECT_GT(expiry, Clock::now());
  EXPECT_LT(expiry, Clock::now() + Hours(2));

  EXPECT_SOME(validate(credential.get(), roots(), expiry - Minutes(1)));

  EXPECT_FAILED_WITH(
      ErrorInfo::EXPIRED_CHAIN,
      validate(credential.get(), roots(), expiry));

  EXPECT_FAILED_WITH(
      ErrorInfo::EXPIRED_CHAIN,
      validate(credential.get(), roots(), Clock::now() + Days(2)));

  EXPECT_FALSE(verify(credential.get(), roots(), expiry + Seconds(1)));
}


TEST_F(CredentialTest, ValidateNotYetValid)
{
  TestCertificate user = issue(ca, "alice");

  Outcome<Credential> credential = Credential::parse(user.pem());
  ASSERT_SOME(credential);

  EXPECT_FAILED_WITH(
      ErrorInfo::EXPIRED_CHAIN,
      validate(credential.get(), roots(), Clock::now() - Days(1)));
}


TEST_F(CredentialTest, ValidateUntrustedIssuer)
{
  TestCertificate rogue = authority("Rogue CA");
  TestCertificate user = issue(rogue, "mallory");

  Outcome<Credential> credential = Credential::parse(pem({user, rogue}));
  ASSERT_SOME(credential);

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));

  // An authority with the name of a trusted one but a different key.
  TestCertificate impostor = authority("Test CA");
  TestCertificate forged = issue(impostor, "alice");

  credential = Credential::parse(forged.pem());
  ASSERT_SOME(credential);

  EXPECT_EQ(ca.subject(), credential->chain()[0].issuer);

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));
}


// A proxy signed by a key other than the one of the certificate it
// claims to be delegated from.
TEST_F(CredentialTest, ValidateForgedProxy)
{
  TestCertificate user = issue(ca, "alice");
  TestCertificate impostor = issue(ca, "alice");

  TestCertificate delegated = proxy(impostor);

  Outcome<Credential> credential = Credential::parse(pem({delegated, user}));
  ASSERT_SOME(credential);

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));
}


// Only an authority issues end entity certificates: a user cannot
// sign a certificate for another name with its own key.
TEST_F(CredentialTest, ValidateEndEntityAsIssuer)
{
  TestCertificate user = issue(ca, "alice");
  TestCertificate forged = issue(user, "admin");

  Outcome<Credential> credential = Credential::parse(pem({forged, user}));
  ASSERT_SOME(credential);
  EXPECT_EQ(forged.subject(), credential->identity());

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));

  // Nor does an authority issue proxies.
  TestCertificate delegated = proxy(ca);

  credential = Credential::parse(pem({delegated, ca}));
  ASSERT_SOME(credential);

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));
}


// A proxy cannot claim groups its issuer does not hold.
TEST_F(CredentialTest, ValidateProxyWidensGroups)
{
  TestCertificate user = issue(ca, "alice", string("dteam_user"));
  TestCertificate widened = proxy(user, string("dteam_user,admins"));

  Outcome<Credential> credential = Credential::parse(pem({widened, user}));
  ASSERT_SOME(credential);
  EXPECT_TRUE(credential->groups().contains("admins"));

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));

  // Without groups of its own the issuer grants none to a proxy.
  TestCertificate bob = issue(ca, "bob");
  TestCertificate claimed = proxy(bob, string("admins"));

  credential = Credential::parse(pem({claimed, bob}));
  ASSERT_SOME(credential);

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));

  // A proxy of a narrowing proxy cannot win the dropped group back.
  TestCertificate carol = issue(ca, "carol", string("dteam_user,admins"));
  TestCertificate narrowed = proxy(carol, string("dteam_user"));
  TestCertificate second = proxy(narrowed, string("dteam_user,admins"));

  credential = Credential::parse(pem({second, narrowed, carol}));
  ASSERT_SOME(credential);

  EXPECT_FAILED_WITH(
      ErrorInfo::UNTRUSTED_ISSUER,
      validate(credential.get(), roots()));
}


TEST_F(CredentialTest, ValidateExpiredRoot)
{
  TestCertificate expiring = authority("Expiring CA", Hours(1));
  TestCertificate user = issue(expiring, "alice");

  Try<TrustRoots> roots = TrustRoots::parse(expiring.pem());
  ASSERT_SOME(roots);

  Outcome<Credential> credential = Credential::parse(user.pem());
  ASSERT_SOME(credential);

  EXPECT_SOME(validate(credential.get(), roots.get()));

  EXPECT_FAILED_WITH(
      ErrorInfo::EXPIRED_CHAIN,
      validate(credential.get(), roots.get(), Clock::now() + Hours(2)));
}


TEST_F(CredentialTest, TrustRootsLoad)
{
  TestCertificate other = authority("Other CA");

  const string file = path::join(sandbox.get(), "roots.pem");
  ASSERT_SOME(os::write(file, pem({ca, other})));

  Try<TrustRoots> roots = TrustRoots::load(file);
  ASSERT_SOME(roots);
  EXPECT_EQ(2u, roots->roots().size());

  // A directory is searched for '.pem' and '.crt' files.
  const string directory = path::join(sandbox.get(), "certificates");
  ASSERT_SOME(os::mkdir(directory));
  ASSERT_SOME(os::write(path::join(directory, "test.pem"), ca.pem()));
  ASSERT_SOME(os::write(path::join(directory, "other.crt"), other.pem()));
  ASSERT_SOME(os::write(path::join(directory, "README"), "Not a root"));

  roots = TrustRoots::load(directory);
  ASSERT_SOME(roots);
  EXPECT_EQ(2u, roots->roots().size());

  const string empty = path::join(sandbox.get(), "empty");
  ASSERT_SOME(os::mkdir(empty));

  EXPECT_ERROR(TrustRoots::load(empty));
  EXPECT_ERROR(TrustRoots::load(path::join(sandbox.get(), "missing.pem")));
}


TEST_F(CredentialTest, Print)
{
  TestCertificate user = issue(ca, "alice", string("dteam_user"));

  Outcome<Credential> credential = Credential::parse(user.pem());
  ASSERT_SOME(credential);

  EXPECT_EQ(
      "(/O=Grid/OU=Users/CN=alice)[dteam_user]",
      stringify(credential.get()));
}

} // namespace tests {
} // namespace internal {
} // namespace gridware {
