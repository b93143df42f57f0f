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

#ifndef __GRIDWARE_CREDENTIAL_HPP__
#define __GRIDWARE_CREDENTIAL_HPP__

#include <ostream>
#include <string>
#include <vector>

#include <gridware/outcome.hpp>

#include <process/clock.hpp>
#include <process/time.hpp>

#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace gridware {

// Well known properties.
namespace property {

constexpr char NORMAL_USER[] = "NormalUser";
constexpr char GENERIC_PILOT[] = "GenericPilot";
constexpr char JOB_ADMINISTRATOR[] = "JobAdministrator";
constexpr char SERVICE_ADMINISTRATOR[] = "ServiceAdministrator";
constexpr char OPERATOR[] = "Operator";

} // namespace property {


// Object identifier of the certificate extension carrying the
// comma separated list of groups a credential acts for.
constexpr char GROUP_EXTENSION_OID[] = "1.2.42.42";


// Maps a group to the properties it grants.
typedef hashmap<std::string, hashset<std::string>> GroupProperties;


// The set of certificates an issuer has to chain up to.
class TrustRoots
{
public:
  // Parses every certificate in a PEM document.
  static Try<TrustRoots> parse(const std::string& pem);

  // Loads a PEM file, or every '.pem' and '.crt' file of a directory.
  static Try<TrustRoots> load(const std::string& path);

  TrustRoots() {}

  struct Root
  {
    std::string subject;
    std::string der;
    process::Time notBefore;
    process::Time notAfter;
  };

  const std::vector<Root>& roots() const { return roots_; }

  bool empty() const { return roots_.empty(); }

private:
  std::vector<Root> roots_;
};


// An authenticated identity: a delegated X.509 certificate chain
// together with the groups it acts for and the properties granted to
// those groups. A 'Credential' is immutable once created.
class Credential
{
public:
  struct Link
  {
    std::string subject;
    std::string issuer;
    process::Time notBefore;
    process::Time notAfter;

    // True for RFC 3820 and legacy Globus proxy certificates.
    bool proxy;

    std::string der;
  };

  // Decodes a PEM document holding the chain, leaf first. Private
  // keys in the document are ignored.
  static Outcome<Credential> parse(const std::string& pem);

  // Builds a credential from DER certificates, leaf first.
  static Outcome<Credential> create(const std::vector<std::string>& der);

  // Subject of the end entity certificate (the first non proxy link).
  const std::string& identity() const { return identity_; }

  const std::vector<Link>& chain() const { return chain_; }

  const hashset<std::string>& groups() const { return groups_; }

  const hashset<std::string>& properties() const { return properties_; }

  // The earliest expiry of any link.
  const process::Time& expiry() const { return expiry_; }

  bool hasProperty(const std::string& property) const
  {
    return properties_.contains(property);
  }

  // Returns a copy granted the given properties.
  Credential grant(const hashset<std::string>& properties) const;

private:
  Credential() {}

  std::string identity_;
  std::vector<Link> chain_;
  hashset<std::string> groups_;
  hashset<std::string> properties_;
  process::Time expiry_;
};


// Checks that every link is inside its validity window and that the
// signatures verify link by link up to one of the trust roots.
Outcome<Nothing> validate(
    const Credential& credential,
    const TrustRoots& roots,
    const process::Time& now = process::Clock::now());


bool verify(
    const Credential& credential,
    const TrustRoots& roots,
    const process::Time& now = process::Clock::now());


// Returns the union of the properties granted to the groups of the
// credential.
hashset<std::string> properties(
    const Credential& credential,
    const GroupProperties& groupProperties);


// Prints "(identity)[group,...]".
std::ostream& operator<<(std::ostream& stream, const Credential& credential);

} // namespace gridware {

#endif // __GRIDWARE_CREDENTIAL_HPP__
