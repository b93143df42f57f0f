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

#include <list>
#include <ostream>
#include <string>
#include <vector>

#include <gridware/credential.hpp>

#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/ls.hpp>
#include <stout/os/read.hpp>
#include <stout/os/stat.hpp>

#include "credential/x509.hpp"

namespace x509 = gridware::internal::x509;

using process::Time;

using std::ostream;
using std::string;
using std::vector;

namespace gridware {

Try<TrustRoots> TrustRoots::parse(const string& pem)
{
  Try<vector<string>> certificates = x509::certificates(pem);
  if (certificates.isError()) {
    return Error(certificates.error());
  }

  if (certificates->empty()) {
    return Error("No certificates found");
  }

  TrustRoots trustRoots;

  foreach (const string& der, certificates.get()) {
    Try<x509::Certificate> certificate = x509::decode(der);
    if (certificate.isError()) {
      return Error(certificate.error());
    }

    Try<Time> notBefore = x509::time(X509_get0_notBefore(certificate->get()));
    if (notBefore.isError()) {
      return Error(notBefore.error());
    }

    Try<Time> notAfter = x509::time(X509_get0_notAfter(certificate->get()));
    if (notAfter.isError()) {
      return Error(notAfter.error());
    }

    Root root;
    root.subject = x509::name(X509_get_subject_name(certificate->get()));
    root.der = der;
    root.notBefore = notBefore.get();
    root.notAfter = notAfter.get();

    trustRoots.roots_.push_back(root);
  }

  return trustRoots;
}


Try<TrustRoots> TrustRoots::load(const string& _path)
{
  if (!os::stat::isdir(_path)) {
    Try<string> read = os::read(_path);
    if (read.isError()) {
      return Error("Failed to read '" + _path + "': " + read.error());
    }

    return parse(read.get());
  }

  Try<std::list<string>> entries = os::ls(_path);
  if (entries.isError()) {
    return Error("Failed to list '" + _path + "': " + entries.error());
  }

  TrustRoots trustRoots;

  foreach (const string& entry, entries.get()) {
    if (!strings::endsWith(entry, ".pem") &&
        !strings::endsWith(entry, ".crt")) {
      continue;
    }

    const string file = path::join(_path, entry);

    Try<string> read = os::read(file);
    if (read.isError()) {
      return Error("Failed to read '" + file + "': " + read.error());
    }

    Try<TrustRoots> roots = parse(read.get());
    if (roots.isError()) {
      return Error("Failed to parse '" + file + "': " + roots.error());
    }

    foreach (const Root& root, roots->roots()) {
      trustRoots.roots_.push_back(root);
    }
  }

  if (trustRoots.empty()) {
    return Error("No certificates found in '" + _path + "'");
  }

  return trustRoots;
}


Outcome<Credential> Credential::parse(const string& pem)
{
  Try<vector<string>> certificates = x509::certificates(pem);
  if (certificates.isError()) {
    return GridError(ErrorInfo::MALFORMED_CHAIN, certificates.error());
  }

  return create(certificates.get());
}


// Returns the groups listed by the group extension, or None if the
// certificate carries none.
static Result<hashset<string>> extensionGroups(X509* certificate)
{
  Result<string> extension =
    x509::extension(certificate, GROUP_EXTENSION_OID);

  if (extension.isError()) {
    return Error(extension.error());
  }

  if (extension.isNone()) {
    return None();
  }

  hashset<string> groups;
  foreach (const string& group, strings::tokenize(extension.get(), ",")) {
    const string trimmed = strings::trim(group);
    if (!trimmed.empty()) {
      groups.insert(trimmed);
    }
  }

  return groups;
}


Outcome<Credential> Credential::create(const vector<string>& der)
{
  if (der.empty()) {
    return GridError(ErrorInfo::MALFORMED_CHAIN, "Empty certificate chain");
  }

  Credential credential;
  Option<hashset<string>> groups;

  for (size_t i = 0; i < der.size(); i++) {
    Try<x509::Certificate> certificate = x509::decode(der[i]);
    if (certificate.isError()) {
      return GridError(
          ErrorInfo::MALFORMED_CHAIN,
          "Link " + stringify(i) + ": " + certificate.error());
    }

    X509* x = certificate->get();

    Try<Time> notBefore = x509::time(X509_get0_notBefore(x));
    Try<Time> notAfter = x509::time(X509_get0_notAfter(x));

    if (notBefore.isError() || notAfter.isError()) {
      return GridError(
          ErrorInfo::MALFORMED_CHAIN,
          "Link " + stringify(i) + " has an invalid validity window");
    }

    Link link;
    link.subject = x509::name(X509_get_subject_name(x));
    link.issuer = x509::name(X509_get_issuer_name(x));
    link.notBefore = notBefore.get();
    link.notAfter = notAfter.get();
    link.proxy = x509::isProxy(x);
    link.der = der[i];

    if (!credential.chain_.empty() &&
        credential.chain_.back().issuer != link.subject) {
      return GridError(
          ErrorInfo::MALFORMED_CHAIN,
          "Link " + stringify(i - 1) + " is issued by '" +
          credential.chain_.back().issuer + "' but followed by '" +
          link.subject + "'");
    }

    // The leaf-most link carrying groups wins; 'validate' checks that
    // delegation only narrowed them.
    if (groups.isNone()) {
      Result<hashset<string>> extension = extensionGroups(x);
      if (extension.isError()) {
        return GridError(
            ErrorInfo::MALFORMED_CHAIN,
            "Link " + stringify(i) + ": " + extension.error());
      }

      if (extension.isSome()) {
        groups = extension.get();
      }
    }

    if (credential.identity_.empty() && !link.proxy) {
      credential.identity_ = link.subject;
    }

    if (credential.chain_.empty() || link.notAfter < credential.expiry_) {
      credential.expiry_ = link.notAfter;
    }

    credential.chain_.push_back(link);
  }

  if (credential.identity_.empty()) {
    return GridError(
        ErrorInfo::MALFORMED_CHAIN,
        "Chain holds no end entity certificate");
  }

  if (groups.isSome()) {
    credential.groups_ = groups.get();
  }

  return credential;
}


Credential Credential::grant(const hashset<string>& properties) const
{
  Credential credential(*this);
  credential.properties_ = properties;
  return credential;
}


Outcome<Nothing> validate(
    const Credential& credential,
    const TrustRoots& roots,
    const Time& now)
{
  const vector<Credential::Link>& chain = credential.chain();

  if (chain.empty()) {
    return GridError(ErrorInfo::MALFORMED_CHAIN, "Empty certificate chain");
  }

  vector<x509::Certificate> certificates;

  for (size_t i = 0; i < chain.size(); i++) {
    const Credential::Link& link = chain[i];

    if (now < link.notBefore) {
      return GridError(
          ErrorInfo::EXPIRED_CHAIN,
          "Certificate '" + link.subject + "' is not valid before " +
          stringify(link.notBefore));
    }

    if (now >= link.notAfter) {
      return GridError(
          ErrorInfo::EXPIRED_CHAIN,
          "Certificate '" + link.subject + "' expired at " +
          stringify(link.notAfter));
    }

    Try<x509::Certificate> certificate = x509::decode(link.der);
    if (certificate.isError()) {
      return GridError(ErrorInfo::MALFORMED_CHAIN, certificate.error());
    }

    certificates.push_back(certificate.get());
  }

  for (size_t i = 0; i + 1 < certificates.size(); i++) {
    if (!x509::signedBy(certificates[i].get(), certificates[i + 1].get())) {
      return GridError(
          ErrorInfo::UNTRUSTED_ISSUER,
          "Signature of '" + chain[i].subject + "' does not verify");
    }

    // Authorities issue end entities, end entities and proxies issue
    // proxies.
    const bool authority = x509::isAuthority(certificates[i + 1].get());

    if (chain[i].proxy && authority) {
      return GridError(
          ErrorInfo::UNTRUSTED_ISSUER,
          "Proxy '" + chain[i].subject + "' is issued by an authority");
    }

    if (!chain[i].proxy && !authority) {
      return GridError(
          ErrorInfo::UNTRUSTED_ISSUER,
          "Certificate '" + chain[i].subject + "' is issued by '" +
          chain[i].issuer + "' which is not an authority");
    }
  }

  // A proxy may only keep or drop groups of its issuer.
  Option<hashset<string>> issued;

  for (size_t i = certificates.size(); i > 0; i--) {
    const Credential::Link& link = chain[i - 1];

    Result<hashset<string>> groups = extensionGroups(certificates[i - 1].get());
    if (groups.isError()) {
      return GridError(ErrorInfo::MALFORMED_CHAIN, groups.error());
    }

    if (groups.isNone()) {
      continue;
    }

    if (link.proxy) {
      foreach (const string& group, groups.get()) {
        if (issued.isNone() || !issued->contains(group)) {
          return GridError(
              ErrorInfo::UNTRUSTED_ISSUER,
              "Proxy '" + link.subject + "' claims group '" + group +
              "' its issuer does not hold");
        }
      }
    }

    issued = groups.get();
  }

  const Credential::Link& top = chain.back();

  if (top.proxy) {
    return GridError(
        ErrorInfo::UNTRUSTED_ISSUER,
        "Proxy '" + top.subject + "' is issued by an authority");
  }

  Option<GridError> expired;

  foreach (const TrustRoots::Root& root, roots.roots()) {
    bool anchored = root.der == top.der;

    if (!anchored && root.subject == top.issuer) {
      Try<x509::Certificate> certificate = x509::decode(root.der);
      anchored = certificate.isSome() &&
        x509::isAuthority(certificate->get()) &&
        x509::signedBy(certificates.back().get(), certificate->get());
    }

    if (!anchored) {
      continue;
    }

    if (now < root.notBefore || now >= root.notAfter) {
      // Another root with the same subject might still be valid.
      expired = GridError(
          ErrorInfo::EXPIRED_CHAIN,
          "Trust root '" + root.subject + "' is outside its validity window");
      continue;
    }

    return Nothing();
  }

  if (expired.isSome()) {
    return expired.get();
  }

  return GridError(
      ErrorInfo::UNTRUSTED_ISSUER,
      "Issuer '" + top.issuer + "' is not trusted");
}


bool verify(
    const Credential& credential,
    const TrustRoots& roots,
    const Time& now)
{
  return validate(credential, roots, now).isSome();
}


hashset<string> properties(
    const Credential& credential,
    const GroupProperties& groupProperties)
{
  hashset<string> result;

  foreach (const string& group, credential.groups()) {
    if (groupProperties.contains(group)) {
      foreach (const string& property, groupProperties.at(group)) {
        result.insert(property);
      }
    }
  }

  return result;
}


ostream& operator<<(ostream& stream, const Credential& credential)
{
  return stream << "(" << credential.identity() << ")"
                << "[" << strings::join(",", credential.groups()) << "]";
}

} // namespace gridware {
