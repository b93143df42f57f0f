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

#ifndef __CREDENTIAL_X509_HPP__
#define __CREDENTIAL_X509_HPP__

#include <openssl/x509.h>

#include <memory>
#include <string>
#include <vector>

#include <process/time.hpp>

#include <stout/option.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace gridware {
namespace internal {
namespace x509 {

// Owns a decoded certificate.
typedef std::shared_ptr<X509> Certificate;


// Returns the DER encoding of every certificate of a PEM document in
// document order. Blocks that are not certificates are skipped.
Try<std::vector<std::string>> certificates(const std::string& pem);


Try<Certificate> decode(const std::string& der);


Try<std::string> encode(X509* certificate);


// Returns the name in the "/O=Grid/CN=name" form.
std::string name(X509_NAME* name);


Try<process::Time> time(const ASN1_TIME* time);


// Returns true for RFC 3820 proxy certificates and for legacy Globus
// proxies, whose subject is the issuer followed by "CN=proxy",
// "CN=limited proxy" or a numeric "CN".
bool isProxy(X509* certificate);


// Returns true if the certificate may issue other certificates, as
// decided by OpenSSL from its basic constraints and key usage.
bool isAuthority(X509* certificate);


// Returns the value of the extension with the given object
// identifier, decoded as a string.
Result<std::string> extension(X509* certificate, const std::string& oid);


// Returns true if 'issuer' signed 'certificate'.
bool signedBy(X509* certificate, X509* issuer);


// Returns the description of an OpenSSL error code.
std::string error_string(unsigned long code);


// Returns the description of every pending OpenSSL error of this
// thread and clears them.
std::string errors();

} // namespace x509 {
} // namespace internal {
} // namespace gridware {

#endif // __CREDENTIAL_X509_HPP__
