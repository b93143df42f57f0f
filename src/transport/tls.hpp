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


#ifndef __TRANSPORT_TLS_HPP__
#define __TRANSPORT_TLS_HPP__

#include <openssl/ssl.h>

#include <memory>
#include <string>

#include <gridware/credential.hpp>
#include <gridware/outcome.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

namespace gridware {
namespace internal {
namespace tls {

// The certificate chain (leaf first) and private key a side of a
// connection presents, both PEM encoded.
struct Identity
{
  // The key may be kept in the certificate file, as is usual for
  // proxy certificates; pass None to read it from there.
  static Try<Identity> load(
      const std::string& certificateFile,
      const Option<std::string>& keyFile = None());

  std::string certificates;
  std::string key;
};


// What the verification of a peer chain produced. Filled in during
// the handshake.
struct Verification
{
  Option<Credential> credential;
  Option<GridError> error;
};


// Owns an SSL_CTX that presents an identity and accepts exactly the
// peers whose chains validate against the trust roots. Both sides
// have to present a chain.
class Context
{
public:
  static Try<std::shared_ptr<Context>> create(
      const Identity& identity,
      const TrustRoots& roots,
      bool server);

  ~Context();

  // Returns a new SSL object whose verification result is written to
  // 'verification', which has to outlive it.
  Try<SSL*> session(Verification* verification) const;

  const TrustRoots& roots() const { return roots_; }

private:
  Context(SSL_CTX* _ctx, const TrustRoots& _roots)
    : ctx(_ctx), roots_(_roots) {}

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  SSL_CTX* ctx;
  const TrustRoots roots_;
};


// Returns the description of every pending OpenSSL error of this
// thread, adding the errno description for SSL_ERROR_SYSCALL.
std::string error(SSL* ssl, int ret);

} // namespace tls {
} // namespace internal {
} // namespace gridware {

#endif // __TRANSPORT_TLS_HPP__
