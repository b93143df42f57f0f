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


#include <errno.h>
#include <string.h>

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/once.hpp>

#include <stout/foreach.hpp>
#include <stout/os/read.hpp>

#include "credential/x509.hpp"

#include "transport/tls.hpp"

namespace x509 = gridware::internal::x509;

using process::Once;

using std::shared_ptr;
using std::string;
using std::vector;

namespace gridware {
namespace internal {
namespace tls {

Try<Identity> Identity::load(
    const string& certificateFile,
    const Option<string>& keyFile)
{
  Try<string> certificates = os::read(certificateFile);
  if (certificates.isError()) {
    return Error(
        "Failed to read certificate file '" + certificateFile + "': " +
        certificates.error());
  }

  Identity identity;
  identity.certificates = certificates.get();

  if (keyFile.isNone()) {
    identity.key = certificates.get();
    return identity;
  }

  Try<string> key = os::read(keyFile.get());
  if (key.isError()) {
    return Error(
        "Failed to read key file '" + keyFile.get() + "': " + key.error());
  }

  identity.key = key.get();
  return identity;
}


// Index of the 'Verification' attached to every SSL object.
static int verification_index()
{
  static Once* initialized = new Once();
  static int index = -1;

  if (!initialized->once()) {
    index = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
    CHECK_GE(index, 0) << "Failed to allocate SSL ex_data index";
    initialized->done();
  }

  return index;
}


// Replaces the chain verification of OpenSSL. The peer chain is
// ordered leaf first by following issuer names and handed to the
// credential model; the handshake fails unless it validates.
static int verify_callback(X509_STORE_CTX* store, void* arg)
{
  const Context* context = static_cast<const Context*>(arg);

  SSL* ssl = static_cast<SSL*>(X509_STORE_CTX_get_ex_data(
      store, SSL_get_ex_data_X509_STORE_CTX_idx()));

  CHECK_NOTNULL(ssl);

  Verification* verification = static_cast<Verification*>(
      SSL_get_ex_data(ssl, verification_index()));

  CHECK_NOTNULL(verification);

  X509* leaf = X509_STORE_CTX_get0_cert(store);
  if (leaf == nullptr) {
    verification->error =
      GridError(ErrorInfo::MALFORMED_CHAIN, "Peer presented no certificate");
    return 0;
  }

  STACK_OF(X509)* untrusted = X509_STORE_CTX_get0_untrusted(store);

  vector<X509*> intermediates;
  if (untrusted != nullptr) {
    for (int i = 0; i < sk_X509_num(untrusted); i++) {
      X509* certificate = sk_X509_value(untrusted, i);
      if (X509_cmp(certificate, leaf) != 0) {
        intermediates.push_back(certificate);
      }
    }
  }

  vector<string> chain;

  X509* current = leaf;
  while (current != nullptr) {
    Try<string> der = x509::encode(current);
    if (der.isError()) {
      verification->error = GridError(ErrorInfo::MALFORMED_CHAIN, der.error());
      return 0;
    }

    chain.push_back(der.get());

    // Each certificate is used at most once, which bounds the walk.
    X509* next = nullptr;
    for (size_t i = 0; i < intermediates.size(); i++) {
      if (X509_NAME_cmp(
              X509_get_subject_name(intermediates[i]),
              X509_get_issuer_name(current)) == 0) {
        next = intermediates[i];
        intermediates.erase(intermediates.begin() + i);
        break;
      }
    }

    current = next;
  }

  Outcome<Credential> credential = Credential::create(chain);
  if (credential.isError()) {
    verification->error = credential.error();
    return 0;
  }

  Outcome<Nothing> validated = validate(credential.get(), context->roots());
  if (validated.isError()) {
    verification->error = validated.error();
    return 0;
  }

  verification->credential = credential.get();

  return 1;
}


Try<shared_ptr<Context>> Context::create(
    const Identity& identity,
    const TrustRoots& roots,
    bool server)
{
  Try<vector<string>> certificates = x509::certificates(identity.certificates);
  if (certificates.isError()) {
    return Error("Invalid certificates: " + certificates.error());
  }

  if (certificates->empty()) {
    return Error("No certificate found");
  }

  SSL_CTX* ctx =
    SSL_CTX_new(server ? TLS_server_method() : TLS_client_method());
  if (ctx == nullptr) {
    return Error("Failed to create SSL context: " + x509::errors());
  }

  // From here on the context frees 'ctx'.
  shared_ptr<Context> context(new Context(ctx, roots));

  // Only TLS 1.2 and later.
  SSL_CTX_set_options(
      ctx,
      SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_NO_TLSv1 | SSL_OP_NO_TLSv1_1);

#if defined(SSL_OP_IGNORE_UNEXPECTED_EOF)
  // A peer closing without a close notification ends the stream.
  SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif // SSL_OP_IGNORE_UNEXPECTED_EOF

  SSL_CTX_set_mode(ctx, SSL_MODE_AUTO_RETRY);
  SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_OFF);

  for (size_t i = 0; i < certificates->size(); i++) {
    Try<x509::Certificate> certificate = x509::decode(certificates->at(i));
    if (certificate.isError()) {
      return Error(certificate.error());
    }

    int result = i == 0
      ? SSL_CTX_use_certificate(ctx, certificate->get())
      : SSL_CTX_add1_chain_cert(ctx, certificate->get());

    if (result != 1) {
      return Error("Failed to use certificate: " + x509::errors());
    }
  }

  BIO* bio = BIO_new_mem_buf(
      identity.key.data(), static_cast<int>(identity.key.size()));

  if (bio == nullptr) {
    return Error("Failed to allocate BIO: " + x509::errors());
  }

  EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);

  if (key == nullptr) {
    return Error("Failed to read private key: " + x509::errors());
  }

  int used = SSL_CTX_use_PrivateKey(ctx, key);
  EVP_PKEY_free(key);

  if (used != 1) {
    return Error("Failed to use private key: " + x509::errors());
  }

  if (SSL_CTX_check_private_key(ctx) != 1) {
    return Error("Private key does not match certificate: " + x509::errors());
  }

  SSL_CTX_set_verify(
      ctx, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);

  SSL_CTX_set_cert_verify_callback(ctx, &verify_callback, context.get());

  return context;
}


Context::~Context()
{
  SSL_CTX_free(ctx);
}


Try<SSL*> Context::session(Verification* verification) const
{
  SSL* ssl = SSL_new(ctx);
  if (ssl == nullptr) {
    return Error("Failed to create SSL object: " + x509::errors());
  }

  if (SSL_set_ex_data(ssl, verification_index(), verification) != 1) {
    SSL_free(ssl);
    return Error("Failed to attach verification: " + x509::errors());
  }

  return ssl;
}


string error(SSL* ssl, int ret)
{
  int code = SSL_get_error(ssl, ret);

  switch (code) {
    case SSL_ERROR_ZERO_RETURN:
      return "Connection closed by peer";
    case SSL_ERROR_SYSCALL:
      if (ERR_peek_error() == 0) {
        return errno == 0 ? "Unexpected EOF" : string(strerror(errno));
      }
      break;
    default:
      break;
  }

  return x509::errors();
}

} // namespace tls {
} // namespace internal {
} // namespace gridware {
