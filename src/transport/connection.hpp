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


#ifndef __TRANSPORT_CONNECTION_HPP__
#define __TRANSPORT_CONNECTION_HPP__

#include <openssl/ssl.h>

#include <stdint.h>

#include <deque>
#include <memory>
#include <string>

#include <gridware/credential.hpp>
#include <gridware/outcome.hpp>

#include <stout/duration.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/recordio.hpp>

#include "transport/tls.hpp"

namespace gridware {
namespace internal {

// A TLS connection whose peer presented a valid chain. Messages are
// exchanged as recordio records.
//
// A connection is used by one thread at a time, except for
// 'shutdown', which may be called from any thread to unblock a
// pending 'receive'.
class Connection
{
public:
  // Completes the server side handshake on an accepted socket. Takes
  // ownership of 'fd'.
  static Outcome<std::shared_ptr<Connection>> accept(
      int fd,
      const std::string& peer,
      const std::shared_ptr<tls::Context>& context,
      const Duration& timeout);

  static Outcome<std::shared_ptr<Connection>> connect(
      const std::string& host,
      uint16_t port,
      const std::shared_ptr<tls::Context>& context,
      const Duration& timeout);

  ~Connection();

  // The credential of the peer.
  const Credential& credential() const { return credential_; }

  // The "ip:port" of the peer.
  const std::string& peer() const { return peer_; }

  Outcome<Nothing> send(const std::string& message);

  // Returns None once the peer closed the connection. Fails with
  // TIMEOUT if no complete message arrived within 'timeout' and with
  // UNAVAILABLE if the connection broke.
  Outcome<Option<std::string>> receive(
      const Option<Duration>& timeout = None());

  // Closes the socket for reading and writing.
  void shutdown();

private:
  Connection(
      int _fd,
      SSL* _ssl,
      const std::string& _peer,
      const Credential& _credential,
      const std::shared_ptr<tls::Context>& _context)
    : fd(_fd),
      ssl(_ssl),
      peer_(_peer),
      credential_(_credential),
      context(_context) {}

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  static Outcome<std::shared_ptr<Connection>> handshake(
      int fd,
      const std::string& peer,
      const std::shared_ptr<tls::Context>& context,
      const Duration& timeout,
      bool server);

  const int fd;
  SSL* ssl;
  const std::string peer_;
  const Credential credential_;

  // Keeps the SSL_CTX of 'ssl' alive.
  const std::shared_ptr<tls::Context> context;

  ::recordio::Decoder decoder;
  std::deque<std::string> records;
};

} // namespace internal {
} // namespace gridware {

#endif // __TRANSPORT_CONNECTION_HPP__
