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
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include <netinet/in.h>

#include <sys/socket.h>
#include <sys/types.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <memory>
#include <string>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/time.hpp>

#include <stout/check.hpp>
#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/ip.hpp>
#include <stout/net.hpp>
#include <stout/stringify.hpp>

#include <stout/os/close.hpp>
#include <stout/os/fcntl.hpp>
#include <stout/os/signals.hpp>
#include <stout/os/socket.hpp>
#include <stout/os/strerror.hpp>

#include "transport/connection.hpp"

using process::Clock;
using process::Time;

using std::deque;
using std::shared_ptr;
using std::string;

namespace gridware {
namespace internal {

// Blocks until 'fd' is ready for 'events' or the deadline passes.
static Outcome<Nothing> wait(
    int fd,
    short events,
    const Option<Time>& deadline)
{
  for (;;) {
    int timeout = -1;

    if (deadline.isSome()) {
      const Time now = Clock::now();
      timeout = deadline.get() > now
        ? static_cast<int>((deadline.get() - now).ms()) + 1
        : 0;
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, timeout);

    if (result > 0) {
      return Nothing();
    }

    if (result == 0) {
      return GridError(ErrorInfo::TIMEOUT, "Timed out waiting for peer");
    }

    if (errno != EINTR) {
      return GridError(
          ErrorInfo::UNAVAILABLE,
          "Failed to poll socket: " + os::strerror(errno));
    }
  }
}


Outcome<shared_ptr<Connection>> Connection::accept(
    int fd,
    const string& peer,
    const shared_ptr<tls::Context>& context,
    const Duration& timeout)
{
  return handshake(fd, peer, context, timeout, true);
}


Outcome<shared_ptr<Connection>> Connection::connect(
    const string& host,
    uint16_t port,
    const shared_ptr<tls::Context>& context,
    const Duration& timeout)
{
  const string peer = host + ":" + stringify(port);

  Try<net::IP> ip = net::getIP(host, AF_INET);
  if (ip.isError()) {
    return GridError(
        ErrorInfo::UNAVAILABLE,
        "Failed to resolve '" + host + "': " + ip.error());
  }

  Try<struct in_addr> in = ip->in();
  if (in.isError()) {
    return GridError(ErrorInfo::UNAVAILABLE, in.error());
  }

  Try<int_fd> fd = net::socket(AF_INET, SOCK_STREAM, 0);
  if (fd.isError()) {
    return GridError(
        ErrorInfo::UNAVAILABLE,
        "Failed to create socket: " + fd.error());
  }

  Try<Nothing> nonblock = os::nonblock(fd.get());
  if (nonblock.isError()) {
    os::close(fd.get());
    return GridError(ErrorInfo::UNAVAILABLE, nonblock.error());
  }

  struct sockaddr_in address;
  memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_port = htons(port);
  address.sin_addr = in.get();

  const Time deadline = Clock::now() + timeout;

  if (::connect(
          fd.get(),
          reinterpret_cast<struct sockaddr*>(&address),
          sizeof(address)) < 0) {
    if (errno != EINPROGRESS) {
      ErrnoError error("Failed to connect to " + peer);
      os::close(fd.get());
      return GridError(ErrorInfo::UNAVAILABLE, error.message);
    }

    Outcome<Nothing> connected = wait(fd.get(), POLLOUT, deadline);
    if (connected.isError()) {
      os::close(fd.get());
      return connected.error().wrap("Failed to connect to " + peer);
    }

    int error = 0;
    socklen_t length = sizeof(error);
    if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &error, &length) < 0) {
      error = errno;
    }

    if (error != 0) {
      os::close(fd.get());
      return GridError(
          ErrorInfo::UNAVAILABLE,
          "Failed to connect to " + peer + ": " + os::strerror(error));
    }
  }

  return handshake(fd.get(), peer, context, deadline - Clock::now(), false);
}


Outcome<shared_ptr<Connection>> Connection::handshake(
    int fd,
    const string& peer,
    const shared_ptr<tls::Context>& context,
    const Duration& timeout,
    bool server)
{
  Try<Nothing> nonblock = os::nonblock(fd);
  if (nonblock.isError()) {
    os::close(fd);
    return GridError(ErrorInfo::UNAVAILABLE, nonblock.error());
  }

  // The verification outcome only lives during the handshake; the
  // credential is copied into the connection.
  tls::Verification verification;

  Try<SSL*> ssl = context->session(&verification);
  if (ssl.isError()) {
    os::close(fd);
    return GridError(ErrorInfo::INTERNAL_ERROR, ssl.error());
  }

  auto fail = [&](const GridError& error) {
    SSL_free(ssl.get());
    os::close(fd);
    return error;
  };

  if (SSL_set_fd(ssl.get(), fd) != 1) {
    return fail(GridError(ErrorInfo::INTERNAL_ERROR, tls::error(ssl.get(), 0)));
  }

  const Time deadline = Clock::now() + timeout;

  for (;;) {
    ERR_clear_error();

    int ret = -1;
    SUPPRESS (SIGPIPE) {
      ret = server ? SSL_accept(ssl.get()) : SSL_connect(ssl.get());
    }
    if (ret == 1) {
      break;
    }

    int code = SSL_get_error(ssl.get(), ret);

    if (code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE) {
      Outcome<Nothing> ready = wait(
          fd, code == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);

      if (ready.isError()) {
        return fail(ready.error().wrap("TLS handshake with " + peer));
      }

      continue;
    }

    // A chain refused by the credential model carries its own failure.
    if (verification.error.isSome()) {
      LOG(WARNING) << "Refused peer " << peer << ": "
                   << verification.error.get();

      return fail(verification.error.get());
    }

    return fail(GridError(
        ErrorInfo::UNAVAILABLE,
        "TLS handshake with " + peer + " failed: " +
        tls::error(ssl.get(), ret)));
  }

  // The handshake cannot complete without the callback having
  // accepted the chain.
  CHECK_SOME(verification.credential);

  VLOG(1) << "Established TLS connection with " << peer << " as "
          << verification.credential.get();

  return shared_ptr<Connection>(new Connection(
      fd, ssl.get(), peer, verification.credential.get(), context));
}


Connection::~Connection()
{
  // The close notification is best effort; the peer treats a missing
  // one as end of stream as well.
  ERR_clear_error();

  int ret = 0;
  SUPPRESS (SIGPIPE) {
    ret = SSL_shutdown(ssl);
  }

  if (ret < 0) {
    VLOG(2) << "Failed to send close notification to " << peer_ << ": "
            << tls::error(ssl, -1);
  }

  SSL_free(ssl);

  Try<Nothing> close = os::close(fd);
  if (close.isError()) {
    LOG(WARNING) << "Failed to close connection to " << peer_ << ": "
                 << close.error();
  }
}


void Connection::shutdown()
{
  if (::shutdown(fd, SHUT_RDWR) < 0 && errno != ENOTCONN) {
    PLOG(WARNING) << "Failed to shutdown connection to " << peer_;
  }
}


Outcome<Nothing> Connection::send(const string& message)
{
  const string record = ::recordio::encode(message);

  for (;;) {
    ERR_clear_error();

    // Writing to a peer that already closed must not raise SIGPIPE.
    int ret = -1;
    SUPPRESS (SIGPIPE) {
      ret = SSL_write(ssl, record.data(), static_cast<int>(record.size()));
    }
    if (ret > 0) {
      // Partial writes are not enabled, so the whole record is out.
      CHECK_EQ(static_cast<size_t>(ret), record.size());
      return Nothing();
    }

    int code = SSL_get_error(ssl, ret);

    if (code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE) {
      Outcome<Nothing> ready =
        wait(fd, code == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, None());

      if (ready.isError()) {
        return ready.error().translate(
            ErrorInfo::UNAVAILABLE, "Failed to send to " + peer_);
      }

      continue;
    }

    return GridError(
        ErrorInfo::UNAVAILABLE,
        "Failed to send to " + peer_ + ": " + tls::error(ssl, ret));
  }
}


Outcome<Option<string>> Connection::receive(const Option<Duration>& timeout)
{
  Option<Time> deadline;
  if (timeout.isSome()) {
    deadline = Clock::now() + timeout.get();
  }

  char buffer[16384];

  while (records.empty()) {
    ERR_clear_error();

    int ret = SSL_read(ssl, buffer, sizeof(buffer));
    if (ret > 0) {
      Try<deque<string>> decode = decoder.decode(string(buffer, ret));
      if (decode.isError()) {
        return GridError(
            ErrorInfo::UNAVAILABLE,
            "Failed to decode message from " + peer_ + ": " + decode.error());
      }

      foreach (const string& record, decode.get()) {
        records.push_back(record);
      }

      continue;
    }

    int code = SSL_get_error(ssl, ret);

    if (code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE) {
      Outcome<Nothing> ready =
        wait(fd, code == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);

      if (ready.isError()) {
        if (ready.error().code == ErrorInfo::TIMEOUT) {
          return GridError(
              ErrorInfo::TIMEOUT,
              "No message from " + peer_ + " within " +
              stringify(timeout.get()));
        }

        return ready.error();
      }

      continue;
    }

    if (code == SSL_ERROR_ZERO_RETURN ||
        (code == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && ret == 0)) {
      return Option<string>::none();
    }

    return GridError(
        ErrorInfo::UNAVAILABLE,
        "Failed to receive from " + peer_ + ": " + tls::error(ssl, ret));
  }

  string record = records.front();
  records.pop_front();

  return Option<string>(record);
}

} // namespace internal {
} // namespace gridware {
