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


#include <arpa/inet.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <netinet/in.h>

#include <sys/socket.h>
#include <sys/types.h>

#include <list>
#include <memory>
#include <string>
#include <thread>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/future.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/ip.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

#include <stout/os/close.hpp>
#include <stout/os/socket.hpp>

#include "authorizer/authorizer.hpp"

#include "messages/messages.hpp"

#include "transport/server.hpp"

using process::Clock;
using process::Future;

using std::list;
using std::shared_ptr;
using std::string;

namespace gridware {
namespace internal {

Server::Server(
    const shared_ptr<tls::Context>& _context,
    Dispatcher* _dispatcher,
    const shared_ptr<const Configuration>& _configuration,
    const Duration& _handshakeTimeout)
  : context(_context),
    dispatcher(CHECK_NOTNULL(_dispatcher)),
    configuration(_configuration),
    handshakeTimeout(_handshakeTimeout),
    fd(-1),
    port_(0),
    stopping(false),
    finished(false),
    nextId(0) {}


Server::~Server()
{
  stop();
}


Try<Nothing> Server::start(const string& ip, uint16_t port)
{
  CHECK(acceptor == nullptr) << "Server already started";

  Try<net::IP> address = net::IP::parse(ip, AF_INET);
  if (address.isError()) {
    return Error("Invalid address '" + ip + "': " + address.error());
  }

  Try<struct in_addr> in = address->in();
  if (in.isError()) {
    return Error(in.error());
  }

  Try<int_fd> socket = net::socket(AF_INET, SOCK_STREAM, 0);
  if (socket.isError()) {
    return Error("Failed to create socket: " + socket.error());
  }

  int on = 1;
  if (::setsockopt(
          socket.get(), SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
    ErrnoError error("Failed to set SO_REUSEADDR");
    os::close(socket.get());
    return error;
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr = in.get();

  if (::bind(
          socket.get(),
          reinterpret_cast<struct sockaddr*>(&addr),
          sizeof(addr)) < 0) {
    ErrnoError error("Failed to bind " + ip + ":" + stringify(port));
    os::close(socket.get());
    return error;
  }

  if (::listen(socket.get(), SOMAXCONN) < 0) {
    ErrnoError error("Failed to listen on " + ip + ":" + stringify(port));
    os::close(socket.get());
    return error;
  }

  socklen_t length = sizeof(addr);
  if (::getsockname(
          socket.get(),
          reinterpret_cast<struct sockaddr*>(&addr),
          &length) < 0) {
    ErrnoError error("Failed to get the bound address");
    os::close(socket.get());
    return error;
  }

  fd = socket.get();
  port_ = ntohs(addr.sin_port);

  acceptor.reset(new std::thread(&Server::accept, this));

  LOG(INFO) << "Listening for " << dispatcher->component() << " calls on "
            << ip << ":" << port_;

  return Nothing();
}


void Server::stop()
{
  if (stopping.exchange(true)) {
    return;
  }

  if (acceptor != nullptr) {
    // Wakes up the acceptor blocked in 'accept'.
    ::shutdown(fd, SHUT_RDWR);
    acceptor->join();

    Try<Nothing> close = os::close(fd);
    if (close.isError()) {
      LOG(WARNING) << "Failed to close listening socket: " << close.error();
    }
  }

  list<std::thread> finishing;

  synchronized (mutex) {
    foreachvalue (const shared_ptr<Connection>& connection, connections) {
      connection->shutdown();
    }

    foreachvalue (std::thread& thread, threads) {
      finishing.push_back(std::move(thread));
    }

    threads.clear();
    closed.clear();
  }

  foreach (std::thread& thread, finishing) {
    thread.join();
  }

  synchronized (mutex) {
    finished = true;
    stopped.notify_all();
  }

  LOG(INFO) << "Stopped serving " << dispatcher->component();
}


void Server::join()
{
  synchronized (mutex) {
    while (!finished) {
      synchronized_wait(&stopped, &mutex);
    }
  }
}


void Server::accept()
{
  while (!stopping.load()) {
    struct sockaddr_in addr;
    socklen_t length = sizeof(addr);

    int client = ::accept(
        fd, reinterpret_cast<struct sockaddr*>(&addr), &length);

    if (client < 0) {
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }

      if (!stopping.load()) {
        PLOG(ERROR) << "Failed to accept connection";
      }

      break;
    }

    char buffer[INET_ADDRSTRLEN];
    const char* ip = inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer));

    const string peer =
      string(ip != nullptr ? ip : "unknown") + ":" +
      stringify(ntohs(addr.sin_port));

    reap();

    synchronized (mutex) {
      if (stopping.load()) {
        os::close(client);
        break;
      }

      const uint64_t id = nextId++;
      threads[id] = std::thread(&Server::serve, this, id, client, peer);
    }
  }
}


size_t Server::running()
{
  reap();

  synchronized (mutex) {
    return threads.size();
  }

  UNREACHABLE();
}


void Server::reap()
{
  list<std::thread> finishing;

  synchronized (mutex) {
    foreach (uint64_t id, closed) {
      if (threads.contains(id)) {
        finishing.push_back(std::move(threads[id]));
        threads.erase(id);
      }
    }

    closed.clear();
  }

  // These threads are past their last use of the server.
  foreach (std::thread& thread, finishing) {
    thread.join();
  }
}


void Server::serve(uint64_t id, int client, const string& peer)
{
  Outcome<shared_ptr<Connection>> connection =
    Connection::accept(client, peer, context, handshakeTimeout);

  if (connection.isError()) {
    LOG(WARNING) << "Failed to establish connection with " << peer << ": "
                 << connection.error();
  } else {
    bool serving = false;

    synchronized (mutex) {
      if (!stopping.load()) {
        connections[id] = connection.get();
        serving = true;
      }
    }

    if (serving) {
      _serve(connection.get());

      synchronized (mutex) {
        connections.erase(id);
      }

      VLOG(1) << "Closed connection with " << peer;
    }
  }

  synchronized (mutex) {
    closed.push_back(id);
  }
}


void Server::_serve(const shared_ptr<Connection>& connection)
{
  const CallContext context(
      grant(connection->credential()),
      connection->peer());

  while (!stopping.load()) {
    Outcome<Option<string>> message = connection->receive();

    if (message.isError()) {
      LOG(WARNING) << "Failed to receive from " << context << ": "
                   << message.error();
      return;
    }

    if (message->isNone()) {
      return;
    }

    Try<Call> call = messages::deserialize<Call>(message->get());
    if (call.isError() || !call->IsInitialized()) {
      LOG(WARNING) << "Closing connection with " << context
                   << " after an invalid call";
      return;
    }

    Response response;

    if (Clock::now() >= context.credential.expiry()) {
      LOG(WARNING) << "Credential of " << context << " expired at "
                   << context.credential.expiry();

      response = messages::response(call->id(), Outcome<Nothing>(GridError(
          ErrorInfo::EXPIRED_CHAIN, "Credential expired")));

      Outcome<Nothing> send = connection->send(response.SerializeAsString());
      if (send.isError()) {
        LOG(WARNING) << "Failed to respond to " << context << ": "
                     << send.error();
      }

      return;
    }

    Future<Response> future = dispatcher->dispatch(context, call.get());

    future.await();

    if (future.isReady()) {
      response = future.get();
    } else {
      LOG(ERROR) << "Call '" << call->method() << "' of " << context
                 << " did not complete: "
                 << (future.isFailed() ? future.failure() : "discarded");

      response = messages::response(call->id(), Outcome<Nothing>(
          GridError(ErrorInfo::INTERNAL_ERROR, "Internal error")));
    }

    Try<string> serialized = messages::serialize(response);
    if (serialized.isError()) {
      LOG(ERROR) << "Failed to serialize response to " << context << ": "
                 << serialized.error();
      return;
    }

    Outcome<Nothing> send = connection->send(serialized.get());
    if (send.isError()) {
      LOG(WARNING) << "Failed to respond to " << context << ": "
                   << send.error();
      return;
    }
  }
}


Credential Server::grant(const Credential& credential) const
{
  if (configuration == nullptr) {
    return credential;
  }

  Try<GroupProperties> groups = groupProperties(*configuration);
  if (groups.isError()) {
    LOG(WARNING) << "Granting no properties to " << credential
                 << ": " << groups.error();
    return credential.grant(hashset<string>());
  }

  return credential.grant(properties(credential, groups.get()));
}

} // namespace internal {
} // namespace gridware {
