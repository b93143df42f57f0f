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


#ifndef __TRANSPORT_SERVER_HPP__
#define __TRANSPORT_SERVER_HPP__

#include <stdint.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gridware/configuration.hpp>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "service/dispatcher.hpp"

#include "transport/connection.hpp"
#include "transport/tls.hpp"

namespace gridware {
namespace internal {

// Accepts TLS connections and feeds the calls arriving on them to a
// dispatcher. Every connection is served by its own thread; calls on
// a connection are answered in the order they arrive.
//
// The credential of a connection is granted the properties of its
// groups as configured below "/Registry/Groups" when the connection
// is established.
class Server
{
public:
  Server(
      const std::shared_ptr<tls::Context>& context,
      Dispatcher* dispatcher,
      const std::shared_ptr<const Configuration>& configuration,
      const Duration& handshakeTimeout = Seconds(30));

  ~Server();

  // Binds and starts accepting. Port 0 picks a free port.
  Try<Nothing> start(const std::string& ip, uint16_t port);

  // The port bound by 'start'.
  uint16_t port() const { return port_; }

  // Stops accepting, closes every connection and waits for the
  // connection threads to finish.
  void stop();

  // Blocks until 'stop' was called.
  void join();

  // Number of connection threads not joined yet, after joining those
  // whose connection closed.
  size_t running();

private:
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void accept();

  // Joins the threads of closed connections.
  void reap();

  // Runs on a connection thread: completes the handshake and serves
  // the calls until the peer goes away or the server stops.
  void serve(uint64_t id, int fd, const std::string& peer);

  void _serve(const std::shared_ptr<Connection>& connection);

  Credential grant(const Credential& credential) const;

  const std::shared_ptr<tls::Context> context;
  Dispatcher* dispatcher;
  const std::shared_ptr<const Configuration> configuration;
  const Duration handshakeTimeout;

  int fd;
  uint16_t port_;
  std::atomic<bool> stopping;

  std::unique_ptr<std::thread> acceptor;

  std::mutex mutex;
  std::condition_variable stopped;
  bool finished;
  uint64_t nextId;
  hashmap<uint64_t, std::shared_ptr<Connection>> connections;
  hashmap<uint64_t, std::thread> threads;
  std::vector<uint64_t> closed;
};

} // namespace internal {
} // namespace gridware {

#endif // __TRANSPORT_SERVER_HPP__
