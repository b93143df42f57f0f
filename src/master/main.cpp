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


#include <stdint.h>

#include <iostream>
#include <memory>
#include <string>

#include <google/protobuf/stubs/common.h>

#include <gridware/configuration.hpp>
#include <gridware/credential.hpp>
#include <gridware/version.hpp>

#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/try.hpp>

#include "authorizer/authorizer.hpp"

#include "configuration/cached_configuration.hpp"

#include "logging/logging.hpp"

#include "master/constants.hpp"
#include "master/flags.hpp"
#include "master/master.hpp"

#include "matcher/registry.hpp"

#include "service/dispatcher.hpp"

#include "transport/server.hpp"
#include "transport/tls.hpp"

using namespace gridware;
using namespace gridware::internal;
using namespace gridware::internal::master;

using process::Owned;

using std::cerr;
using std::cout;
using std::endl;
using std::shared_ptr;
using std::string;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  master::Flags flags;

  Try<flags::Warnings> load = flags.load("GRIDWARE_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (flags.version) {
    cout << "gridware" << " " << GRIDWARE_VERSION << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << load.error() << "\n\n"
         << "See `gridware-master --help` for a list of supported flags."
         << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], true, flags); // Catch signals.

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  LOG(INFO) << "Version: " << GRIDWARE_VERSION;

  if (flags.log_dir.isSome()) {
    Try<string> logFile = logging::getLogFile(google::INFO);
    if (logFile.isSome()) {
      LOG(INFO) << "Logging to " << logFile.get();
    }
  }

  if (flags.call_timeout > flags.max_call_timeout) {
    EXIT(EXIT_FAILURE)
      << "Expected `--call_timeout` to be at most `--max_call_timeout`";
  }

  if (!process::initialize()) {
    EXIT(EXIT_FAILURE) << "The call to `process::initialize()` in the "
                       << "master's `main()` was not its first invocation";
  }

  Try<TrustRoots> roots = TrustRoots::load(flags.trust_roots);
  if (roots.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to load trust roots: " << roots.error();
  }

  Try<tls::Identity> identity =
    tls::Identity::load(flags.certificate_file, flags.key_file);

  if (identity.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to load identity: " << identity.error();
  }

  Try<shared_ptr<tls::Context>> context =
    tls::Context::create(identity.get(), roots.get(), true);

  if (context.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to set up TLS: " << context.error();
  }

  Try<Owned<CachedConfiguration>> cached = CachedConfiguration::create(
      flags.configuration, flags.configuration_refresh_interval);

  if (cached.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to load configuration '" << flags.configuration << "': "
      << cached.error();
  }

  Owned<CachedConfiguration> owned = cached.get();
  shared_ptr<const Configuration> configuration(owned.release());

  // Every connection needs the group properties, so a configuration
  // without them is of no use.
  Try<GroupProperties> groups = groupProperties(*configuration);
  if (groups.isError()) {
    EXIT(EXIT_FAILURE) << "Invalid configuration: " << groups.error();
  }

  LOG(INFO) << "Configured " << groups->size() << " groups";

  Try<Owned<Master>> master = Master::create(
      configuration,
      flags.resource_silence_timeout,
      static_cast<size_t>(flags.max_match_attempts));

  if (master.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to create master: " << master.error();
  }

  Dispatcher dispatcher(
      COMPONENT,
      static_cast<size_t>(flags.worker_threads),
      flags.call_timeout,
      flags.max_call_timeout);

  Try<Nothing> install = master.get()->install(&dispatcher);
  if (install.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to install methods: " << install.error();
  }

  RegistryExpirer expirer(
      master.get()->registry(),
      flags.resource_expiry_interval,
      master.get()->queue(),
      flags.job_retention);

  Server server(
      context.get(),
      &dispatcher,
      configuration,
      flags.handshake_timeout);

  Try<Nothing> start =
    server.start(flags.ip, static_cast<uint16_t>(flags.port));

  if (start.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to start server: " << start.error();
  }

  server.join();

  return EXIT_SUCCESS;
}
