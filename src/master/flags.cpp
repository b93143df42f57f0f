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


#include <string>

#include <stout/error.hpp>
#include <stout/flags.hpp>
#include <stout/stringify.hpp>

#include "master/constants.hpp"
#include "master/flags.hpp"

using std::string;

gridware::internal::master::Flags::Flags()
{
  add(&Flags::version,
      "version",
      "Show version and exit.",
      false);

  add(&Flags::ip,
      "ip",
      "IP address to listen on.",
      "0.0.0.0");

  add(&Flags::port,
      "port",
      "Port to listen on.",
      DEFAULT_PORT,
      [](int value) -> Option<Error> {
        if (value < 0 || value > 65535) {
          return Error("Invalid port " + stringify(value));
        }
        return None();
      });

  add(&Flags::certificate_file,
      "certificate_file",
      "Path of the PEM file holding the certificate chain of the master,\n"
      "leaf first. The private key may be kept in the same file.");

  add(&Flags::key_file,
      "key_file",
      "Path of the PEM file holding the private key of the master.\n"
      "By default the key is read from `--certificate_file`.");

  add(&Flags::trust_roots,
      "trust_roots",
      "Path of a PEM file, or of a directory of `.pem` and `.crt` files,\n"
      "holding the certificates every peer chain has to lead to.");

  add(&Flags::configuration,
      "configuration",
      "Path of the JSON configuration document. It must define the\n"
      "`/Registry/Groups` section.");

  add(&Flags::configuration_refresh_interval,
      "configuration_refresh_interval",
      "Minimum time between two reads of `--configuration`.",
      DEFAULT_CONFIGURATION_REFRESH_INTERVAL);

  add(&Flags::worker_threads,
      "worker_threads",
      "Number of threads running calls.",
      static_cast<int>(DEFAULT_WORKER_THREADS),
      [](int value) -> Option<Error> {
        if (value <= 0) {
          return Error("Expected `--worker_threads` to be positive");
        }
        return None();
      });

  add(&Flags::call_timeout,
      "call_timeout",
      "Timeout of calls that name none.",
      DEFAULT_CALL_TIMEOUT);

  add(&Flags::max_call_timeout,
      "max_call_timeout",
      "Upper bound of the timeout a caller can ask for.",
      DEFAULT_MAX_CALL_TIMEOUT);

  add(&Flags::handshake_timeout,
      "handshake_timeout",
      "Time a TLS handshake may take.",
      DEFAULT_HANDSHAKE_TIMEOUT);

  add(&Flags::max_match_attempts,
      "max_match_attempts",
      "Number of jobs a match request tries to claim before telling\n"
      "the resource there is no work.",
      10,
      [](int value) -> Option<Error> {
        if (value <= 0) {
          return Error("Expected `--max_match_attempts` to be positive");
        }
        return None();
      });

  add(&Flags::resource_silence_timeout,
      "resource_silence_timeout",
      "A resource that did not call in for this long is evicted and the\n"
      "jobs matched to it are released.",
      DEFAULT_RESOURCE_SILENCE_TIMEOUT);

  add(&Flags::resource_expiry_interval,
      "resource_expiry_interval",
      "How often to look for silent resources and finished jobs\n"
      "past their retention.",
      DEFAULT_RESOURCE_EXPIRY_INTERVAL);

  add(&Flags::job_retention,
      "job_retention",
      "How long a finished job stays queryable, and its idempotency\n"
      "token keeps deduplicating submissions.",
      DEFAULT_JOB_RETENTION);
}
