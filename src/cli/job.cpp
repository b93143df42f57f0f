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
#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include <gridware/credential.hpp>
#include <gridware/gridware.hpp>

#include <process/owned.hpp>

#include <stout/duration.hpp>
#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/numify.hpp>
#include <stout/option.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "client/workload_client.hpp"

#include "logging/logging.hpp"

#include "transport/client.hpp"
#include "transport/tls.hpp"

using namespace gridware;
using namespace gridware::internal;

using process::Owned;

using std::cerr;
using std::cout;
using std::endl;
using std::string;
using std::vector;


class Flags : public virtual logging::Flags
{
public:
  Flags()
  {
    add(&Flags::master,
        "master",
        "Address of the workload service (e.g., HOST:PORT).");

    add(&Flags::certificate_file,
        "certificate_file",
        "Path of the PEM file holding the certificate chain to present,\n"
        "leaf first. The private key may be kept in the same file, as is\n"
        "usual for proxy certificates.");

    add(&Flags::key_file,
        "key_file",
        "Path of the PEM file holding the private key.");

    add(&Flags::trust_roots,
        "trust_roots",
        "Path of a PEM file, or of a directory of `.pem` and `.crt` files,\n"
        "holding the certificates the service chain has to lead to.");

    add(&Flags::submit,
        "submit",
        "The value could be a JSON-formatted string of `JobInfo` or a\n"
        "file path containing the JSON-formatted `JobInfo`. Path must\n"
        "be of the form `file:///path/to/file` or `/path/to/file`.\n"
        "The owner is always the submitting identity.\n"
        "\n"
        "Example:\n"
        "{\n"
        "  \"owner\": \"\",\n"
        "  \"group\": \"lhcb_user\",\n"
        "  \"priority\": 1,\n"
        "  \"requirements\": {\"platform\": \"linux64\"}\n"
        "}");

    add(&Flags::status,
        "status",
        "ID of a job to print the status of.");

    add(&Flags::cancel,
        "cancel",
        "ID of a job to kill.");

    add(&Flags::timeout,
        "timeout",
        "Time to wait for the service to answer a call.",
        Seconds(60));
  }

  string master;
  string certificate_file;
  Option<string> key_file;
  string trust_roots;
  Option<JSON::Object> submit;
  Option<string> status;
  Option<string> cancel;
  Duration timeout;
};


static void print(const google::protobuf::Message& message)
{
  cout << stringify(JSON::protobuf(message)) << endl;
}


int main(int argc, char** argv)
{
  Flags flags;

  // Load flags from command line only.
  Try<flags::Warnings> load = flags.load(None(), argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], false, flags);

  // Log any flag warnings.
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  const int actions = (flags.submit.isSome() ? 1 : 0) +
                      (flags.status.isSome() ? 1 : 0) +
                      (flags.cancel.isSome() ? 1 : 0);

  if (actions != 1) {
    EXIT(EXIT_FAILURE) << flags.usage(
        "Exactly one of '--submit', '--status' or '--cancel' must be set");
  }

  vector<string> address = strings::split(flags.master, ":");
  if (address.size() != 2) {
    EXIT(EXIT_FAILURE) << flags.usage(
        "Expected '--master' of the form HOST:PORT");
  }

  Try<uint16_t> port = numify<uint16_t>(address[1]);
  if (port.isError()) {
    EXIT(EXIT_FAILURE) << "Invalid port '" << address[1] << "'";
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

  Outcome<Owned<Client>> client = Client::connect(
      address[0], port.get(), identity.get(), roots.get(), flags.timeout);

  if (client.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to connect to " << flags.master << ": "
                       << client.error();
  }

  WorkloadClient workload(client.get(), flags.timeout);

  if (flags.submit.isSome()) {
    Try<JobInfo> job = ::protobuf::parse<JobInfo>(flags.submit.get());
    if (job.isError()) {
      EXIT(EXIT_FAILURE) << "Invalid job: " << job.error();
    }

    Outcome<JobID> jobId = workload.submit(job.get());
    if (jobId.isError()) {
      EXIT(EXIT_FAILURE) << "Failed to submit job: " << jobId.error();
    }

    print(jobId.get());
    return EXIT_SUCCESS;
  }

  JobID jobId;
  jobId.set_value(
      flags.status.isSome() ? flags.status.get() : flags.cancel.get());

  Outcome<JobStatus> status = flags.status.isSome()
    ? workload.getJobStatus(jobId)
    : workload.cancel(jobId);

  if (status.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to query job " << jobId << ": "
                       << status.error();
  }

  print(status.get());

  return EXIT_SUCCESS;
}
