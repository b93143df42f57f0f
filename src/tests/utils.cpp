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


#include <iostream>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <process/metrics/metrics.hpp>

#include <stout/check.hpp>
#include <stout/gtest.hpp>
#include <stout/none.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>

#include <stout/os/getcwd.hpp>
#include <stout/os/mkdtemp.hpp>
#include <stout/os/rmdir.hpp>

#include "configuration/json_configuration.hpp"

#include "tests/flags.hpp"
#include "tests/utils.hpp"

using process::Future;

using std::shared_ptr;
using std::string;

namespace gridware {
namespace internal {
namespace tests {

void TemporaryDirectoryTest::SetUp()
{
  // Save the current working directory.
  cwd = os::getcwd();

  // Create a temporary directory for the test.
  Try<string> directory = os::mkdtemp(path::join(cwd, "gridware-XXXXXX"));

  ASSERT_SOME(directory) << "Failed to mkdtemp";

  sandbox = directory.get();

  if (flags.verbose) {
    std::cerr << "Using temporary directory '"
              << sandbox.get() << "'" << std::endl;
  }

  // Run the test out of the temporary directory we created.
  ASSERT_SOME(os::chdir(sandbox.get()))
    << "Failed to chdir into '" << sandbox.get() << "'";
}


void TemporaryDirectoryTest::TearDown()
{
  // Return to previous working directory and cleanup the sandbox.
  ASSERT_SOME(os::chdir(cwd));

  if (sandbox.isSome()) {
    ASSERT_SOME(os::rmdir(sandbox.get()));
  }
}


shared_ptr<const Configuration> configuration(const string& json)
{
  Try<JsonConfiguration> parse = JsonConfiguration::parse(json);
  CHECK_SOME(parse);

  return std::make_shared<JsonConfiguration>(parse.get());
}


JobInfo createJob(const string& group, int priority, const string& owner)
{
  JobInfo job;
  job.set_owner(owner);
  job.set_group(group);
  job.set_priority(priority);
  return job;
}


ResourceInfo createResource(
    const string& id,
    const string& site,
    const string& platform)
{
  ResourceInfo resource;
  resource.mutable_id()->set_value(id);
  resource.set_site(site);
  resource.set_platform(platform);
  return resource;
}


hashmap<string, double> Metrics()
{
  Future<hashmap<string, double>> snapshot =
    process::metrics::snapshot(None());

  AWAIT_READY(snapshot);

  return snapshot.get();
}

} // namespace tests {
} // namespace internal {
} // namespace gridware {
