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


#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <gridware/configuration.hpp>
#include <gridware/gridware.hpp>

#include <stout/hashmap.hpp>
#include <stout/json.hpp>
#include <stout/option.hpp>

namespace gridware {
namespace internal {
namespace tests {

// Test fixture for creating a temporary directory for each test.
class TemporaryDirectoryTest : public ::testing::Test
{
protected:
  void SetUp() override;
  void TearDown() override;

  Option<std::string> sandbox;

private:
  std::string cwd;
};


// Parses a JSON document into a configuration, failing the test on
// invalid input.
std::shared_ptr<const Configuration> configuration(const std::string& json);


JobInfo createJob(
    const std::string& group,
    int priority = 0,
    const std::string& owner = "/O=Grid/OU=Users/CN=alice");


ResourceInfo createResource(
    const std::string& id,
    const std::string& site = "LCG.CERN.ch",
    const std::string& platform = "Linux_x86_64");


// Get the metrics snapshot.
hashmap<std::string, double> Metrics();

} // namespace tests {
} // namespace internal {
} // namespace gridware {

#endif // __TESTS_UTILS_HPP__
