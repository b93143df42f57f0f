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


#ifndef __CONFIGURATION_CACHED_CONFIGURATION_HPP__
#define __CONFIGURATION_CACHED_CONFIGURATION_HPP__

#include <memory>
#include <mutex>
#include <string>

#include <gridware/configuration.hpp>

#include <process/owned.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/json.hpp>
#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include "configuration/json_configuration.hpp"

namespace gridware {
namespace internal {

// A configuration that re-reads its document through a loader once
// the refresh interval has elapsed. A failed reload is logged and the
// previous document keeps being served.
class CachedConfiguration : public Configuration
{
public:
  typedef lambda::function<Try<JSON::Object>()> Loader;

  // Performs the initial load, which has to succeed.
  static Try<process::Owned<CachedConfiguration>> create(
      const Loader& loader,
      const Duration& refreshInterval);

  // Loads the JSON document stored at 'path'.
  static Try<process::Owned<CachedConfiguration>> create(
      const std::string& path,
      const Duration& refreshInterval);

  Result<JSON::Value> get(const std::string& path) const override;

  // Reloads the document now.
  Try<Nothing> reload() const;

private:
  CachedConfiguration(
      const Loader& _loader,
      const Duration& _refreshInterval,
      const JSON::Object& document);

  std::shared_ptr<const JsonConfiguration> current() const;

  const Loader loader;
  const Duration refreshInterval;

  mutable std::mutex mutex;
  mutable std::shared_ptr<const JsonConfiguration> snapshot;
  mutable process::Time loaded;
};

} // namespace internal {
} // namespace gridware {

#endif // __CONFIGURATION_CACHED_CONFIGURATION_HPP__
