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


#include <memory>
#include <string>

#include <glog/logging.h>

#include <process/clock.hpp>

#include <stout/os/read.hpp>
#include <stout/synchronized.hpp>

#include "configuration/cached_configuration.hpp"

using process::Clock;
using process::Owned;

using std::shared_ptr;
using std::string;

namespace gridware {
namespace internal {

Try<Owned<CachedConfiguration>> CachedConfiguration::create(
    const Loader& loader,
    const Duration& refreshInterval)
{
  Try<JSON::Object> document = loader();
  if (document.isError()) {
    return Error(document.error());
  }

  return Owned<CachedConfiguration>(
      new CachedConfiguration(loader, refreshInterval, document.get()));
}


Try<Owned<CachedConfiguration>> CachedConfiguration::create(
    const string& path,
    const Duration& refreshInterval)
{
  Loader loader = [path]() -> Try<JSON::Object> {
    Try<string> read = os::read(path);
    if (read.isError()) {
      return Error("Failed to read '" + path + "': " + read.error());
    }

    Try<JSON::Object> document = JSON::parse<JSON::Object>(read.get());
    if (document.isError()) {
      return Error("Failed to parse '" + path + "': " + document.error());
    }

    return document.get();
  };

  return create(loader, refreshInterval);
}


CachedConfiguration::CachedConfiguration(
    const Loader& _loader,
    const Duration& _refreshInterval,
    const JSON::Object& document)
  : loader(_loader),
    refreshInterval(_refreshInterval),
    snapshot(new JsonConfiguration(document)),
    loaded(Clock::now()) {}


Result<JSON::Value> CachedConfiguration::get(const string& path) const
{
  return current()->get(path);
}


Try<Nothing> CachedConfiguration::reload() const
{
  Try<JSON::Object> document = loader();

  synchronized (mutex) {
    // Retry only after another interval, even if the reload failed.
    loaded = Clock::now();

    if (document.isError()) {
      return Error(document.error());
    }

    snapshot.reset(new JsonConfiguration(document.get()));
  }

  return Nothing();
}


shared_ptr<const JsonConfiguration> CachedConfiguration::current() const
{
  bool stale = false;

  synchronized (mutex) {
    stale = Clock::now() - loaded >= refreshInterval;
  }

  if (stale) {
    Try<Nothing> reload = this->reload();
    if (reload.isError()) {
      LOG(WARNING) << "Failed to refresh configuration, keeping the "
                   << "previous version: " << reload.error();
    } else {
      VLOG(1) << "Refreshed configuration";
    }
  }

  synchronized (mutex) {
    return snapshot;
  }
}

} // namespace internal {
} // namespace gridware {
