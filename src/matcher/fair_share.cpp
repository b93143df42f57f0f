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


#include <cmath>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/path.hpp>
#include <stout/synchronized.hpp>

#include "matcher/fair_share.hpp"

using process::Time;

using std::string;
using std::vector;

namespace gridware {
namespace internal {

namespace {

// Usage below this is treated as no usage at all.
constexpr double NEGLIGIBLE_USAGE = 1e-3;

const string SECTION = "/Operations/Matching/FairShare";

} // namespace {


const Duration FairShare::DEFAULT_HALF_LIFE = Hours(1);


FairShare::FairShare(
    const Duration& _halfLife,
    const hashmap<string, double>& _weights)
  : halfLife(_halfLife),
    weights(_weights) {}


Try<Nothing> FairShare::configure(const Configuration& configuration)
{
  Duration _halfLife = DEFAULT_HALF_LIFE;

  const string key = path::join(SECTION, "HalfLife");

  Result<double> seconds = configuration.getNumber(key);
  if (seconds.isError()) {
    return Error(
        "Invalid value of configuration key '" + key + "': " +
        seconds.error());
  }

  if (seconds.isSome()) {
    Try<Duration> duration = Duration::create(seconds.get());
    if (duration.isError()) {
      return Error(
          "Invalid value of configuration key '" + key + "': " +
          duration.error());
    }

    if (duration.get() <= Duration::zero()) {
      return Error("Configuration key '" + key + "' must be positive");
    }

    _halfLife = duration.get();
  }

  hashmap<string, double> _weights;

  const string shares = path::join(SECTION, "Shares");

  Result<vector<string>> groups = configuration.getSections(shares);
  if (groups.isError()) {
    return Error(
        "Invalid value of configuration key '" + shares + "': " +
        groups.error());
  }

  if (groups.isSome()) {
    foreach (const string& group, groups.get()) {
      const string share = path::join(shares, group);

      Result<double> value = configuration.getNumber(share);
      if (value.isError() || value.isNone() || value.get() <= 0) {
        return Error(
            "Configuration key '" + share + "' must be a positive number");
      }

      _weights[group] = value.get();
    }
  }

  configure(_halfLife, _weights);

  return Nothing();
}


void FairShare::configure(
    const Duration& _halfLife,
    const hashmap<string, double>& _weights)
{
  CHECK_GT(_halfLife, Duration::zero());

  synchronized (mutex) {
    halfLife = _halfLife;
    weights = _weights;
  }
}


void FairShare::matched(const string& group, const Time& now)
{
  synchronized (mutex) {
    if (!usages.contains(group)) {
      usages[group] = Usage{0.0, now};
    }

    Usage& usage = usages[group];
    usage.value = decayed(usage, now) + 1.0;
    usage.updated = now;

    // Forget the groups whose usage faded away.
    vector<string> faded;
    foreachpair (const string& name, const Usage& other, usages) {
      if (decayed(other, now) < NEGLIGIBLE_USAGE) {
        faded.push_back(name);
      }
    }

    foreach (const string& name, faded) {
      usages.erase(name);
    }
  }
}


double FairShare::usage(const string& group, const Time& now) const
{
  synchronized (mutex) {
    if (!usages.contains(group)) {
      return 0.0;
    }

    return decayed(usages.at(group), now);
  }
}


size_t FairShare::tracked() const
{
  synchronized (mutex) {
    return usages.size();
  }
}


double FairShare::weight(const string& group) const
{
  synchronized (mutex) {
    return weights.get(group).getOrElse(1.0);
  }
}


hashset<string> FairShare::exceeded(
    const hashset<string>& groups,
    const Time& now) const
{
  hashset<string> result;

  synchronized (mutex) {
    hashmap<string, double> competing;

    foreach (const string& group, groups) {
      competing[group] = 0.0;
    }

    foreachpair (const string& group, const Usage& usage, usages) {
      const double value = decayed(usage, now);
      if (value >= NEGLIGIBLE_USAGE || competing.contains(group)) {
        competing[group] = value;
      }
    }

    double totalUsage = 0.0;
    double totalWeight = 0.0;

    foreachpair (const string& group, double value, competing) {
      totalUsage += value;
      totalWeight += weights.get(group).getOrElse(1.0);
    }

    if (totalUsage < NEGLIGIBLE_USAGE) {
      return result;
    }

    foreach (const string& group, groups) {
      const double used = competing.at(group) / totalUsage;
      const double share = weights.get(group).getOrElse(1.0) / totalWeight;

      if (used > share) {
        result.insert(group);
      }
    }
  }

  return result;
}


double FairShare::decayed(const Usage& usage, const Time& now) const
{
  if (now <= usage.updated) {
    return usage.value;
  }

  const double elapsed = (now - usage.updated).secs();
  return usage.value * std::pow(2.0, -elapsed / halfLife.secs());
}

} // namespace internal {
} // namespace gridware {
