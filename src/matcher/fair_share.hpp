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


#ifndef __MATCHER_FAIR_SHARE_HPP__
#define __MATCHER_FAIR_SHARE_HPP__

#include <mutex>
#include <string>

#include <gridware/configuration.hpp>

#include <process/clock.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace gridware {
namespace internal {

// Tracks how many matches each group received recently. Every match
// adds one to the usage of the group; usage decays exponentially with
// the configured half-life. Each group has a weight (1 unless
// configured); a group's share is its weight relative to the weights
// of the groups it competes with.
class FairShare
{
public:
  explicit FairShare(
      const Duration& halfLife = DEFAULT_HALF_LIFE,
      const hashmap<std::string, double>& weights =
        hashmap<std::string, double>());

  // Reads "/Operations/Matching/FairShare/HalfLife" (seconds) and the
  // weights below "/Operations/Matching/FairShare/Shares". Keeps the
  // current settings on error.
  Try<Nothing> configure(const Configuration& configuration);

  void configure(
      const Duration& halfLife,
      const hashmap<std::string, double>& weights);

  void matched(
      const std::string& group,
      const process::Time& now = process::Clock::now());

  double usage(
      const std::string& group,
      const process::Time& now = process::Clock::now()) const;

  double weight(const std::string& group) const;

  // Number of groups with usage on record. Usage that decayed to
  // nothing is dropped on the next match.
  size_t tracked() const;

  // Returns the groups among 'groups' whose fraction of the recent
  // matches exceeds their share. Competing are 'groups' together with
  // every group with recent usage.
  hashset<std::string> exceeded(
      const hashset<std::string>& groups,
      const process::Time& now = process::Clock::now()) const;

  static const Duration DEFAULT_HALF_LIFE;

private:
  struct Usage
  {
    double value;
    process::Time updated;
  };

  double decayed(const Usage& usage, const process::Time& now) const;

  mutable std::mutex mutex;
  Duration halfLife;
  hashmap<std::string, double> weights;
  hashmap<std::string, Usage> usages;
};

} // namespace internal {
} // namespace gridware {

#endif // __MATCHER_FAIR_SHARE_HPP__
