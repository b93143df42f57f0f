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

#ifndef __GRIDWARE_HPP__
#define __GRIDWARE_HPP__

#include <ostream>

#include <boost/functional/hash.hpp>

#include <gridware/gridware.pb.h> // ONLY USEFUL AFTER RUNNING PROTOC.

namespace gridware {

inline bool operator==(const JobID& left, const JobID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const ResourceID& left, const ResourceID& right)
{
  return left.value() == right.value();
}


inline bool operator!=(const JobID& left, const JobID& right)
{
  return !(left == right);
}


inline bool operator!=(const ResourceID& left, const ResourceID& right)
{
  return !(left == right);
}


inline bool operator<(const JobID& left, const JobID& right)
{
  return left.value() < right.value();
}


std::ostream& operator<<(std::ostream& stream, const JobID& jobId);
std::ostream& operator<<(std::ostream& stream, const ResourceID& resourceId);
std::ostream& operator<<(std::ostream& stream, const JobState& state);
std::ostream& operator<<(std::ostream& stream, const ErrorInfo::Code& code);


// Returns true if no further transition out of the state exists.
inline bool isTerminalState(const JobState& state)
{
  return state == JOB_DONE || state == JOB_FAILED || state == JOB_KILLED;
}

} // namespace gridware {


namespace std {

template <>
struct hash<gridware::JobID>
{
  typedef size_t result_type;

  typedef gridware::JobID argument_type;

  result_type operator()(const argument_type& jobId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, jobId.value());
    return seed;
  }
};


template <>
struct hash<gridware::ResourceID>
{
  typedef size_t result_type;

  typedef gridware::ResourceID argument_type;

  result_type operator()(const argument_type& resourceId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, resourceId.value());
    return seed;
  }
};

} // namespace std {

#endif // __GRIDWARE_HPP__
