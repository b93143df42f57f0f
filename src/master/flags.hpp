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


#ifndef __MASTER_FLAGS_HPP__
#define __MASTER_FLAGS_HPP__

#include <string>

#include <stout/duration.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace gridware {
namespace internal {
namespace master {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  bool version;
  std::string ip;
  int port;

  std::string certificate_file;
  Option<std::string> key_file;
  std::string trust_roots;

  std::string configuration;
  Duration configuration_refresh_interval;

  int worker_threads;
  Duration call_timeout;
  Duration max_call_timeout;
  Duration handshake_timeout;

  int max_match_attempts;
  Duration resource_silence_timeout;
  Duration resource_expiry_interval;
  Duration job_retention;
};

} // namespace master {
} // namespace internal {
} // namespace gridware {

#endif // __MASTER_FLAGS_HPP__
