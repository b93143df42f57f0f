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


#ifndef __MATCHER_VALIDATION_HPP__
#define __MATCHER_VALIDATION_HPP__

#include <gridware/gridware.hpp>

#include <stout/error.hpp>
#include <stout/option.hpp>

namespace gridware {
namespace internal {
namespace validation {

namespace job {

// Validates a job submitted for queueing. Fields owned by the queue
// (id, state, timestamps) are not looked at.
Option<Error> validate(const JobInfo& job);

// Validates that the requirements can be satisfied by some resource.
Option<Error> validate(const JobRequirements& requirements);

} // namespace job {


namespace resource {

Option<Error> validate(const ResourceInfo& resource);

} // namespace resource {


// Validates that an ID is usable as a map key and in log lines.
Option<Error> validateId(const std::string& id);

} // namespace validation {
} // namespace internal {
} // namespace gridware {

#endif // __MATCHER_VALIDATION_HPP__
