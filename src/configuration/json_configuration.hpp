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


#ifndef __CONFIGURATION_JSON_CONFIGURATION_HPP__
#define __CONFIGURATION_JSON_CONFIGURATION_HPP__

#include <string>

#include <gridware/configuration.hpp>

#include <stout/json.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace gridware {
namespace internal {

// A configuration backed by a JSON document held in memory. Nested
// objects are sections; the path "/A/B" names the key "B" of the
// object stored at key "A" of the document.
class JsonConfiguration : public Configuration
{
public:
  static Try<JsonConfiguration> parse(const std::string& json);

  explicit JsonConfiguration(const JSON::Object& _document)
    : document(_document) {}

  Result<JSON::Value> get(const std::string& path) const override;

private:
  const JSON::Object document;
};

} // namespace internal {
} // namespace gridware {

#endif // __CONFIGURATION_JSON_CONFIGURATION_HPP__
