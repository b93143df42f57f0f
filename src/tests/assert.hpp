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


#ifndef __TESTS_ASSERT_HPP__
#define __TESTS_ASSERT_HPP__

#include <gtest/gtest.h>

#include <gridware/outcome.hpp>

#include <stout/gtest.hpp>
#include <stout/try.hpp>

template <typename T>
::testing::AssertionResult AssertSome(
    const char* expr,
    const Try<T, gridware::GridError>& actual)
{
  if (actual.isError()) {
    return ::testing::AssertionFailure()
      << expr << ": " << actual.error();
  }

  return ::testing::AssertionSuccess();
}


template <typename T>
::testing::AssertionResult AssertFailedWith(
    const char* codeExpr,
    const char* actualExpr,
    gridware::ErrorInfo::Code code,
    const Try<T, gridware::GridError>& actual)
{
  if (!actual.isError()) {
    return ::testing::AssertionFailure()
      << actualExpr << " succeeded, expected " << codeExpr;
  }

  if (actual.error().code != code) {
    return ::testing::AssertionFailure()
      << actualExpr << " failed with " << actual.error()
      << ", expected " << codeExpr;
  }

  return ::testing::AssertionSuccess();
}


#define ASSERT_FAILED_WITH(code, actual)                \
  ASSERT_PRED_FORMAT2(AssertFailedWith, code, actual)


#define EXPECT_FAILED_WITH(code, actual)                \
  EXPECT_PRED_FORMAT2(AssertFailedWith, code, actual)

#endif // __TESTS_ASSERT_HPP__
