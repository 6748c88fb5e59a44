/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <string>

#include "outcome/outcome.hpp"

namespace testutil {

  /// Message of the stored error, empty for a success
  template <typename R>
  std::string errorMessage(const R &res) {
    return res.has_error() ? res.error().message() : std::string{};
  }

}  // namespace testutil

#define TESTUTIL_EXPECT_VALUE(res, val, expr)                          \
  auto &&res = (expr);                                                \
  ASSERT_TRUE(res.has_value())                                        \
      << "Line " << __LINE__ << ": " << ::testutil::errorMessage(res); \
  auto &&val = res.value()

/**
 * Expects `expr` to succeed and binds its value to `val`:
 * EXPECT_OUTCOME_TRUE(bytes, scale::encode(id));
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  TESTUTIL_EXPECT_VALUE(OUTCOME_UNIQUE, val, expr)

/// Stops the test unless `expr` succeeds
#define ASSERT_OUTCOME_SUCCESS_TRY(expr)                             \
  do {                                                               \
    auto &&res = (expr);                                             \
    ASSERT_TRUE(res.has_value()) << ::testutil::errorMessage(res);   \
  } while (false)

/// Expects `expr` to fail with the `expected` error
#define EXPECT_EC(expr, expected)                        \
  do {                                                   \
    auto &&res = (expr);                                 \
    ASSERT_TRUE(res.has_error()) << "Line " << __LINE__; \
    EXPECT_EQ(res.error(), expected);                    \
  } while (false)
