/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>
#include <utility>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>

#include "outcome/outcome_register.hpp"

namespace outcome {

  /**
   * Value or std::error_code.
   * Accessing the value of a failed result throws std::system_error.
   */
  template <typename R>
  using result = boost::outcome_v2::std_result<R>;

  using boost::outcome_v2::failure;
  using boost::outcome_v2::success;

}  // namespace outcome

#define OUTCOME_PP_CAT_I(a, b) a##b
#define OUTCOME_PP_CAT(a, b) OUTCOME_PP_CAT_I(a, b)

#define OUTCOME_UNIQUE OUTCOME_PP_CAT(_outcome_r_, __COUNTER__)

#define OUTCOME_TRY_IMPL(tmp, var, expr)      \
  auto &&tmp = (expr);                        \
  if (tmp.has_error()) {                      \
    return ::outcome::failure(tmp.error());   \
  }                                           \
  auto &&var = std::move(tmp).value();

#define OUTCOME_TRYV_IMPL(tmp, expr)          \
  auto &&tmp = (expr);                        \
  if (tmp.has_error()) {                      \
    return ::outcome::failure(tmp.error());   \
  }

/**
 * Returns the error of `expr` from the enclosing function,
 * or binds its value to `var`.
 * OUTCOME_TRY(bytes, scale::encode(x));
 */
#define OUTCOME_TRY(var, expr) OUTCOME_TRY_IMPL(OUTCOME_UNIQUE, var, expr)

/// Same as OUTCOME_TRY for results without a value worth binding
#define OUTCOME_TRYV(expr) OUTCOME_TRYV_IMPL(OUTCOME_UNIQUE, expr)
