/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace testutil {

  /// Errors of a lookup by id, registered by the test binary itself
  enum class LookupError { NOT_FOUND = 1, WRONG_OWNER, EMPTY_KEY };

}  // namespace testutil

OUTCOME_HPP_DECLARE_ERROR(testutil, LookupError);
