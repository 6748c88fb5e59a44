/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/outcome/lookup_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(testutil, LookupError, e) {
  using E = testutil::LookupError;
  switch (e) {
    case E::NOT_FOUND:
      return "No entry with the id";
    case E::WRONG_OWNER:
      return "Id belongs to another owner";
    case E::EMPTY_KEY:
      return "Empty key";
  }
  return "Unknown LookupError";
}
