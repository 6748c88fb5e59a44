/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// A raw id is wrapped implicitly on construction, but it is not compared
// with a tagged id as is.

#include <cstdint>

#include "common/tagged_id.hpp"

using CustomerId = tagid::TaggedId<uint32_t, struct CustomerTag>;

int main() {
  CustomerId customer_id(42);
  uint32_t raw = 42;
#ifdef TAGID_CONTROL_BUILD
  return customer_id == CustomerId(raw) ? 0 : 1;
#else
  return customer_id == raw ? 0 : 1;
#endif
}
