/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// An id of one owner is not accepted where an id of another owner is
// expected, convert() has to be called.

#include <cstdint>

#include "common/tagged_id.hpp"

using CustomerId = tagid::TaggedId<uint32_t, struct CustomerTag>;
#ifdef TAGID_CONTROL_BUILD
using OrderId = tagid::TaggedId<uint32_t, struct CustomerTag>;
#else
using OrderId = tagid::TaggedId<uint32_t, struct OrderTag>;
#endif

namespace {
  bool isFirstOrder(const OrderId &id) {
    return *id == 1;
  }
}  // namespace

int main() {
  CustomerId customer_id(1);
  return isFirstOrder(customer_id) ? 0 : 1;
}
