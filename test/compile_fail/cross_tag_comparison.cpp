/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// Ids of different owners can't be compared.

#include <cstdint>

#include "common/tagged_id.hpp"

using CustomerId = tagid::TaggedId<uint32_t, struct CustomerTag>;
#ifdef TAGID_CONTROL_BUILD
using OrderId = tagid::TaggedId<uint32_t, struct CustomerTag>;
#else
using OrderId = tagid::TaggedId<uint32_t, struct OrderTag>;
#endif

int main() {
  CustomerId customer_id(42);
  OrderId order_id(42);
  return customer_id == order_id ? 0 : 1;
}
