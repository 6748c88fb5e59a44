/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// A raw value wider than the representation is not wrapped implicitly.

#include <cstdint>

#include "common/tagged_id.hpp"

using SmallId = tagid::TaggedId<uint8_t, struct SmallTag>;

int main() {
#ifdef TAGID_CONTROL_BUILD
  SmallId id = uint8_t{200};
#else
  SmallId id = 1000;
#endif
  return *id == 200 ? 0 : 1;
}
