/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "scale/tagged_id.hpp"

namespace tagid::scale {

  using namespace ::scale;  // NOLINT(google-build-using-namespace)
  using ::scale::decode;
  using ::scale::encode;
  using ::scale::impl::memory::decode;
  using ::scale::impl::memory::encode;
  using ::scale::impl::memory::encoded_size;

}  // namespace tagid::scale
