/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>
#include <utility>

#include <scale/scale.hpp>

#include "common/tagged_id.hpp"

namespace tagid {

  /**
   * TaggedId is encoded exactly as its raw id, the tag is not encoded.
   * Bytes of a raw id decode as a TaggedId and vice versa.
   */
  template <typename I, typename Tag>
  void encode(const TaggedId<I, Tag> &id, ::scale::Encoder &encoder) {
    encode(untagged(id), encoder);
  }

  /// Errors of the raw id decoder pass through unchanged
  template <typename I, typename Tag>
  void decode(TaggedId<I, Tag> &id, ::scale::Decoder &decoder) {
    static_assert(std::is_default_constructible_v<I>);
    I raw{};
    decode(raw, decoder);
    id = TaggedId<I, Tag>(std::move(raw));
  }

}  // namespace tagid
