/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "common/tagged_id.hpp"

/**
 * "{}" and any format spec of I print the raw id, "{:?}" prints
 * TaggedId(<id>), string and char ids inside it use the debug format of fmt,
 * i.e. they are quoted and escaped.
 */
template <typename I, typename Tag>
  requires fmt::is_formattable<I>::value
struct fmt::formatter<tagid::TaggedId<I, Tag>> : fmt::formatter<I> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end and *it == '?') {
      debug_ = true;
      ++it;
      if (it != end and *it != '}') {
        throw format_error("invalid format");
      }
      return it;
    }
    return fmt::formatter<I>::parse(ctx);
  }

  template <typename FormatContext>
  auto format(const tagid::TaggedId<I, Tag> &id, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (not debug_) {
      return fmt::formatter<I>::format(untagged(id), ctx);
    }
    if constexpr (requires(fmt::formatter<I> f) { f.set_debug_format(); }) {
      return fmt::format_to(ctx.out(), "TaggedId({:?})", untagged(id));
    } else {
      return fmt::format_to(ctx.out(), "TaggedId({})", untagged(id));
    }
  }

 private:
  bool debug_ = false;
};
