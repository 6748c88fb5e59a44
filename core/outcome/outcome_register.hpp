/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <typeinfo>

namespace tagid::outcome_detail {

  template <typename T>
  class Category : public std::error_category {
   public:
    const char *name() const noexcept final {
      return typeid(T).name();
    }

    std::string message(int c) const final {
      return toString(static_cast<T>(c));
    }

    static std::string toString(T t) {
      static_assert(not std::is_same_v<T, T>,
                    "toString<T>() was not specialised for the type T "
                    "supplied, use OUTCOME_CPP_DEFINE_CATEGORY");
      return "";
    }

    static const Category<T> &get() {
      static const Category<T> c;
      return c;
    }
  };

}  // namespace tagid::outcome_detail

/// MUST BE EXECUTED AT FILE LEVEL (no namespace) IN HPP
#define OUTCOME_HPP_DECLARE_ERROR(ns, Enum)                       \
  namespace ns {                                                  \
    std::error_code make_error_code(Enum e);                      \
  }                                                               \
  template <>                                                     \
  struct std::is_error_code_enum<ns::Enum> : std::true_type {};

/// MUST BE EXECUTED AT FILE LEVEL (no namespace) IN CPP,
/// followed by the body of the message function for `Name`
#define OUTCOME_CPP_DEFINE_CATEGORY(ns, Enum, Name)                          \
  template <>                                                                \
  std::string tagid::outcome_detail::Category<ns::Enum>::toString(ns::Enum); \
  namespace ns {                                                             \
    std::error_code make_error_code(Enum e) {                                \
      return {static_cast<int>(e),                                           \
              ::tagid::outcome_detail::Category<Enum>::get()};               \
    }                                                                        \
  }                                                                          \
  template <>                                                                \
  std::string tagid::outcome_detail::Category<ns::Enum>::toString(            \
      ns::Enum Name)
