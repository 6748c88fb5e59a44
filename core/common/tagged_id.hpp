/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <type_traits>
#include <utility>

#include <boost/container_hash/hash.hpp>

namespace tagid {

  namespace detail {

    /**
     * Holds the raw id taken out of TaggedId::convert() until the destination
     * type is known from the context, e.g. the type of a function parameter.
     * Single use, cannot be copied.
     */
    template <typename I>
    class [[nodiscard]] Retag {
     public:
      explicit constexpr Retag(I id) : id_(std::move(id)) {}

      Retag(const Retag &) = delete;
      Retag &operator=(const Retag &) = delete;

      template <typename Output>
        requires std::constructible_from<Output, I>
      constexpr operator Output() && {  // NOLINT(google-explicit-constructor)
        return static_cast<Output>(std::move(id_));
      }

     private:
      I id_;
    };

    /// Arithmetic conversion which can drop bits of the value
    template <typename From, typename To>
    concept LossyArithmetic =
        std::is_arithmetic_v<From> and std::is_arithmetic_v<To>
        and (not std::same_as<From, To>)
        and (sizeof(From) > sizeof(To)
             or (std::is_floating_point_v<From> and std::integral<To>));

  }  // namespace detail

  /**
   * @brief Identifier of type I owned by the entity Tag.
   * Ids of different owners are different types even if they share the same
   * representation, so a CustomerId can't be passed where an OrderId is
   * expected. Tag is never stored, the wrapper has the layout of I.
   *
   * using CustomerId = TaggedId<uint32_t, struct CustomerTag>;
   * using OrderId = TaggedId<uint32_t, struct OrderTag>;
   *
   * @tparam I underlying id representation
   * @tparam Tag owner of the id, may be an incomplete type
   */
  template <typename I, typename Tag>
  class TaggedId {
   public:
    using Type = I;
    using TagType = Tag;

    /// Wraps a value-initialized I
    constexpr TaggedId() = default;

    /// Wraps a raw id, any value of I is accepted
    constexpr TaggedId(I id)  // NOLINT(google-explicit-constructor)
        noexcept(std::is_nothrow_move_constructible_v<I>)
        : id_(std::move(id)) {}

    /// Rejects raw values which can't be held by I without loss,
    /// e.g. TaggedId<uint8_t, T> id = 1000; or CustomerId id = 4.2;
    template <typename U>
      requires detail::LossyArithmetic<U, I>
    TaggedId(U) = delete;

    constexpr const I &get() const noexcept {
      return id_;
    }

    constexpr const I &operator*() const noexcept {
      return id_;
    }

    constexpr const I *operator->() const noexcept {
      return &id_;
    }

    /**
     * @brief Explicitly re-tags the id.
     * The only way to get an id of another owner out of this one.
     * OrderId order_id = customer_id.convert<OrderId>();
     * @tparam Output destination type, anything constructible from I
     * @return Output made of the raw id, which is moved out of this
     */
    template <typename Output>
      requires std::constructible_from<Output, I>
    constexpr Output convert() && {
      return static_cast<Output>(std::move(id_));
    }

    /**
     * convert<Output>() of an lvalue, only for trivially copyable I where a
     * copy can't be told apart from the original. Other ids are converted
     * from rvalues: std::move(name).convert<OtherName>()
     */
    template <typename Output>
      requires std::is_trivially_copyable_v<I>
               and std::constructible_from<Output, const I &>
    constexpr Output convert() const & {
      return static_cast<Output>(id_);
    }

    /**
     * @brief Explicitly re-tags the id, taking the destination type from the
     * context.
     * bool found = customer.hasOrder(customer.id.convert());
     */
    constexpr detail::Retag<I> convert() && {
      return detail::Retag<I>(std::move(id_));
    }

    constexpr detail::Retag<I> convert() const &
      requires std::is_trivially_copyable_v<I>
    {
      return detail::Retag<I>(id_);
    }

   private:
    I id_{};
  };

  /// Read access to the raw id
  template <typename I, typename Tag>
  constexpr const I &untagged(const TaggedId<I, Tag> &id) noexcept {
    return *id;
  }

  /// Moves the raw id out of the wrapper
  template <typename I, typename Tag>
  constexpr I untagged(TaggedId<I, Tag> &&id) {
    return std::move(id).template convert<I>();
  }

  // Comparisons are templates, so neither a raw I nor an id with another tag
  // can be converted to match them.

  template <typename I, typename Tag>
    requires std::equality_comparable<I>
  constexpr bool operator==(const TaggedId<I, Tag> &lhs,
                            const TaggedId<I, Tag> &rhs) {
    return *lhs == *rhs;
  }

  template <typename I, typename Tag>
    requires std::three_way_comparable<I>
  constexpr auto operator<=>(const TaggedId<I, Tag> &lhs,
                             const TaggedId<I, Tag> &rhs) {
    return *lhs <=> *rhs;
  }

  /// Ordering of ids whose representation only has operator<
  template <typename I, typename Tag>
    requires(not std::three_way_comparable<I>)
            and requires(const I &a, const I &b) {
                  { a < b } -> std::convertible_to<bool>;
                }
  constexpr std::weak_ordering operator<=>(const TaggedId<I, Tag> &lhs,
                                           const TaggedId<I, Tag> &rhs) {
    if (*lhs < *rhs) {
      return std::weak_ordering::less;
    }
    if (*rhs < *lhs) {
      return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
  }

  /// Prints the raw id only
  template <typename I, typename Tag>
    requires requires(std::ostream &os, const I &i) { os << i; }
  std::ostream &operator<<(std::ostream &os, const TaggedId<I, Tag> &id) {
    return os << *id;
  }

  /// boost::hash support, same value as boost::hash<I>
  template <typename I, typename Tag>
  std::size_t hash_value(const TaggedId<I, Tag> &id) {
    return boost::hash<I>()(*id);
  }

}  // namespace tagid

template <typename I, typename Tag>
  requires std::is_default_constructible_v<std::hash<I>>
struct std::hash<tagid::TaggedId<I, Tag>> {
  std::size_t operator()(const tagid::TaggedId<I, Tag> &id) const {
    return std::hash<I>()(*id);
  }
};
