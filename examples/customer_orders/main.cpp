/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <soralog/logging_system.hpp>

#include "common/tagged_id.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "scale/tagid_scale.hpp"

namespace tagid::example {

  using CustomerId = TaggedId<uint32_t, struct CustomerTag>;
  using OrderId = TaggedId<uint32_t, struct OrderTag>;
  using CustomerName = TaggedId<std::string, struct CustomerTag>;

  enum class Error { ROUND_TRIP_MISMATCH = 1 };

  struct Order {
    OrderId id;
    uint32_t amount = 0;
  };

  struct Customer {
    CustomerId id;
    CustomerName name;
    std::vector<OrderId> orders;

    bool hasOrder(const OrderId &order_id) const {
      return std::find(orders.begin(), orders.end(), order_id) != orders.end();
    }

    bool operator==(const Customer &) const = default;

    friend inline void encode(const Customer &v, ::scale::Encoder &encoder) {
      encode(v.id, encoder);
      encode(v.name, encoder);
      encode(v.orders, encoder);
    }

    friend inline void decode(Customer &v, ::scale::Decoder &decoder) {
      decode(v.id, decoder);
      decode(v.name, decoder);
      decode(v.orders, decoder);
    }
  };

  using CustomerIndex = std::map<CustomerId, Customer>;

}  // namespace tagid::example

OUTCOME_HPP_DECLARE_ERROR(tagid::example, Error);

OUTCOME_CPP_DEFINE_CATEGORY(tagid::example, Error, e) {
  using E = tagid::example::Error;
  switch (e) {
    case E::ROUND_TRIP_MISMATCH:
      return "Decoded customers differ from the encoded ones";
  }
  return "Unknown example::Error";
}

namespace tagid::example {

  namespace {
    outcome::result<void> roundTrip(const CustomerIndex &customers,
                                    const log::Logger &logger) {
      OUTCOME_TRY(bytes, scale::encode(customers));
      SL_DEBUG(logger,
               "{} customers are encoded into {} bytes",
               customers.size(),
               bytes.size());

      OUTCOME_TRY(decoded, scale::decode<CustomerIndex>(bytes));
      if (decoded != customers) {
        return Error::ROUND_TRIP_MISMATCH;
      }
      for (auto &[id, customer] : decoded) {
        SL_TRACE(logger, "decoded customer {:?} named {:?}", id, customer.name);
      }
      return outcome::success();
    }

    bool checkMembership(const Customer &customer,
                         const Order &order,
                         const log::Logger &logger) {
      // a raw id is wrapped into OrderId, another owner's id has to be
      // converted explicitly
      bool by_raw_id = customer.hasOrder(untagged(order.id));
      bool by_order_id = customer.hasOrder(order.id);
      bool by_converted_id = customer.hasOrder(customer.id.convert());

      SL_INFO(logger,
              "customer {} ({:?}) has order {}: by raw id {}, by order id {}, "
              "by customer id {}",
              customer.id,
              customer.name,
              order.id,
              by_raw_id,
              by_order_id,
              by_converted_id);
      return by_raw_id and by_order_id;
    }
  }  // namespace

  int run() {
    auto logger = log::createLogger("CustomerOrders", "example");
    auto codec_log = log::createLogger("CustomerIndex", "codec");

    std::vector<Order> orders{{42, 100}, {43, 250}, {7, 10}};

    CustomerIndex customers;
    customers.emplace(
        42, Customer{42, std::string("Alice"), {orders[0].id, orders[1].id}});
    customers.emplace(7, Customer{7, std::string("Bob"), {orders[2].id}});

    for (const auto &order : orders) {
      SL_DEBUG(logger, "order {:?} for {}", order.id, order.amount);
    }

    auto &alice = customers.at(42);
    if (not checkMembership(alice, orders[0], logger)) {
      SL_ERROR(logger, "order {} is not found for customer {}", orders[0].id,
               alice.id);
      return EXIT_FAILURE;
    }
    // literal order number
    if (not alice.hasOrder(43)) {
      SL_ERROR(logger, "order 43 is not found for customer {}", alice.id);
      return EXIT_FAILURE;
    }
    if (alice.hasOrder(orders[2].id)) {
      SL_ERROR(logger, "order {} is unexpectedly found for customer {}",
               orders[2].id, alice.id);
      return EXIT_FAILURE;
    }

    if (auto res = roundTrip(customers, codec_log); res.has_error()) {
      SL_ERROR(
          codec_log, "SCALE round trip failed: {}", res.error().message());
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "{} customers checked", customers.size());
    return EXIT_SUCCESS;
  }

}  // namespace tagid::example

int main(int argc, const char **argv) {
  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        tagid::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<tagid::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<tagid::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  tagid::log::setLoggingSystem(logging_system);

  return tagid::example::run();
}
