#pragma once

#include <vigil/schema/notification.hpp>
#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vigil::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of admitting or executing one transaction. `code` is zero on
/// success, otherwise a `transaction_error_code` value.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<notification_t> notifications;
};

using transaction_result_t = transaction_result<1>;

}  // namespace vigil::schema
