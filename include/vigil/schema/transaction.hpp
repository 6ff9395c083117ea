#pragma once
#include <vigil/schema/close_event.hpp>
#include <vigil/schema/initialize.hpp>
#include <vigil/schema/log_event.hpp>
#include <vigil/schema/primitives.hpp>
#include <variant>

namespace vigil::schema {

using transaction_payload_t =
    std::variant<initialize_t, log_event_t, close_event_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  identity_t signer{};
  transaction_payload_t payload{};
  signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace vigil::schema
