#pragma once

#include <gtest/gtest.h>

#include <vigil/execution/details.hpp>
#include <vigil/execution/engine.hpp>
#include <vigil/execution/signing.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

namespace vigil::testing {

using scale_encoder_t = vigil::schema::encoding::encoder<
    vigil::schema::encoding::scale_encoder_tag>;

inline constexpr auto kGenesisTime = vigil::schema::timestamp_seconds_t{
    1'700'000'000};
inline constexpr auto kFunding = vigil::schema::lamports_t{1'000'000'000};

inline vigil::schema::transaction_t make_transaction(
    const uint64_t nonce,
    const vigil::schema::identity_t& signer,
    const vigil::schema::transaction_payload_t& payload) {
  return vigil::schema::transaction_t{
      .version = 1,
      .chain_id = vigil::execution::chain_id(),
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = vigil::schema::signature_t{}};
}

inline vigil::schema::bytes_t encode_transaction(
    const vigil::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline void sign_transaction(vigil::schema::transaction_t& tx,
                             const vigil::crypto::ed25519_seed_t& seed) {
  auto encoder = scale_encoder_t{};
  auto message = vigil::execution::make_signing_payload(encoder, tx);
  auto signature =
      vigil::crypto::sign(vigil::schema::make_bytes_view(message), seed);
  ASSERT_TRUE(signature.has_value());
  tx.signature = *signature;
}

inline vigil::schema::log_event_t make_log_event(
    const vigil::schema::identity_t& authority_owner,
    const uint8_t event_kind,
    const std::string_view details,
    const bool allowed) {
  return vigil::schema::log_event_t{
      .authority_owner = authority_owner,
      .event_kind = event_kind,
      .content_digest = vigil::execution::hash_details(details),
      .allowed = allowed,
      .details_length = vigil::execution::details_length(details)};
}

inline uint64_t query_nonce(vigil::execution::engine& engine,
                            const vigil::schema::identity_t& identity) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(identity);
  const auto result =
      engine.query("/nonce", vigil::schema::make_bytes_view(key));
  EXPECT_EQ(result.code, 0u);
  return encoder.decode<uint64_t>(vigil::schema::make_bytes_view(result.value));
}

inline vigil::schema::lamports_t query_balance(
    vigil::execution::engine& engine,
    const vigil::schema::identity_t& identity) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(identity);
  const auto result =
      engine.query("/balance", vigil::schema::make_bytes_view(key));
  EXPECT_EQ(result.code, 0u);
  return encoder.decode<vigil::schema::lamports_t>(
      vigil::schema::make_bytes_view(result.value));
}

inline std::optional<vigil::schema::authority_record_t> query_authority(
    vigil::execution::engine& engine,
    const vigil::schema::identity_t& owner) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(owner);
  const auto result =
      engine.query("/authority", vigil::schema::make_bytes_view(key));
  if (result.code != 0) {
    return std::nullopt;
  }
  return encoder.decode<vigil::schema::authority_record_t>(
      vigil::schema::make_bytes_view(result.value));
}

inline std::optional<vigil::schema::event_record_t> query_event(
    vigil::execution::engine& engine,
    const vigil::schema::identity_t& owner,
    const uint64_t sequence_index) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(std::tuple{owner, sequence_index});
  const auto result =
      engine.query("/event", vigil::schema::make_bytes_view(key));
  if (result.code != 0) {
    return std::nullopt;
  }
  return encoder.decode<vigil::schema::event_record_t>(
      vigil::schema::make_bytes_view(result.value));
}

inline std::vector<vigil::schema::event_record_t> query_recent_events(
    vigil::execution::engine& engine,
    const vigil::schema::identity_t& owner,
    const uint64_t limit) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(std::tuple{owner, limit});
  const auto result =
      engine.query("/events/recent", vigil::schema::make_bytes_view(key));
  EXPECT_EQ(result.code, 0u);
  return encoder.decode<std::vector<vigil::schema::event_record_t>>(
      vigil::schema::make_bytes_view(result.value));
}

}  // namespace vigil::testing
