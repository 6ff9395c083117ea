#include <gtest/gtest.h>
#include <vigil/blake3/hash.hpp>
#include <vigil/schema/authority_record.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/schema/event_record.hpp>
#include <vigil/schema/key/address.hpp>
#include <vigil/schema/record_account.hpp>
#include <vigil/schema/transaction.hpp>

#include <algorithm>
#include <tuple>
#include <variant>

namespace {

using encoder_t = vigil::schema::encoding::encoder<
    vigil::schema::encoding::scale_encoder_tag>;

vigil::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = vigil::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

vigil::schema::authority_record_t make_authority() {
  return vigil::schema::authority_record_t{.owner_identity = make_hash(1),
                                           .event_count = 7,
                                           .created_at = 1'700'000'000,
                                           .address_proof = 254};
}

vigil::schema::event_record_t make_event() {
  return vigil::schema::event_record_t{
      .owner_identity = make_hash(1),
      .event_kind = vigil::schema::event_kind_t::secret_leak_caught,
      .content_digest = make_hash(90),
      .allowed = true,
      .timestamp = 1'700'000'123,
      .sequence_index = 6,
      .details_length = 120,
      .address_proof = 255};
}

}  // namespace

TEST(encoding_types, authority_record_layout_is_fixed_size) {
  auto encoder = encoder_t{};
  auto tag = vigil::schema::key::make_type_tag(
      vigil::schema::authority_record_t::kTypeName);
  auto encoded = encoder.encode(std::tuple{tag, make_authority()});
  EXPECT_EQ(encoded.size(), vigil::schema::authority_record_t::kEncodedSize);
  EXPECT_TRUE(std::equal(std::begin(tag), std::end(tag), std::begin(encoded)));

  // event_count follows the owner as a little-endian u64.
  EXPECT_EQ(encoded[8 + 32], 7u);
  EXPECT_EQ(encoded.back(), 254u);
}

TEST(encoding_types, event_record_layout_is_fixed_size) {
  auto encoder = encoder_t{};
  auto tag = vigil::schema::key::make_type_tag(
      vigil::schema::event_record_t::kTypeName);
  auto record = make_event();
  auto encoded = encoder.encode(std::tuple{tag, record});
  ASSERT_EQ(encoded.size(), vigil::schema::event_record_t::kEncodedSize);
  EXPECT_EQ(encoded[8 + 32], 2u);
  EXPECT_TRUE(std::equal(std::begin(record.content_digest),
                         std::end(record.content_digest),
                         std::begin(encoded) + 8 + 32 + 1));
  EXPECT_EQ(encoded[8 + 32 + 1 + 32], 1u);
}

TEST(encoding_types, records_decode_to_identical_fields) {
  auto encoder = encoder_t{};
  auto record = make_event();
  auto decoded = encoder.decode<vigil::schema::event_record_t>(
      vigil::schema::make_bytes_view(encoder.encode(record)));
  EXPECT_EQ(decoded.owner_identity, record.owner_identity);
  EXPECT_EQ(decoded.event_kind, record.event_kind);
  EXPECT_EQ(decoded.content_digest, record.content_digest);
  EXPECT_EQ(decoded.allowed, record.allowed);
  EXPECT_EQ(decoded.timestamp, record.timestamp);
  EXPECT_EQ(decoded.sequence_index, record.sequence_index);
  EXPECT_EQ(decoded.details_length, record.details_length);
  EXPECT_EQ(decoded.address_proof, record.address_proof);
}

TEST(encoding_types, type_tags_are_blake3_prefixes) {
  auto digest = vigil::blake3::hash(std::string_view{"account:AuditAuthority"});
  auto tag = vigil::schema::key::make_type_tag("AuditAuthority");
  EXPECT_TRUE(std::equal(std::begin(tag), std::end(tag), std::begin(digest)));
  EXPECT_NE(vigil::schema::key::make_type_tag("AuditAuthority"),
            vigil::schema::key::make_type_tag("SecurityEvent"));
}

TEST(encoding_types, transaction_payload_variant_index_leads_payload) {
  auto encoder = encoder_t{};
  auto tx = vigil::schema::transaction_t{
      .version = 1,
      .chain_id = make_hash(3),
      .nonce = 9,
      .signer = make_hash(4),
      .payload = vigil::schema::close_event_t{.authority_owner = make_hash(4),
                                              .sequence_index = 11},
      .signature = {}};
  auto encoded = encoder.encode(tx);
  // version(2) + chain_id(32) + nonce(8) + signer(32), then the variant index.
  ASSERT_GT(encoded.size(), 74u);
  EXPECT_EQ(encoded[74], 2u);

  auto decoded = encoder.decode<vigil::schema::transaction_t>(
      vigil::schema::make_bytes_view(encoded));
  ASSERT_TRUE(
      std::holds_alternative<vigil::schema::close_event_t>(decoded.payload));
  EXPECT_EQ(std::get<vigil::schema::close_event_t>(decoded.payload)
                .sequence_index,
            11u);
  EXPECT_EQ(decoded.nonce, 9u);
  EXPECT_EQ(decoded.signer, tx.signer);
}

TEST(encoding_types, log_event_keeps_raw_event_kind) {
  auto encoder = encoder_t{};
  auto payload = vigil::schema::log_event_t{.authority_owner = make_hash(4),
                                            .event_kind = 9,
                                            .content_digest = make_hash(5),
                                            .allowed = false,
                                            .details_length = 40};
  auto decoded = encoder.decode<vigil::schema::log_event_t>(
      vigil::schema::make_bytes_view(encoder.encode(payload)));
  EXPECT_EQ(decoded.event_kind, 9u);
  EXPECT_EQ(decoded.details_length, 40u);
}

TEST(encoding_types, truncated_transaction_fails_to_decode) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(vigil::schema::transaction_t{});
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder.try_decode<vigil::schema::transaction_t>(
                          vigil::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, minimum_balance_covers_record_overhead) {
  EXPECT_EQ(vigil::schema::minimum_balance(0), 128u * 3480u * 2u);
  EXPECT_EQ(vigil::schema::minimum_balance(
                vigil::schema::authority_record_t::kEncodedSize),
            1'287'600u);
  EXPECT_EQ(vigil::schema::minimum_balance(
                vigil::schema::event_record_t::kEncodedSize),
            1'538'160u);
}
