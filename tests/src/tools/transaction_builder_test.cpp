#include <gtest/gtest.h>
#include <vigil/crypto/verify.hpp>
#include <vigil/execution/details.hpp>
#include <vigil/execution/signing.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/schema/key/address.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef VIGIL_TRANSACTION_BUILDER_PATH
#define VIGIL_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = vigil::schema::encoding::encoder<
    vigil::schema::encoding::scale_encoder_tag>;

// RFC 8032 section 7.1, test 1.
constexpr auto kRfcSeed =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr auto kRfcPublicKey =
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
constexpr auto kOwner =
    "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

vigil::schema::transaction_t decode_transaction(const std::string& base64) {
  auto encoder = encoder_t{};
  auto raw = vigil::schema::from_base64(base64);
  return encoder.decode<vigil::schema::transaction_t>(
      vigil::schema::make_bytes_view(raw));
}

}  // namespace

TEST(transaction_builder, chain_id_matches_library) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  EXPECT_EQ(run_builder(builder, "chain-id"),
            vigil::schema::to_hex(vigil::execution::chain_id()));
}

TEST(transaction_builder, public_key_matches_rfc_vector) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  EXPECT_EQ(run_builder(builder, "public-key --seed " + std::string{kRfcSeed}),
            kRfcPublicKey);
}

TEST(transaction_builder, address_matches_derivation) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto owner = vigil::schema::make_hash32(std::string{kOwner});

  auto authority = vigil::schema::key::derive_authority_address(owner);
  EXPECT_EQ(run_builder(builder, "address --owner " + std::string{kOwner}),
            vigil::schema::to_hex(authority.address) + " " +
                std::to_string(authority.proof));

  auto event = vigil::schema::key::derive_event_address(owner, 7);
  EXPECT_EQ(run_builder(builder, "address --owner " + std::string{kOwner} +
                                     " --sequence-index 7"),
            vigil::schema::to_hex(event.address) + " " +
                std::to_string(event.proof));
}

TEST(transaction_builder, hash_details_prints_digest_and_length) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto details = std::string{"denied curl to pastebin"};
  EXPECT_EQ(
      run_builder(builder, "hash-details --details " + shell_quote(details)),
      vigil::schema::to_hex(vigil::execution::hash_details(details)) + " " +
          std::to_string(details.size()));
  EXPECT_EQ(run_builder(builder, "hash-details --details abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad 3");
}

TEST(transaction_builder, query_key_matches_route_contract) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};
  auto owner = vigil::schema::make_hash32(std::string{kOwner});

  EXPECT_EQ(run_builder(builder, "query-key --path /authority --owner " +
                                     std::string{kOwner}),
            vigil::schema::to_base64(encoder.encode(owner)));
  EXPECT_EQ(run_builder(builder, "query-key --path /event --owner " +
                                     std::string{kOwner} +
                                     " --sequence-index 3"),
            vigil::schema::to_base64(
                encoder.encode(std::tuple{owner, uint64_t{3}})));
  EXPECT_EQ(run_builder(builder, "query-key --path /events/recent --owner " +
                                     std::string{kOwner} + " --limit 10"),
            vigil::schema::to_base64(
                encoder.encode(std::tuple{owner, uint64_t{10}})));
  EXPECT_TRUE(run_builder(builder, "query-key --path /engine/info").empty());
}

TEST(transaction_builder, signed_log_event_decodes_and_verifies) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto details = std::string{"blocked rm -rf"};
  auto output = run_builder(
      builder, "transaction --payload log_event --nonce 4 --seed " +
                   std::string{kRfcSeed} +
                   " --event-kind injection_detected --allowed false"
                   " --details " +
                   shell_quote(details));

  auto tx = decode_transaction(output);
  auto signer = vigil::schema::make_hash32(std::string{kRfcPublicKey});
  EXPECT_EQ(tx.version, 1);
  EXPECT_EQ(tx.chain_id, vigil::execution::chain_id());
  EXPECT_EQ(tx.nonce, 4u);
  EXPECT_EQ(tx.signer, signer);

  ASSERT_TRUE(std::holds_alternative<vigil::schema::log_event_t>(tx.payload));
  auto payload = std::get<vigil::schema::log_event_t>(tx.payload);
  EXPECT_EQ(payload.authority_owner, signer);
  EXPECT_EQ(payload.event_kind, 1);
  EXPECT_FALSE(payload.allowed);
  EXPECT_EQ(payload.content_digest, vigil::execution::hash_details(details));
  EXPECT_EQ(payload.details_length, details.size());

  auto encoder = encoder_t{};
  auto message = vigil::execution::make_signing_payload(encoder, tx);
  EXPECT_TRUE(vigil::crypto::verify_signature(
      vigil::schema::make_bytes_view(message), tx.signer, tx.signature));
}

TEST(transaction_builder, close_event_targets_foreign_authority) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto output = run_builder(
      builder, "transaction --payload close_event --signer " +
                   std::string{kRfcPublicKey} + " --authority " +
                   std::string{kOwner} + " --sequence-index 9");

  auto tx = decode_transaction(output);
  ASSERT_TRUE(
      std::holds_alternative<vigil::schema::close_event_t>(tx.payload));
  auto payload = std::get<vigil::schema::close_event_t>(tx.payload);
  EXPECT_EQ(payload.authority_owner,
            vigil::schema::make_hash32(std::string{kOwner}));
  EXPECT_EQ(payload.sequence_index, 9u);
  EXPECT_EQ(tx.signature, vigil::schema::signature_t{});
}

TEST(transaction_builder, rejects_unknown_payload) {
  auto builder = std::string{VIGIL_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto command = shell_quote(builder) +
                 " transaction --payload create_vault --signer " +
                 std::string{kOwner} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  EXPECT_NE(exit_code, 0);
}
