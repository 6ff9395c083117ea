#pragma once

#include <vigil/execution/staged_state.hpp>
#include <vigil/schema/authority_record.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/schema/event_record.hpp>
#include <vigil/schema/key/address.hpp>
#include <vigil/schema/key/engine_keys.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/record_account.hpp>
#include <vigil/schema/transaction_error_code.hpp>
#include <cstdint>
#include <optional>
#include <tuple>

namespace vigil::execution {

using encoder_t = vigil::schema::encoding::encoder<
    vigil::schema::encoding::scale_encoder_tag>;

/// Record accounts, balances and nonces on top of a staged overlay.
///
/// Fallible operations report through `error` and leave the overlay
/// untouched when they fail. Every record is persisted as its type tag
/// followed by its fields.
class record_store final {
 public:
  record_store(encoder_t& encoder, staged_state& state);

  std::optional<vigil::schema::record_account_t> load_account(
      const vigil::schema::address_t& address) const;

  /// Allocate a record at an unoccupied address. The payer funds the
  /// storage deposit for `data`, which is held by the record.
  bool create_record(const vigil::schema::address_t& address,
                     vigil::schema::bytes_t data,
                     const vigil::schema::identity_t& payer,
                     vigil::schema::transaction_error_code& error);

  /// Replace the data of a live record, keeping its deposit.
  void write_record(const vigil::schema::address_t& address,
                    vigil::schema::bytes_t data);

  /// Delete a record and credit its deposit to `refund_to`.
  bool destroy_record(const vigil::schema::address_t& address,
                      const vigil::schema::identity_t& refund_to,
                      vigil::schema::transaction_error_code& error);

  template <typename Record>
  vigil::schema::bytes_t encode_record(const Record& record);

  /// Load and decode a record, checking existence and type tag.
  template <typename Record>
  std::optional<Record> load_record(
      const vigil::schema::address_t& address,
      vigil::schema::transaction_error_code& error) const;

  /// Load the authority record of `owner` and re-check its address proof.
  std::optional<vigil::schema::authority_record_t> load_authority(
      const vigil::schema::identity_t& owner,
      vigil::schema::transaction_error_code& error) const;

  /// Load event `sequence_index` of `owner` and re-check its address proof.
  std::optional<vigil::schema::event_record_t> load_event(
      const vigil::schema::identity_t& owner,
      uint64_t sequence_index,
      vigil::schema::transaction_error_code& error) const;

  vigil::schema::lamports_t balance(
      const vigil::schema::identity_t& identity) const;
  /// False when the balance would overflow.
  bool credit(const vigil::schema::identity_t& identity,
              vigil::schema::lamports_t amount);

  uint64_t nonce(const vigil::schema::identity_t& identity) const;
  void set_nonce(const vigil::schema::identity_t& identity, uint64_t nonce);

 private:
  void set_balance(const vigil::schema::identity_t& identity,
                   vigil::schema::lamports_t amount);
  void put_account(const vigil::schema::address_t& address,
                   const vigil::schema::record_account_t& account);

  encoder_t& encoder_;
  staged_state& state_;
};

template <typename Record>
vigil::schema::bytes_t record_store::encode_record(const Record& record) {
  static const auto tag = vigil::schema::key::make_type_tag(Record::kTypeName);
  return encoder_.encode(std::tuple{tag, record});
}

template <typename Record>
std::optional<Record> record_store::load_record(
    const vigil::schema::address_t& address,
    vigil::schema::transaction_error_code& error) const {
  static const auto tag = vigil::schema::key::make_type_tag(Record::kTypeName);
  auto account = load_account(address);
  if (!account) {
    error = vigil::schema::transaction_error_code::record_not_found;
    return std::nullopt;
  }
  auto decoded = encoder_.template try_decode<
      std::tuple<vigil::schema::type_tag_t, Record>>(
      vigil::schema::make_bytes_view(account->data));
  if (!decoded || std::get<0>(*decoded) != tag) {
    error = vigil::schema::transaction_error_code::record_type_mismatch;
    return std::nullopt;
  }
  return std::get<1>(*decoded);
}

}  // namespace vigil::execution
