#include <spdlog/spdlog.h>
#include <vigil/common/critical.hpp>
#include <vigil/execution/record_store.hpp>
#include <limits>

using namespace vigil::schema;

namespace vigil::execution {

record_store::record_store(encoder_t& encoder, staged_state& state)
    : encoder_{encoder}, state_{state} {}

std::optional<record_account_t> record_store::load_account(
    const address_t& address) const {
  auto key = key::make_account_key(address);
  auto raw = state_.get(make_bytes_view(key));
  if (!raw) {
    return std::nullopt;
  }
  auto account = encoder_.try_decode<record_account_t>(make_bytes_view(*raw));
  if (!account) {
    vigil::common::critical("corrupt record account in ledger storage");
  }
  return account;
}

bool record_store::create_record(const address_t& address,
                                 bytes_t data,
                                 const identity_t& payer,
                                 transaction_error_code& error) {
  if (load_account(address)) {
    error = transaction_error_code::address_already_occupied;
    return false;
  }
  auto deposit = minimum_balance(data.size());
  auto available = balance(payer);
  if (available < deposit) {
    spdlog::warn("Payer {} holds {} lamports, record needs {}",
                 to_hex(payer), available, deposit);
    error = transaction_error_code::insufficient_funds;
    return false;
  }
  set_balance(payer, available - deposit);
  put_account(address,
              record_account_t{.lamports = deposit, .data = std::move(data)});
  return true;
}

void record_store::write_record(const address_t& address, bytes_t data) {
  auto account = load_account(address);
  if (!account) {
    vigil::common::critical("write to a record that does not exist");
  }
  account->data = std::move(data);
  put_account(address, *account);
}

bool record_store::destroy_record(const address_t& address,
                                  const identity_t& refund_to,
                                  transaction_error_code& error) {
  auto account = load_account(address);
  if (!account) {
    error = transaction_error_code::record_not_found;
    return false;
  }
  if (!credit(refund_to, account->lamports)) {
    vigil::common::critical("refund overflows recipient balance");
  }
  state_.erase(make_bytes_view(key::make_account_key(address)));
  return true;
}

std::optional<authority_record_t> record_store::load_authority(
    const identity_t& owner,
    transaction_error_code& error) const {
  auto derived = key::derive_authority_address(owner);
  auto record = load_record<authority_record_t>(derived.address, error);
  if (!record) {
    return std::nullopt;
  }
  if (!key::verify_authority_address(derived.address, owner,
                                     record->address_proof)) {
    error = transaction_error_code::address_proof_mismatch;
    return std::nullopt;
  }
  return record;
}

std::optional<event_record_t> record_store::load_event(
    const identity_t& owner,
    const uint64_t sequence_index,
    transaction_error_code& error) const {
  auto derived = key::derive_event_address(owner, sequence_index);
  auto record = load_record<event_record_t>(derived.address, error);
  if (!record) {
    return std::nullopt;
  }
  if (!key::verify_event_address(derived.address, owner, sequence_index,
                                 record->address_proof)) {
    error = transaction_error_code::address_proof_mismatch;
    return std::nullopt;
  }
  return record;
}

lamports_t record_store::balance(const identity_t& identity) const {
  auto raw = state_.get(make_bytes_view(key::make_balance_key(identity)));
  if (!raw) {
    return 0;
  }
  return encoder_.decode<lamports_t>(make_bytes_view(*raw));
}

bool record_store::credit(const identity_t& identity, const lamports_t amount) {
  auto current = balance(identity);
  if (amount > std::numeric_limits<lamports_t>::max() - current) {
    return false;
  }
  set_balance(identity, current + amount);
  return true;
}

uint64_t record_store::nonce(const identity_t& identity) const {
  auto raw = state_.get(make_bytes_view(key::make_nonce_key(identity)));
  if (!raw) {
    return 0;
  }
  return encoder_.decode<uint64_t>(make_bytes_view(*raw));
}

void record_store::set_nonce(const identity_t& identity, const uint64_t nonce) {
  state_.put(make_bytes_view(key::make_nonce_key(identity)),
             encoder_.encode(nonce));
}

void record_store::set_balance(const identity_t& identity,
                               const lamports_t amount) {
  state_.put(make_bytes_view(key::make_balance_key(identity)),
             encoder_.encode(amount));
}

void record_store::put_account(const address_t& address,
                               const record_account_t& account) {
  state_.put(make_bytes_view(key::make_account_key(address)),
             encoder_.encode(account));
}

}  // namespace vigil::execution
