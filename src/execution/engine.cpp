#include <spdlog/spdlog.h>
#include <vigil/crypto/verify.hpp>
#include <vigil/execution/engine.hpp>
#include <vigil/execution/signing.hpp>
#include <vigil/schema/key/address.hpp>
#include <vigil/schema/query_error_code.hpp>
#include <limits>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace vigil::schema;

namespace {

std::optional<transaction_t> decode_transaction(
    vigil::execution::encoder_t& encoder,
    const bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "failed to decode transaction envelope";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_message(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{[](const initialize_t&) { return std::string_view{"initialize"}; },
                 [](const log_event_t&) { return std::string_view{"log_event"}; },
                 [](const close_event_t&) {
                   return std::string_view{"close_event"};
                 }},
      payload);
}

}  // namespace

namespace vigil::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               time_source_t time_source,
               bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      time_source_{std::move(time_source)},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{vigil::crypto::verify_signature} {
  if (!time_source_) {
    time_source_ = make_system_time_source();
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; transaction signatures are not "
                 "verified");
  } else if (!vigil::crypto::available()) {
    spdlog::warn("OpenSSL has no Ed25519 support; every signature will be "
                 "rejected");
  }
  spdlog::info("Audit ledger engine ready, program id {}",
               to_hex(key::program_id()));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             kCheckTxCodespace, decode_error);
  }
  auto state = staged_state{storage_};
  auto store = record_store{encoder_, state};
  return validate_transaction(*tx, store, kCheckTxCodespace);
}

transaction_result_t engine::execute_transaction(const bytes_view_t& raw_tx) {
  auto result = transaction_result_t{};
  auto sink = notification_sink_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    result = execute_locked(raw_tx);
    sink = notification_sink_;
  }
  if (sink) {
    for (const auto& notification : result.notifications) {
      sink(notification);
    }
  }
  return result;
}

transaction_result_t engine::execute_locked(const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!tx) {
    spdlog::warn("Rejected undecodable transaction: {}", decode_error);
    return make_error_result(transaction_error_code::invalid_transaction,
                             kCheckTxCodespace, decode_error);
  }

  auto state = staged_state{storage_};
  auto store = record_store{encoder_, state};
  auto admission = validate_transaction(*tx, store, kCheckTxCodespace);
  if (admission.code != 0) {
    spdlog::warn("Rejected {} from {}: {}", payload_name(tx->payload),
                 to_hex(tx->signer), admission.log);
    return admission;
  }

  auto result = execute_operation(*tx, store);
  if (result.code != 0) {
    spdlog::warn("{} from {} failed: {}", payload_name(tx->payload),
                 to_hex(tx->signer), result.log);
    state.discard();
  }
  store.set_nonce(tx->signer, tx->nonce + 1);
  state.commit();
  return result;
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  const record_store& store,
                                                  std::string_view codespace) {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version, codespace,
        "expected version 1");
  }
  if (tx.chain_id != chain_id()) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             codespace);
  }
  auto expected_nonce = store.nonce(tx.signer);
  if (tx.nonce != expected_nonce ||
      tx.nonce == std::numeric_limits<uint64_t>::max()) {
    return make_error_result(transaction_error_code::invalid_nonce, codespace,
                             "expected nonce " + std::to_string(expected_nonce));
  }
  if (require_strict_crypto_) {
    auto message = make_signing_payload(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(make_bytes_view(message), tx.signer,
                             tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed, codespace);
    }
  }

  auto result = transaction_result_t{};
  result.info = "admitted";
  return result;
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               record_store& store) {
  return std::visit(
      overloaded{[&](const initialize_t&) { return initialize(tx.signer, store); },
                 [&](const log_event_t& operation) {
                   return log_event(tx.signer, operation, store);
                 },
                 [&](const close_event_t& operation) {
                   return close_event(tx.signer, operation, store);
                 }},
      tx.payload);
}

transaction_result_t engine::initialize(const identity_t& signer,
                                        record_store& store) {
  auto derived = key::derive_authority_address(signer);
  auto now = time_source_();
  auto record = authority_record_t{.owner_identity = signer,
                                   .event_count = 0,
                                   .created_at = now,
                                   .address_proof = derived.proof};

  auto error = transaction_error_code{};
  if (!store.create_record(derived.address, store.encode_record(record),
                           signer, error)) {
    return make_error_result(error, kAuditCodespace);
  }

  spdlog::info("Audit authority initialized for {}", to_hex(signer));
  auto result = transaction_result_t{};
  result.info = "initialize accepted";
  result.data = bytes_t{std::begin(derived.address), std::end(derived.address)};
  result.notifications.push_back(
      audit_initialized_t{.owner_identity = signer, .timestamp = now});
  return result;
}

transaction_result_t engine::log_event(const identity_t& signer,
                                       const log_event_t& operation,
                                       record_store& store) {
  auto error = transaction_error_code{};
  auto authority = store.load_authority(operation.authority_owner, error);
  if (!authority) {
    return make_error_result(error, kAuditCodespace);
  }
  if (authority->owner_identity != signer) {
    return make_error_result(transaction_error_code::unauthorized_signer,
                             kAuditCodespace);
  }
  auto kind = try_make_event_kind(operation.event_kind);
  if (!kind) {
    return make_error_result(transaction_error_code::invalid_event_type,
                             kAuditCodespace,
                             "event kind " +
                                 std::to_string(operation.event_kind));
  }
  if (authority->event_count == std::numeric_limits<uint64_t>::max()) {
    return make_error_result(transaction_error_code::event_count_overflow,
                             kAuditCodespace);
  }

  auto sequence_index = authority->event_count;
  auto derived =
      key::derive_event_address(authority->owner_identity, sequence_index);
  auto now = time_source_();
  auto record = event_record_t{.owner_identity = authority->owner_identity,
                               .event_kind = *kind,
                               .content_digest = operation.content_digest,
                               .allowed = operation.allowed,
                               .timestamp = now,
                               .sequence_index = sequence_index,
                               .details_length = operation.details_length,
                               .address_proof = derived.proof};
  if (!store.create_record(derived.address, store.encode_record(record),
                           signer, error)) {
    return make_error_result(error, kAuditCodespace);
  }

  authority->event_count = sequence_index + 1;
  store.write_record(
      key::derive_authority_address(authority->owner_identity).address,
      store.encode_record(*authority));

  spdlog::info("Event #{} type={} allowed={} for {}", sequence_index,
               operation.event_kind, operation.allowed, to_hex(signer));
  auto result = transaction_result_t{};
  result.info = "log_event accepted";
  result.data = encoder_.encode(sequence_index);
  result.notifications.push_back(
      security_event_logged_t{.owner_identity = signer,
                              .sequence_index = sequence_index,
                              .event_kind = *kind,
                              .allowed = operation.allowed,
                              .content_digest = operation.content_digest,
                              .timestamp = now});
  return result;
}

transaction_result_t engine::close_event(const identity_t& signer,
                                         const close_event_t& operation,
                                         record_store& store) {
  auto error = transaction_error_code{};
  auto authority = store.load_authority(operation.authority_owner, error);
  if (!authority) {
    return make_error_result(error, kAuditCodespace);
  }
  if (authority->owner_identity != signer) {
    return make_error_result(transaction_error_code::unauthorized_signer,
                             kAuditCodespace);
  }
  auto event = store.load_event(operation.authority_owner,
                                operation.sequence_index, error);
  if (!event) {
    return make_error_result(error, kAuditCodespace);
  }
  if (event->owner_identity != signer) {
    return make_error_result(transaction_error_code::unauthorized_signer,
                             kAuditCodespace);
  }

  auto derived = key::derive_event_address(operation.authority_owner,
                                           operation.sequence_index);
  if (!store.destroy_record(derived.address, signer, error)) {
    return make_error_result(error, kAuditCodespace);
  }

  spdlog::info("Event #{} closed for {}", operation.sequence_index,
               to_hex(signer));
  auto result = transaction_result_t{};
  result.info = "close_event accepted";
  result.notifications.push_back(security_event_closed_t{
      .owner_identity = signer, .sequence_index = operation.sequence_index});
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto state = staged_state{storage_};
  auto store = record_store{encoder_, state};

  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.codespace = std::string{kQueryCodespace};
  auto fail = [&](const query_error_code code, const std::string_view log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::string{log};
    return result;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{chain_id(), key::program_id()});
    return result;
  }

  if (path == "/authority" || path == "/balance" || path == "/nonce" ||
      path == "/address/authority") {
    auto identity = encoder_.try_decode<identity_t>(data);
    if (!identity) {
      return fail(query_error_code::invalid_key, "expected 32 byte identity");
    }
    if (path == "/balance") {
      result.value = encoder_.encode(store.balance(*identity));
      return result;
    }
    if (path == "/nonce") {
      result.value = encoder_.encode(store.nonce(*identity));
      return result;
    }
    if (path == "/address/authority") {
      auto derived = key::derive_authority_address(*identity);
      result.value = encoder_.encode(std::tuple{derived.address, derived.proof});
      return result;
    }
    auto error = transaction_error_code{};
    auto record = store.load_authority(*identity, error);
    if (!record) {
      return fail(query_error_code::not_found, to_message(error));
    }
    result.value = encoder_.encode(*record);
    return result;
  }

  if (path == "/event" || path == "/events/recent" ||
      path == "/address/event") {
    auto request = encoder_.try_decode<std::tuple<identity_t, uint64_t>>(data);
    if (!request) {
      return fail(query_error_code::invalid_key,
                  "expected identity and 64 bit index");
    }
    auto [identity, index] = *request;
    auto error = transaction_error_code{};
    if (path == "/address/event") {
      auto derived = key::derive_event_address(identity, index);
      result.value = encoder_.encode(std::tuple{derived.address, derived.proof});
      return result;
    }
    if (path == "/event") {
      auto record = store.load_event(identity, index, error);
      if (!record) {
        return fail(query_error_code::not_found, to_message(error));
      }
      result.value = encoder_.encode(*record);
      return result;
    }

    // index carries the result limit; zero returns every live event. Only the
    // newest `limit` indices are scanned, closed ones inside them are skipped.
    auto authority = store.load_authority(identity, error);
    if (!authority) {
      return fail(query_error_code::not_found, to_message(error));
    }
    auto count = authority->event_count;
    auto oldest = index == 0 || index >= count ? uint64_t{0} : count - index;
    auto events = std::vector<event_record_t>{};
    for (auto next = count; next > oldest; --next) {
      auto record = store.load_event(identity, next - 1, error);
      if (record) {
        events.push_back(*record);
      }
    }
    result.value = encoder_.encode(events);
    return result;
  }

  return fail(query_error_code::unsupported_path, "unsupported query path");
}

bool engine::credit(const identity_t& identity, const lamports_t amount) {
  auto lock = std::scoped_lock{mutex_};
  auto state = staged_state{storage_};
  auto store = record_store{encoder_, state};
  if (!store.credit(identity, amount)) {
    spdlog::warn("Credit of {} lamports to {} overflows its balance", amount,
                 to_hex(identity));
    return false;
  }
  state.commit();
  spdlog::info("Credited {} lamports to {}", amount, to_hex(identity));
  return true;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier override without strict crypto");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

void engine::set_notification_sink(notification_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  notification_sink_ = std::move(sink);
}

}  // namespace vigil::execution
