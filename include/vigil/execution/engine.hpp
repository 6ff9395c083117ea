#pragma once

#include <vigil/execution/record_store.hpp>
#include <vigil/execution/signature_verifier.hpp>
#include <vigil/execution/staged_state.hpp>
#include <vigil/execution/time_source.hpp>
#include <vigil/schema/encoding/encoder.hpp>
#include <vigil/schema/notification.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/query_result.hpp>
#include <vigil/schema/transaction.hpp>
#include <vigil/schema/transaction_error_code.hpp>
#include <vigil/schema/transaction_result.hpp>
#include <vigil/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>

namespace vigil::execution {

inline constexpr auto kCheckTxCodespace = std::string_view{"vigil.checktx"};
inline constexpr auto kAuditCodespace = std::string_view{"vigil.audit"};
inline constexpr auto kQueryCodespace = std::string_view{"vigil.query"};

using notification_sink_t =
    std::function<void(const vigil::schema::notification_t& notification)>;

/// Deterministic audit ledger state machine.
///
/// The engine admits signed transactions, executes `initialize`,
/// `log_event` and `close_event` against the record store, and answers
/// read-path queries. Transactions are serialized; each one either commits
/// all of its writes in a single storage batch or none of them.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// `time_source` stamps new records. `require_strict_crypto` enables real
  /// signature verification; when false, signatures are not checked.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  time_source_t time_source = make_system_time_source(),
                  bool require_strict_crypto = true);

  /// Admission checks only (decode, version, chain id, nonce, signature).
  /// Does not mutate ledger state.
  vigil::schema::transaction_result_t check_transaction(
      const vigil::schema::bytes_view_t& raw_tx);

  /// Admit and execute one transaction.
  ///
  /// Once admitted, the signer nonce advances even when the operation
  /// fails; the operation's own writes are kept only on success.
  /// Notifications are delivered to the sink after the commit.
  vigil::schema::transaction_result_t execute_transaction(
      const vigil::schema::bytes_view_t& raw_tx);

  /// Execute a read-path query by route.
  vigil::schema::query_result_t query(std::string_view path,
                                      const vigil::schema::bytes_view_t& data);

  /// Fund an identity so it can pay record deposits.
  bool credit(const vigil::schema::identity_t& identity,
              vigil::schema::lamports_t amount);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  void set_notification_sink(notification_sink_t sink);

 private:
  vigil::schema::transaction_result_t execute_locked(
      const vigil::schema::bytes_view_t& raw_tx);

  /// Validate transaction envelope, nonce and signature.
  vigil::schema::transaction_result_t validate_transaction(
      const vigil::schema::transaction_t& tx,
      const record_store& store,
      std::string_view codespace);

  vigil::schema::transaction_result_t execute_operation(
      const vigil::schema::transaction_t& tx,
      record_store& store);

  vigil::schema::transaction_result_t initialize(
      const vigil::schema::identity_t& signer,
      record_store& store);
  vigil::schema::transaction_result_t log_event(
      const vigil::schema::identity_t& signer,
      const vigil::schema::log_event_t& operation,
      record_store& store);
  vigil::schema::transaction_result_t close_event(
      const vigil::schema::identity_t& signer,
      const vigil::schema::close_event_t& operation,
      record_store& store);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  time_source_t time_source_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  notification_sink_t notification_sink_;
};

}  // namespace vigil::execution
