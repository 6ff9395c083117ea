#pragma once

#include <vigil/execution/engine.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/storage/rocksdb/storage.hpp>
#include <vigil/testing/common.hpp>
#include <vigil/testing/execution_harness.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace vigil::testing {

class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{vigil::storage::make_storage<
            vigil::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, [this] { return now_; }, strict_crypto} {
    engine_.set_notification_sink(
        [this](const vigil::schema::notification_t& notification) {
          notifications_.push_back(notification);
        });
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  vigil::storage::storage<vigil::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  vigil::execution::engine& engine() { return engine_; }

  const std::vector<vigil::schema::notification_t>& notifications() const {
    return notifications_;
  }

  void set_time(const vigil::schema::timestamp_seconds_t now) { now_ = now; }

  /// Submit an unsigned transaction with the signer's next nonce.
  vigil::schema::transaction_result_t submit(
      const vigil::schema::identity_t& signer,
      const vigil::schema::transaction_payload_t& payload) {
    auto tx = make_transaction(query_nonce(engine_, signer), signer, payload);
    return engine_.execute_transaction(
        vigil::schema::make_bytes_view(encode_transaction(tx)));
  }

  void fund(const vigil::schema::identity_t& identity,
            const vigil::schema::lamports_t amount = kFunding) {
    EXPECT_TRUE(engine_.credit(identity, amount));
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  vigil::storage::storage<vigil::storage::rocksdb_storage_tag> storage_;
  vigil::schema::timestamp_seconds_t now_{kGenesisTime};
  vigil::execution::engine engine_;
  std::vector<vigil::schema::notification_t> notifications_;
};

}  // namespace vigil::testing
