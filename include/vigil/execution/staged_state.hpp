#pragma once

#include <vigil/schema/primitives.hpp>
#include <vigil/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>

namespace vigil::execution {

using storage_t = vigil::storage::storage<vigil::storage::rocksdb_storage_tag>;

/// Write overlay for a single transaction.
///
/// Reads see staged writes first, then committed storage. Nothing reaches
/// storage until `commit()`, which applies every staged write in one batch.
class staged_state final {
 public:
  explicit staged_state(storage_t& storage);

  std::optional<vigil::schema::bytes_t> get(
      const vigil::schema::bytes_view_t& key) const;
  bool contains(const vigil::schema::bytes_view_t& key) const;

  void put(const vigil::schema::bytes_view_t& key,
           vigil::schema::bytes_t value);
  void erase(const vigil::schema::bytes_view_t& key);

  size_t pending_writes() const;

  void commit();
  void discard();

 private:
  storage_t& storage_;
  std::map<vigil::schema::bytes_t, std::optional<vigil::schema::bytes_t>>
      writes_;
};

}  // namespace vigil::execution
