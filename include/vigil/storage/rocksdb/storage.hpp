#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <vigil/common/critical.hpp>
#include <vigil/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace vigil::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const vigil::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const vigil::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const vigil::schema::bytes_view_t& key,
           const T& value);

  std::optional<vigil::schema::bytes_t> get_raw(
      const vigil::schema::bytes_view_t& key) const;

  void apply(const std::vector<write_entry_t>& entries);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const vigil::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(vigil::schema::make_bytes_view(*value))};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const vigil::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    vigil::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(vigil::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    vigil::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace vigil::storage
