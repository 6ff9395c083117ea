#include <vigil/common/critical.hpp>
#include <vigil/storage/rocksdb/storage.hpp>

namespace vigil::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    vigil::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened ledger database at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<vigil::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const vigil::schema::bytes_view_t& key) const {
  if (!database) {
    vigil::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    vigil::common::critical("Failed to get value from RocksDB");
  }
  return vigil::schema::make_bytes(value);
}

void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_entry_t>& entries) {
  if (!database) {
    vigil::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice = detail::to_slice(vigil::schema::make_bytes_view(key));
    auto status =
        value ? batch.Put(key_slice,
                          detail::to_slice(vigil::schema::make_bytes_view(*value)))
              : batch.Delete(key_slice);
    if (!status.ok()) {
      spdlog::error("Failed to stage write batch entry: {}", status.ToString());
      vigil::common::critical("Failed to stage write batch entry");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write batch: {}", status.ToString());
    vigil::common::critical("Failed to commit write batch");
  }
  spdlog::debug("Committed {} ledger writes", entries.size());
}

}  // namespace vigil::storage
