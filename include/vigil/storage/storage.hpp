#pragma once
#include <vigil/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::storage {

/// One staged write. A missing value deletes the key.
using write_entry_t =
    std::pair<vigil::schema::bytes_t, std::optional<vigil::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const vigil::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const vigil::schema::bytes_view_t& key,
           const T& value);

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<vigil::schema::bytes_t> get_raw(
      const vigil::schema::bytes_view_t& key) const;

  /// Atomically apply every entry (puts and deletes) or none of them.
  void apply(const std::vector<write_entry_t>& entries);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace vigil::storage
