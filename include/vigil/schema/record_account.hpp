#pragma once

#include <vigil/schema/primitives.hpp>

#include <cstdint>

// Schema type: record account.
// Audit workflow: storage envelope for any record at a derived address. The
// lamports held here are the storage deposit refunded when it is destroyed.
namespace vigil::schema {

template <uint16_t Version>
struct record_account;

template <>
struct record_account<1> final {
  lamports_t lamports{};
  bytes_t data;
};

using record_account_t = record_account<1>;

/// Flat per-record overhead charged on top of the record payload.
inline constexpr auto kRecordStorageOverhead = uint64_t{128};
inline constexpr auto kLamportsPerByteYear = lamports_t{3480};
inline constexpr auto kRentExemptionYears = uint64_t{2};

/// Deposit required to keep a record of `data_size` bytes alive.
inline constexpr lamports_t minimum_balance(const uint64_t data_size) {
  return (data_size + kRecordStorageOverhead) * kLamportsPerByteYear *
         kRentExemptionYears;
}

}  // namespace vigil::schema
