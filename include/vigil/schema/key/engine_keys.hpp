#pragma once

#include <vigil/schema/primitives.hpp>

#include <string_view>

// Schema key type: engine keys.
// Audit workflow: storage keyspaces for record accounts, payer balances and
// signer nonces.
namespace vigil::schema::key {

inline constexpr std::string_view kAccountKeyPrefix{"SYS|ACCOUNT|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};

vigil::schema::bytes_t make_account_key(const vigil::schema::address_t& address);
vigil::schema::bytes_t make_balance_key(
    const vigil::schema::identity_t& identity);
vigil::schema::bytes_t make_nonce_key(const vigil::schema::identity_t& signer);

}  // namespace vigil::schema::key
