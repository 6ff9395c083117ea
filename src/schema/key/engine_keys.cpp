#include <vigil/schema/key/builder.hpp>
#include <vigil/schema/key/engine_keys.hpp>

namespace vigil::schema::key {

vigil::schema::bytes_t make_account_key(
    const vigil::schema::address_t& address) {
  return builder{}.write(kAccountKeyPrefix).write(address).data;
}

vigil::schema::bytes_t make_balance_key(
    const vigil::schema::identity_t& identity) {
  return builder{}.write(kBalanceKeyPrefix).write(identity).data;
}

vigil::schema::bytes_t make_nonce_key(const vigil::schema::identity_t& signer) {
  return builder{}.write(kNonceKeyPrefix).write(signer).data;
}

}  // namespace vigil::schema::key
