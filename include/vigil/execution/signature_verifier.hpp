#pragma once

#include <vigil/schema/primitives.hpp>
#include <functional>

namespace vigil::execution {

using signature_verifier_t =
    std::function<bool(const vigil::schema::bytes_view_t& message,
                       const vigil::schema::identity_t& signer,
                       const vigil::schema::signature_t& signature)>;

}  // namespace vigil::execution
