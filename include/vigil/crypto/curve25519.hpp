#pragma once

#include <vigil/schema/primitives.hpp>

namespace vigil::crypto {

/// True when `point` decompresses to a point on the Ed25519 curve, i.e. when
/// some secret key could in principle sign for it.
bool is_on_curve(const vigil::schema::hash32_t& point);

}  // namespace vigil::crypto
