#pragma once
#include <vigil/schema/primitives.hpp>

// Schema type: initialize.
// Audit workflow: creates the signer's authority record. Carries no
// arguments; the signer is the owner.
namespace vigil::schema {

template <uint16_t Version>
struct initialize;

template <>
struct initialize<1> final {};

using initialize_t = initialize<1>;

}  // namespace vigil::schema
