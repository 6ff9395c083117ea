#pragma once

#include <vigil/schema/event_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(vigil::schema,
                             event_kind_t,
                             vigil::schema::event_kind_t::transaction_check,
                             vigil::schema::event_kind_t::injection_detected,
                             vigil::schema::event_kind_t::secret_leak_caught,
                             vigil::schema::event_kind_t::general_action)
