#pragma once

#include <capvault/schema/ledger_event_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(capvault::schema,
                             ledger_event_type_t,
                             capvault::schema::ledger_event_type_t::deposit,
                             capvault::schema::ledger_event_type_t::withdrawal)
