#pragma once

#include <capvault/schema/asset_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(capvault::schema,
                             asset_kind_t,
                             capvault::schema::asset_kind_t::native,
                             capvault::schema::asset_kind_t::token)
