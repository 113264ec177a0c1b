#pragma once

#include <scale/scale.hpp>
#include <warden/schema/administrator_standing.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    administrator_standing_t,
    warden::schema::administrator_standing_t::active,
    warden::schema::administrator_standing_t::removed)
