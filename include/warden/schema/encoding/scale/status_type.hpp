#pragma once

#include <scale/scale.hpp>
#include <warden/schema/status_type.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    status_type_t,
    warden::schema::status_type_t::pending,
    warden::schema::status_type_t::accepted,
    warden::schema::status_type_t::rejected,
    warden::schema::status_type_t::suspended_temporarily,
    warden::schema::status_type_t::suspended_indefinitely)
