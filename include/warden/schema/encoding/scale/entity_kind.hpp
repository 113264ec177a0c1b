#pragma once

#include <scale/scale.hpp>
#include <warden/schema/entity_kind.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(warden::schema,
                             entity_kind_t,
                             warden::schema::entity_kind_t::users,
                             warden::schema::entity_kind_t::organizations)
