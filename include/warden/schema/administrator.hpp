#pragma once

#include <warden/schema/administrator_standing.hpp>
#include <warden/schema/entity_kind.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: administrator.
// Payload of one administrator revision. All agent keys of the entity are
// granted or revoked together.
namespace warden::schema {

template <uint16_t Version>
struct administrator;

template <>
struct administrator<1> final {
  uint16_t version{1};
  entity_ref_t entity;
  std::vector<agent_key_t> agent_keys;
  administrator_standing_t standing{administrator_standing_t::active};
  std::optional<std::string> reason;
};

using administrator_t = administrator<1>;

}  // namespace warden::schema
