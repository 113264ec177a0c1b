#pragma once

#include <warden/schema/entity_kind.hpp>
#include <warden/schema/primitives.hpp>

#include <vector>

// Schema type: entity link.
// Connects an entity to the root of its status chain and to the agent keys
// that act for it.
namespace warden::schema {

template <uint16_t Version>
struct entity_link;

template <>
struct entity_link<1> final {
  uint16_t version{1};
  entity_ref_t entity;
  hash32_t status_original_hash{};
  std::vector<agent_key_t> agent_keys;
};

using entity_link_t = entity_link<1>;

}  // namespace warden::schema
