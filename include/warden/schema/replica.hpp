#pragma once

#include <warden/schema/chain_record.hpp>
#include <warden/schema/entity_link.hpp>

#include <vector>

// Schema type: replica.
// Everything one agent has authored or observed, exchanged between replicas.
// Derived indices are not shipped; the receiver rebuilds them.
namespace warden::schema {

template <uint16_t Version>
struct replica;

template <>
struct replica<1> final {
  uint16_t version{1};
  std::vector<entity_link_t> entity_links;
  std::vector<status_record_t> status_records;
  std::vector<administrator_record_t> administrator_records;
};

using replica_t = replica<1>;

}  // namespace warden::schema
