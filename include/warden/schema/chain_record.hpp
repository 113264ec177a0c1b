#pragma once

#include <warden/schema/administrator.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/status.hpp>

#include <cstdint>

// Schema type: chain record.
// One immutable, author-signed node of a revision chain. The root has
// depth 0 and carries its own hash in `original_hash` and `previous_hash`.
// `subject` is the hash of the entity the chain describes; it separates the
// roots of chains that start from identical payloads.
namespace warden::schema {

template <typename Payload>
struct chain_record final {
  uint16_t version{1};
  hash32_t subject{};
  hash32_t original_hash{};
  hash32_t previous_hash{};
  uint64_t depth{};
  agent_key_t author{};
  timestamp_milliseconds_t created_at{};
  Payload payload{};
  signature_t signature{};

  bool is_root() const { return depth == 0; }
};

/// A record together with its content hash.
template <typename Payload>
struct chain_entry final {
  hash32_t hash{};
  chain_record<Payload> record;
};

/// Successors that share one predecessor. Produced by concurrent writers on
/// different replicas; reconciled manually by a later update.
struct fork_t final {
  hash32_t previous_hash{};
  std::vector<hash32_t> branches;
};

using status_record_t = chain_record<status_t>;
using status_entry_t = chain_entry<status_t>;
using administrator_record_t = chain_record<administrator_t>;
using administrator_entry_t = chain_entry<administrator_t>;

}  // namespace warden::schema
