#pragma once
#include <warden/schema/entity_kind.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/status_category.hpp>
#include <string_view>

// Schema keys: deterministic RocksDB key construction. Prefix functions
// return the shared leading bytes of a key family for range scans.
namespace warden::schema::key {

inline constexpr auto kStatusChain = std::string_view{"STATUS"};
inline constexpr auto kAdministratorChain = std::string_view{"ADMIN"};

// Revision chains, per chain namespace.
bytes_t make_record_key(std::string_view chain, const hash32_t& hash);
bytes_t make_root_key(std::string_view chain, const hash32_t& hash);
bytes_t make_root_prefix(std::string_view chain);
bytes_t make_member_key(std::string_view chain,
                        const hash32_t& original,
                        const hash32_t& hash);
bytes_t make_member_prefix(std::string_view chain, const hash32_t& original);
bytes_t make_successor_key(std::string_view chain,
                           const hash32_t& previous,
                           const hash32_t& hash);
bytes_t make_successor_prefix(std::string_view chain, const hash32_t& previous);
bytes_t make_tip_key(std::string_view chain, const hash32_t& original);

// Entity links.
bytes_t make_entity_status_key(const entity_ref_t& entity);
bytes_t make_entity_status_prefix();
bytes_t make_entity_agent_key(const agent_key_t& agent,
                              const entity_ref_t& entity);
bytes_t make_entity_agent_prefix(const agent_key_t& agent);

// Derived category sets.
bytes_t make_category_key(const entity_ref_t& entity,
                          status_category_t category);
bytes_t make_category_prefix(entity_kind_t kind, status_category_t category);
bytes_t make_all_entities_key(const entity_ref_t& entity);
bytes_t make_all_entities_prefix(entity_kind_t kind);
bytes_t make_index_prefix(entity_kind_t kind);

// Administrator registry.
bytes_t make_administrator_chain_key(const entity_ref_t& entity);
bytes_t make_agent_administrator_key(const agent_key_t& agent);
bytes_t make_agent_administrator_prefix();
bytes_t make_administrators_key(const entity_ref_t& entity);
bytes_t make_administrators_prefix();
bytes_t make_administrators_prefix(entity_kind_t kind);

/// Trailing 32 bytes of a key, i.e. the hash that closes most key families.
hash32_t hash_suffix(const bytes_t& key);

}  // namespace warden::schema::key
