#pragma once

#include <warden/chain/revision_store.hpp>
#include <warden/schema/administrator.hpp>

#include <optional>
#include <string>
#include <vector>

namespace warden::administration {

/// Administrator standing, one revision chain per administrator entity, plus
/// the agent-key index that answers "is this caller an administrator".
class registry final {
 public:
  registry(warden::chain::storage_t& storage,
           warden::chain::encoder_t& encoder,
           const warden::crypto::keypair& signer,
           warden::crypto::signature_verifier_t verifier =
               warden::crypto::verify_signature);

  /// Grant standing to `entity` and every one of its agent keys. Extends a
  /// removed administrator's chain rather than starting a second one. A key
  /// already acting for another active administrator is refused.
  warden::schema::operation_result<warden::schema::hash32_t>
  register_administrator(
      const warden::schema::entity_ref_t& entity,
      const std::vector<warden::schema::agent_key_t>& agent_keys,
      warden::schema::timestamp_milliseconds_t now);

  /// Revoke standing and every agent key of the latest active record. A
  /// non-empty `agent_keys` must name exactly those keys. The last active
  /// administrator cannot be removed.
  warden::schema::operation_result<warden::schema::hash32_t>
  remove_administrator(
      const warden::schema::entity_ref_t& entity,
      const std::vector<warden::schema::agent_key_t>& agent_keys,
      const std::optional<std::string>& reason,
      warden::schema::timestamp_milliseconds_t now);

  bool is_agent_administrator(const warden::schema::agent_key_t& agent) const;
  bool is_entity_administrator(
      const warden::schema::entity_ref_t& entity) const;
  std::optional<warden::schema::entity_ref_t> administrator_entity_for(
      const warden::schema::agent_key_t& agent) const;
  std::vector<warden::schema::hash32_t> list_administrators(
      warden::schema::entity_kind_t kind) const;
  warden::schema::operation_result<
      std::vector<warden::schema::administrator_entry_t>>
  administrator_history(const warden::schema::entity_ref_t& entity) const;
  std::size_t count_administrators() const;

  /// Re-derive the agent-key index and the administrator set from the
  /// chains. Returns the number of active administrators.
  std::size_t rebuild_from_chains();

  warden::chain::revision_store<warden::schema::administrator_t>& store() {
    return store_;
  }
  const warden::chain::revision_store<warden::schema::administrator_t>& store()
      const {
    return store_;
  }

 private:
  std::optional<warden::schema::hash32_t> chain_of(
      const warden::schema::entity_ref_t& entity) const;

  warden::chain::storage_t& storage_;
  warden::chain::encoder_t& encoder_;
  warden::chain::revision_store<warden::schema::administrator_t> store_;
};

}  // namespace warden::administration
