#pragma once

#include <warden/administration/guard.hpp>
#include <warden/administration/registry.hpp>
#include <warden/chain/revision_store.hpp>
#include <warden/crypto/keypair.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/index/status_index.hpp>
#include <warden/lifecycle/state_machine.hpp>
#include <warden/schema/entity_link.hpp>
#include <warden/schema/replica.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::execution {

using clock_function_t =
    std::function<warden::schema::timestamp_milliseconds_t()>;

/// Wall clock in milliseconds since the Unix epoch.
warden::schema::timestamp_milliseconds_t system_clock_now();

struct engine_options final {
  /// When set, only this agent may register the first administrator.
  std::optional<warden::schema::agent_key_t> progenitor;
  clock_function_t clock{system_clock_now};
  warden::crypto::signature_verifier_t verifier{
      warden::crypto::verify_signature};
};

/// Status and administration surface of one local agent over one replica.
///
/// The caller of every mutation is the agent whose key pair the engine was
/// built with. Calls are serialised by an internal mutex; engines of other
/// agents may share the same storage.
class engine final {
 public:
  /// Construct the engine over the replica in `storage`, acting as `signer`.
  explicit engine(
      warden::chain::encoder_t& encoder,
      warden::chain::storage_t& storage,
      const warden::crypto::keypair& signer,
      engine_options options = {});

  /// Agent key of the local agent.
  const warden::schema::agent_key_t& agent() const;

  // Queries. None of these are guarded.

  /// Latest record of the entity's status chain (deterministic tip).
  warden::schema::operation_result<warden::schema::status_entry_t>
  get_latest_status(const warden::schema::entity_ref_t& entity) const;

  /// Every status record, oldest first, including every fork branch.
  warden::schema::operation_result<std::vector<warden::schema::status_entry_t>>
  get_status_history(const warden::schema::entity_ref_t& entity) const;

  warden::schema::operation_result<std::vector<warden::schema::fork_t>>
  get_status_forks(const warden::schema::entity_ref_t& entity) const;

  warden::schema::operation_result<std::vector<warden::schema::hash32_t>>
  list_entities_by_category(warden::schema::entity_kind_t kind,
                            warden::schema::status_category_t category) const;

  warden::schema::operation_result<std::vector<warden::schema::hash32_t>>
  list_all_entities(warden::schema::entity_kind_t kind) const;

  /// False, not an error, for entities without a status chain.
  warden::schema::operation_result<bool> is_entity_accepted(
      const warden::schema::entity_ref_t& entity) const;

  warden::schema::operation_result<bool> is_agent_administrator(
      const warden::schema::agent_key_t& agent) const;

  warden::schema::operation_result<bool> is_entity_administrator(
      const warden::schema::entity_ref_t& entity) const;

  warden::schema::operation_result<std::vector<warden::schema::hash32_t>>
  list_administrators(warden::schema::entity_kind_t kind) const;

  warden::schema::operation_result<
      std::vector<warden::schema::administrator_entry_t>>
  get_administrator_history(const warden::schema::entity_ref_t& entity) const;

  /// Root of the entity's status chain and the agent keys acting for it.
  warden::schema::operation_result<warden::schema::entity_link_t>
  get_status_link(const warden::schema::entity_ref_t& entity) const;

  // Mutations.

  /// Start the entity's status chain as pending. Called by entity creation
  /// flows; not guarded.
  warden::schema::operation_result<warden::schema::hash32_t> create_status(
      const warden::schema::entity_ref_t& entity,
      const std::vector<warden::schema::agent_key_t>& agent_keys);

  /// Append a new status superseding `previous`, which must be the current
  /// tip of the chain rooted at `original`.
  warden::schema::operation_result<warden::schema::hash32_t> update_status(
      const warden::schema::entity_ref_t& entity,
      const warden::schema::hash32_t& original,
      const warden::schema::hash32_t& previous,
      const warden::lifecycle::transition_request& request);

  warden::schema::operation_result<warden::schema::hash32_t>
  suspend_temporarily(const warden::schema::entity_ref_t& entity,
                      const warden::schema::hash32_t& original,
                      const warden::schema::hash32_t& previous,
                      std::string reason,
                      uint32_t duration_days);

  warden::schema::operation_result<warden::schema::hash32_t>
  suspend_indefinitely(const warden::schema::entity_ref_t& entity,
                       const warden::schema::hash32_t& original,
                       const warden::schema::hash32_t& previous,
                       std::string reason);

  warden::schema::operation_result<warden::schema::hash32_t> unsuspend(
      const warden::schema::entity_ref_t& entity,
      const warden::schema::hash32_t& original,
      const warden::schema::hash32_t& previous);

  /// Accept the entity again if its temporary suspension has run out.
  ///
  /// Returns false, and writes nothing, while the suspension is still
  /// running or the entity is not temporarily suspended.
  warden::schema::operation_result<bool> unsuspend_if_expired(
      const warden::schema::entity_ref_t& entity,
      const warden::schema::hash32_t& original,
      const warden::schema::hash32_t& previous);

  /// Register the very first administrator of a network.
  warden::schema::operation_result<warden::schema::hash32_t>
  bootstrap_administrator(
      const warden::schema::entity_ref_t& entity,
      const std::vector<warden::schema::agent_key_t>& agent_keys);

  warden::schema::operation_result<warden::schema::hash32_t>
  register_administrator(
      const warden::schema::entity_ref_t& entity,
      const std::vector<warden::schema::agent_key_t>& agent_keys);

  warden::schema::operation_result<warden::schema::hash32_t>
  remove_administrator(
      const warden::schema::entity_ref_t& entity,
      const std::vector<warden::schema::agent_key_t>& agent_keys,
      const std::optional<std::string>& reason = std::nullopt);

  /// Recompute every category set from the status chain tips. Returns the
  /// number of entities indexed.
  warden::schema::operation_result<std::size_t> rebuild_index_from_chains();

  // Replication.

  /// Everything this replica holds, parents before children.
  warden::schema::operation_result<warden::schema::replica_t> export_replica()
      const;

  /// Merge a replica exported elsewhere, then rebuild derived indices.
  ///
  /// Records already present are skipped. Concurrent updates made on the two
  /// replicas become forks. Returns the number of records accepted; the
  /// first rejected record is reported as the failure after every other
  /// record has been merged.
  warden::schema::operation_result<std::size_t> import_replica(
      const warden::schema::replica_t& replica);

 private:
  std::optional<warden::schema::entity_link_t> load_link(
      const warden::schema::entity_ref_t& entity) const;

  /// Shared tail of every status mutation. Caller holds the mutex.
  warden::schema::operation_result<warden::schema::hash32_t> apply_update(
      const warden::schema::entity_ref_t& entity,
      const warden::schema::hash32_t& original,
      const warden::schema::hash32_t& previous,
      const warden::lifecycle::transition_request& request,
      warden::schema::timestamp_milliseconds_t now);

  std::size_t rebuild_index();
  void merge_link(const warden::schema::entity_link_t& link);

  mutable std::mutex mutex_;
  warden::chain::encoder_t& encoder_;
  warden::chain::storage_t& storage_;
  const warden::crypto::keypair& signer_;
  engine_options options_;
  warden::chain::revision_store<warden::schema::status_t> statuses_;
  warden::administration::registry administrators_;
  warden::administration::guard guard_;
  warden::index::status_index index_;
};

}  // namespace warden::execution
