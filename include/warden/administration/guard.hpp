#pragma once

#include <warden/administration/registry.hpp>

#include <optional>
#include <vector>

namespace warden::administration {

/// Gate in front of every mutation. Callers are identified by agent key.
class guard final {
 public:
  guard(warden::chain::storage_t& storage,
        warden::chain::encoder_t& encoder,
        const registry& administrators,
        std::optional<warden::schema::agent_key_t> progenitor);

  /// Caller must be an administrator and must not target its own entity.
  warden::schema::operation_result<bool> authorize_status_mutation(
      const warden::schema::agent_key_t& caller,
      const warden::schema::entity_ref_t& target) const;

  /// Caller must be an administrator; it may not remove itself.
  warden::schema::operation_result<bool> authorize_administration(
      const warden::schema::agent_key_t& caller,
      const warden::schema::entity_ref_t& target,
      bool removing) const;

  /// First administrator only: no administrator may exist yet, and a
  /// configured progenitor must be the caller.
  warden::schema::operation_result<bool> authorize_bootstrap(
      const warden::schema::agent_key_t& caller) const;

  /// Entities the agent acts for, through every profile it is linked to and
  /// its administrator registration.
  std::vector<warden::schema::entity_ref_t> entities_of(
      const warden::schema::agent_key_t& agent) const;

 private:
  warden::chain::storage_t& storage_;
  warden::chain::encoder_t& encoder_;
  const registry& administrators_;
  std::optional<warden::schema::agent_key_t> progenitor_;
};

}  // namespace warden::administration
