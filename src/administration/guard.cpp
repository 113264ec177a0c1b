#include <warden/administration/guard.hpp>
#include <warden/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace warden::schema;

namespace warden::administration {

namespace {

operation_result<bool> deny(std::string log) {
  spdlog::warn("unauthorized: {}", log);
  return make_failure<bool>(error_code_t::unauthorized, std::move(log),
                            kAdminCodespace);
}

}  // namespace

guard::guard(warden::chain::storage_t& storage,
             warden::chain::encoder_t& encoder,
             const registry& administrators,
             std::optional<agent_key_t> progenitor)
    : storage_{storage},
      encoder_{encoder},
      administrators_{administrators},
      progenitor_{std::move(progenitor)} {}

std::vector<entity_ref_t> guard::entities_of(const agent_key_t& agent) const {
  auto entities = std::vector<entity_ref_t>{};
  auto prefix = key::make_entity_agent_prefix(agent);
  for (const auto& [link_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    entities.push_back(encoder_.decode<entity_ref_t>(bytes_view_t{value}));
  }
  auto administered = administrators_.administrator_entity_for(agent);
  if (administered.has_value() &&
      std::find(std::begin(entities), std::end(entities), *administered) ==
          std::end(entities)) {
    entities.push_back(*administered);
  }
  return entities;
}

operation_result<bool> guard::authorize_status_mutation(
    const agent_key_t& caller,
    const entity_ref_t& target) const {
  if (!administrators_.is_agent_administrator(caller)) {
    return deny(to_hex(caller) + " is not an administrator");
  }
  auto own = entities_of(caller);
  if (std::find(std::begin(own), std::end(own), target) != std::end(own)) {
    return deny("administrators cannot change their own status");
  }
  return make_success(true);
}

operation_result<bool> guard::authorize_administration(
    const agent_key_t& caller,
    const entity_ref_t& target,
    const bool removing) const {
  if (!administrators_.is_agent_administrator(caller)) {
    return deny(to_hex(caller) + " is not an administrator");
  }
  if (removing) {
    auto own = entities_of(caller);
    if (std::find(std::begin(own), std::end(own), target) != std::end(own)) {
      return deny("administrators cannot remove themselves");
    }
  }
  return make_success(true);
}

operation_result<bool> guard::authorize_bootstrap(
    const agent_key_t& caller) const {
  if (administrators_.count_administrators() != 0) {
    return deny("an administrator is already registered");
  }
  if (progenitor_.has_value() && *progenitor_ != caller) {
    return deny(to_hex(caller) + " is not the progenitor");
  }
  return make_success(true);
}

}  // namespace warden::administration
