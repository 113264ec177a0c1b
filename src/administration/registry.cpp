#include <warden/administration/registry.hpp>
#include <warden/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <map>
#include <set>

using namespace warden::schema;

namespace warden::administration {

namespace {

template <typename T>
operation_result<T> fail(const error_code_t code, std::string log) {
  spdlog::warn("administration: {}: {}", to_string(code), log);
  return make_failure<T>(code, std::move(log), kAdminCodespace);
}

}  // namespace

registry::registry(warden::chain::storage_t& storage,
                   warden::chain::encoder_t& encoder,
                   const warden::crypto::keypair& signer,
                   warden::crypto::signature_verifier_t verifier)
    : storage_{storage},
      encoder_{encoder},
      store_{storage, encoder, key::kAdministratorChain, signer,
             std::move(verifier)} {}

std::optional<hash32_t> registry::chain_of(const entity_ref_t& entity) const {
  auto chain_key = key::make_administrator_chain_key(entity);
  return storage_.get<hash32_t>(encoder_, bytes_view_t{chain_key});
}

operation_result<hash32_t> registry::register_administrator(
    const entity_ref_t& entity,
    const std::vector<agent_key_t>& agent_keys,
    const timestamp_milliseconds_t now) {
  if (agent_keys.empty()) {
    return fail<hash32_t>(error_code_t::invalid_record,
                          "an administrator needs at least one agent key");
  }

  for (const auto& agent : agent_keys) {
    auto owner = administrator_entity_for(agent);
    if (owner.has_value() && *owner != entity &&
        is_entity_administrator(*owner)) {
      return fail<hash32_t>(error_code_t::already_administrator,
                            to_hex(agent) + " already acts for administrator " +
                                to_hex(owner->hash));
    }
  }

  auto payload = administrator_t{};
  payload.entity = entity;
  payload.agent_keys = agent_keys;

  auto original = chain_of(entity);
  auto appended = operation_result<hash32_t>{};
  if (original.has_value()) {
    auto latest = store_.resolve_latest(*original);
    if (!latest) {
      warden::common::critical("administrator link without chain");
    }
    if (latest.value->record.payload.standing ==
        administrator_standing_t::active) {
      return fail<hash32_t>(error_code_t::already_administrator,
                            to_hex(entity.hash) + " is already registered");
    }
    appended = store_.append(*original, latest.value->hash, payload, now);
  } else {
    appended = store_.create(entity.hash, payload, now);
  }
  if (!appended) {
    return appended;
  }

  auto batch = warden::storage::write_batch_t{};
  if (!original.has_value()) {
    batch.puts.emplace_back(key::make_administrator_chain_key(entity),
                            encoder_.encode(*appended.value));
  }
  for (const auto& agent : agent_keys) {
    batch.puts.emplace_back(key::make_agent_administrator_key(agent),
                            encoder_.encode(entity));
  }
  batch.puts.emplace_back(key::make_administrators_key(entity), bytes_t{});
  storage_.write(batch);

  spdlog::info("administration: registered {} {} with {} agent key(s)",
               to_string(entity.kind), to_hex(entity.hash), agent_keys.size());
  return appended;
}

operation_result<hash32_t> registry::remove_administrator(
    const entity_ref_t& entity,
    const std::vector<agent_key_t>& agent_keys,
    const std::optional<std::string>& reason,
    const timestamp_milliseconds_t now) {
  auto original = chain_of(entity);
  if (!original.has_value()) {
    return fail<hash32_t>(error_code_t::not_found,
                          to_hex(entity.hash) + " is not an administrator");
  }
  auto latest = store_.resolve_latest(*original);
  if (!latest) {
    warden::common::critical("administrator link without chain");
  }
  const auto& current = latest.value->record.payload;
  if (current.standing != administrator_standing_t::active) {
    return fail<hash32_t>(error_code_t::not_found,
                          to_hex(entity.hash) + " is not an administrator");
  }
  if (!agent_keys.empty() &&
      std::set<agent_key_t>(std::begin(agent_keys), std::end(agent_keys)) !=
          std::set<agent_key_t>(std::begin(current.agent_keys),
                                std::end(current.agent_keys))) {
    return fail<hash32_t>(error_code_t::invalid_record,
                          "agent keys of an administrator are revoked "
                          "together");
  }
  if (count_administrators() <= 1) {
    return fail<hash32_t>(error_code_t::last_administrator,
                          "cannot remove the last administrator");
  }

  auto payload = current;
  payload.standing = administrator_standing_t::removed;
  payload.reason = reason;
  auto appended = store_.append(*original, latest.value->hash, payload, now);
  if (!appended) {
    return appended;
  }

  auto batch = warden::storage::write_batch_t{};
  for (const auto& agent : payload.agent_keys) {
    if (administrator_entity_for(agent) == entity) {
      batch.deletes.push_back(key::make_agent_administrator_key(agent));
    }
  }
  batch.deletes.push_back(key::make_administrators_key(entity));
  storage_.write(batch);

  spdlog::info("administration: removed {} {}", to_string(entity.kind),
               to_hex(entity.hash));
  return appended;
}

bool registry::is_agent_administrator(const agent_key_t& agent) const {
  return administrator_entity_for(agent).has_value();
}

bool registry::is_entity_administrator(const entity_ref_t& entity) const {
  auto original = chain_of(entity);
  if (!original.has_value()) {
    return false;
  }
  auto latest = store_.resolve_latest(*original);
  return latest.ok() && latest.value->record.payload.standing ==
                            administrator_standing_t::active;
}

std::optional<entity_ref_t> registry::administrator_entity_for(
    const agent_key_t& agent) const {
  auto agent_key = key::make_agent_administrator_key(agent);
  return storage_.get<entity_ref_t>(encoder_, bytes_view_t{agent_key});
}

std::vector<hash32_t> registry::list_administrators(
    const entity_kind_t kind) const {
  auto prefix = key::make_administrators_prefix(kind);
  auto hashes = std::vector<hash32_t>{};
  for (const auto& [entry_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    hashes.push_back(key::hash_suffix(entry_key));
  }
  return hashes;
}

operation_result<std::vector<administrator_entry_t>>
registry::administrator_history(const entity_ref_t& entity) const {
  auto original = chain_of(entity);
  if (!original.has_value()) {
    return make_failure<std::vector<administrator_entry_t>>(
        error_code_t::not_found, "no administrator chain for entity",
        kAdminCodespace);
  }
  return store_.resolve_history(*original);
}

std::size_t registry::count_administrators() const {
  auto prefix = key::make_administrators_prefix();
  return storage_.list_by_prefix(bytes_view_t{prefix}).size();
}

std::size_t registry::rebuild_from_chains() {
  // Two replicas may each have started a chain for the same entity; the
  // chain whose tip is newest decides.
  auto winners = std::map<bytes_t, administrator_entry_t>{};
  auto originals = std::map<bytes_t, hash32_t>{};
  for (const auto& root : store_.list_roots()) {
    auto latest = store_.resolve_latest(root);
    if (!latest) {
      warden::common::critical("administrator root without tip");
    }
    auto chain_key =
        key::make_administrator_chain_key(latest.value->record.payload.entity);
    auto found = winners.find(chain_key);
    if (found == winners.end() ||
        warden::chain::tip_before(found->second, *latest.value)) {
      winners[chain_key] = *latest.value;
      originals[chain_key] = root;
    }
  }

  auto agents = std::vector<warden::storage::key_value_entry_t>{};
  auto administrators = std::vector<warden::storage::key_value_entry_t>{};
  auto links = warden::storage::write_batch_t{};
  for (const auto& [chain_key, entry] : winners) {
    const auto& payload = entry.record.payload;
    links.puts.emplace_back(chain_key, encoder_.encode(originals[chain_key]));
    if (payload.standing != administrator_standing_t::active) {
      continue;
    }
    for (const auto& agent : payload.agent_keys) {
      agents.emplace_back(key::make_agent_administrator_key(agent),
                          encoder_.encode(payload.entity));
    }
    administrators.emplace_back(key::make_administrators_key(payload.entity),
                                bytes_t{});
  }

  storage_.write(links);
  auto agent_prefix = key::make_agent_administrator_prefix();
  auto administrators_prefix = key::make_administrators_prefix();
  storage_.replace_by_prefix(bytes_view_t{agent_prefix}, agents);
  storage_.replace_by_prefix(bytes_view_t{administrators_prefix},
                             administrators);

  spdlog::info("administration: rebuilt registry with {} administrator(s)",
               administrators.size());
  return administrators.size();
}

}  // namespace warden::administration
