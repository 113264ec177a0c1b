#include <warden/execution/engine.hpp>
#include <warden/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

using namespace warden::schema;

namespace warden::execution {

namespace {

template <typename T>
operation_result<T> status_failure(const error_code_t code, std::string log) {
  spdlog::warn("status: {}: {}", to_string(code), log);
  return make_failure<T>(code, std::move(log), kStatusCodespace);
}

template <typename Record>
std::vector<Record> parents_first(std::vector<Record> records) {
  std::stable_sort(std::begin(records), std::end(records),
                   [](const Record& lhs, const Record& rhs) {
                     return lhs.depth < rhs.depth;
                   });
  return records;
}

}  // namespace

timestamp_milliseconds_t system_clock_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

engine::engine(warden::chain::encoder_t& encoder,
               warden::chain::storage_t& storage,
               const warden::crypto::keypair& signer,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      signer_{signer},
      options_{std::move(options)},
      statuses_{storage, encoder, key::kStatusChain, signer,
                options_.verifier},
      administrators_{storage, encoder, signer, options_.verifier},
      guard_{storage, encoder, administrators_, options_.progenitor},
      index_{storage} {
  if (!options_.clock) {
    options_.clock = system_clock_now;
  }
  spdlog::info("engine ready for agent {}", to_hex(signer_.public_key()));
}

const agent_key_t& engine::agent() const {
  return signer_.public_key();
}

std::optional<entity_link_t> engine::load_link(
    const entity_ref_t& entity) const {
  auto link_key = key::make_entity_status_key(entity);
  return storage_.get<entity_link_t>(encoder_, bytes_view_t{link_key});
}

operation_result<status_entry_t> engine::get_latest_status(
    const entity_ref_t& entity) const {
  auto lock = std::scoped_lock{mutex_};
  auto link = load_link(entity);
  if (!link.has_value()) {
    return make_failure<status_entry_t>(error_code_t::not_found,
                                        "entity has no status",
                                        kStatusCodespace);
  }
  return statuses_.resolve_latest(link->status_original_hash);
}

operation_result<std::vector<status_entry_t>> engine::get_status_history(
    const entity_ref_t& entity) const {
  auto lock = std::scoped_lock{mutex_};
  auto link = load_link(entity);
  if (!link.has_value()) {
    return make_failure<std::vector<status_entry_t>>(
        error_code_t::not_found, "entity has no status", kStatusCodespace);
  }
  return statuses_.resolve_history(link->status_original_hash);
}

operation_result<std::vector<fork_t>> engine::get_status_forks(
    const entity_ref_t& entity) const {
  auto lock = std::scoped_lock{mutex_};
  auto link = load_link(entity);
  if (!link.has_value()) {
    return make_failure<std::vector<fork_t>>(
        error_code_t::not_found, "entity has no status", kStatusCodespace);
  }
  return statuses_.find_forks(link->status_original_hash);
}

operation_result<std::vector<hash32_t>> engine::list_entities_by_category(
    const entity_kind_t kind,
    const status_category_t category) const {
  auto lock = std::scoped_lock{mutex_};
  return make_success(index_.list(kind, category));
}

operation_result<std::vector<hash32_t>> engine::list_all_entities(
    const entity_kind_t kind) const {
  auto lock = std::scoped_lock{mutex_};
  return make_success(index_.list_all(kind));
}

operation_result<bool> engine::is_entity_accepted(
    const entity_ref_t& entity) const {
  auto lock = std::scoped_lock{mutex_};
  auto link = load_link(entity);
  if (!link.has_value()) {
    return make_success(false);
  }
  auto latest = statuses_.resolve_latest(link->status_original_hash);
  if (!latest) {
    return forward_failure<bool>(latest);
  }
  return make_success(latest.value->record.payload.status_type ==
                      status_type_t::accepted);
}

operation_result<bool> engine::is_agent_administrator(
    const agent_key_t& agent) const {
  auto lock = std::scoped_lock{mutex_};
  return make_success(administrators_.is_agent_administrator(agent));
}

operation_result<bool> engine::is_entity_administrator(
    const entity_ref_t& entity) const {
  auto lock = std::scoped_lock{mutex_};
  return make_success(administrators_.is_entity_administrator(entity));
}

operation_result<std::vector<hash32_t>> engine::list_administrators(
    const entity_kind_t kind) const {
  auto lock = std::scoped_lock{mutex_};
  return make_success(administrators_.list_administrators(kind));
}

operation_result<std::vector<administrator_entry_t>>
engine::get_administrator_history(const entity_ref_t& entity) const {
  auto lock = std::scoped_lock{mutex_};
  return administrators_.administrator_history(entity);
}

operation_result<entity_link_t> engine::get_status_link(
    const entity_ref_t& entity) const {
  auto lock = std::scoped_lock{mutex_};
  auto link = load_link(entity);
  if (!link.has_value()) {
    return make_failure<entity_link_t>(error_code_t::not_found,
                                       "entity has no status",
                                       kStatusCodespace);
  }
  return make_success(std::move(*link));
}

operation_result<hash32_t> engine::create_status(
    const entity_ref_t& entity,
    const std::vector<agent_key_t>& agent_keys) {
  auto lock = std::scoped_lock{mutex_};
  if (load_link(entity).has_value()) {
    return status_failure<hash32_t>(
        error_code_t::already_has_status,
        to_hex(entity.hash) + " already has a status");
  }

  auto created = statuses_.create(entity.hash, warden::lifecycle::make_pending(),
                                  options_.clock());
  if (!created) {
    return created;
  }

  auto link = entity_link_t{};
  link.entity = entity;
  link.status_original_hash = *created.value;
  link.agent_keys = agent_keys;

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_entity_status_key(entity),
                          encoder_.encode(link));
  for (const auto& agent : agent_keys) {
    batch.puts.emplace_back(key::make_entity_agent_key(agent, entity),
                            encoder_.encode(entity));
  }
  storage_.write(batch);
  index_.on_transition(entity, std::nullopt, status_category_t::pending);

  spdlog::info("status: created {} {} as pending", to_string(entity.kind),
               to_hex(entity.hash));
  return created;
}

operation_result<hash32_t> engine::apply_update(
    const entity_ref_t& entity,
    const hash32_t& original,
    const hash32_t& previous,
    const warden::lifecycle::transition_request& request,
    const timestamp_milliseconds_t now) {
  auto link = load_link(entity);
  if (!link.has_value()) {
    return status_failure<hash32_t>(error_code_t::not_found,
                                    "entity has no status");
  }
  if (link->status_original_hash != original) {
    return status_failure<hash32_t>(
        error_code_t::not_found,
        "original hash is not the status chain of the entity");
  }

  auto latest = statuses_.resolve_latest(original);
  if (!latest) {
    return forward_failure<hash32_t>(latest);
  }
  const auto current = latest.value->record.payload.status_type;

  auto next = warden::lifecycle::transition(current, request, now);
  if (!next) {
    return forward_failure<hash32_t>(next);
  }

  auto appended = statuses_.append(original, previous, *next.value, now);
  if (!appended) {
    return appended;
  }
  index_.on_transition(entity, category_for(current),
                       category_for(next.value->status_type));

  spdlog::info("status: {} {} is now {}", to_string(entity.kind),
               to_hex(entity.hash), to_string(next.value->status_type));
  return appended;
}

operation_result<hash32_t> engine::update_status(
    const entity_ref_t& entity,
    const hash32_t& original,
    const hash32_t& previous,
    const warden::lifecycle::transition_request& request) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_status_mutation(agent(), entity);
  if (!allowed) {
    return forward_failure<hash32_t>(allowed);
  }
  return apply_update(entity, original, previous, request, options_.clock());
}

operation_result<hash32_t> engine::suspend_temporarily(
    const entity_ref_t& entity,
    const hash32_t& original,
    const hash32_t& previous,
    std::string reason,
    const uint32_t duration_days) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_status_mutation(agent(), entity);
  if (!allowed) {
    return forward_failure<hash32_t>(allowed);
  }
  auto now = options_.clock();
  return apply_update(
      entity, original, previous,
      warden::lifecycle::make_suspension(std::move(reason), duration_days, now),
      now);
}

operation_result<hash32_t> engine::suspend_indefinitely(
    const entity_ref_t& entity,
    const hash32_t& original,
    const hash32_t& previous,
    std::string reason) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_status_mutation(agent(), entity);
  if (!allowed) {
    return forward_failure<hash32_t>(allowed);
  }
  auto now = options_.clock();
  return apply_update(
      entity, original, previous,
      warden::lifecycle::make_suspension(std::move(reason), std::nullopt, now),
      now);
}

operation_result<hash32_t> engine::unsuspend(const entity_ref_t& entity,
                                             const hash32_t& original,
                                             const hash32_t& previous) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_status_mutation(agent(), entity);
  if (!allowed) {
    return forward_failure<hash32_t>(allowed);
  }
  auto request = warden::lifecycle::transition_request{};
  request.status_type = status_type_t::accepted;
  return apply_update(entity, original, previous, request, options_.clock());
}

operation_result<bool> engine::unsuspend_if_expired(const entity_ref_t& entity,
                                                    const hash32_t& original,
                                                    const hash32_t& previous) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_status_mutation(agent(), entity);
  if (!allowed) {
    return forward_failure<bool>(allowed);
  }
  auto link = load_link(entity);
  if (!link.has_value() || link->status_original_hash != original) {
    return status_failure<bool>(error_code_t::not_found,
                                "original hash is not the status chain of the "
                                "entity");
  }
  auto latest = statuses_.resolve_latest(original);
  if (!latest) {
    return forward_failure<bool>(latest);
  }

  auto now = options_.clock();
  if (!warden::lifecycle::is_expired(latest.value->record.payload, now)) {
    spdlog::debug("status: {} suspension still running",
                  to_hex(entity.hash));
    return make_success(false);
  }

  auto request = warden::lifecycle::transition_request{};
  request.status_type = status_type_t::accepted;
  auto updated = apply_update(entity, original, previous, request, now);
  if (!updated) {
    return forward_failure<bool>(updated);
  }
  return make_success(true);
}

operation_result<hash32_t> engine::bootstrap_administrator(
    const entity_ref_t& entity,
    const std::vector<agent_key_t>& agent_keys) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_bootstrap(agent());
  if (!allowed) {
    return forward_failure<hash32_t>(allowed);
  }
  return administrators_.register_administrator(entity, agent_keys,
                                                options_.clock());
}

operation_result<hash32_t> engine::register_administrator(
    const entity_ref_t& entity,
    const std::vector<agent_key_t>& agent_keys) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_administration(agent(), entity, false);
  if (!allowed) {
    return forward_failure<hash32_t>(allowed);
  }
  return administrators_.register_administrator(entity, agent_keys,
                                                options_.clock());
}

operation_result<hash32_t> engine::remove_administrator(
    const entity_ref_t& entity,
    const std::vector<agent_key_t>& agent_keys,
    const std::optional<std::string>& reason) {
  auto lock = std::scoped_lock{mutex_};
  auto allowed = guard_.authorize_administration(agent(), entity, true);
  if (!allowed) {
    return forward_failure<hash32_t>(allowed);
  }
  return administrators_.remove_administrator(entity, agent_keys, reason,
                                              options_.clock());
}

std::size_t engine::rebuild_index() {
  auto prefix = key::make_entity_status_prefix();
  auto entries = std::vector<warden::index::index_entry_t>{};
  for (const auto& [link_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    auto link = encoder_.decode<entity_link_t>(bytes_view_t{value});
    auto latest = statuses_.resolve_latest(link.status_original_hash);
    if (!latest) {
      spdlog::warn("index: {} links to a missing status chain",
                   to_hex(link.entity.hash));
      continue;
    }
    entries.push_back(warden::index::index_entry_t{
        link.entity, category_for(latest.value->record.payload.status_type)});
  }
  index_.rebuild(entries);
  return entries.size();
}

operation_result<std::size_t> engine::rebuild_index_from_chains() {
  auto lock = std::scoped_lock{mutex_};
  return make_success(rebuild_index());
}

operation_result<replica_t> engine::export_replica() const {
  auto lock = std::scoped_lock{mutex_};
  auto replica = replica_t{};
  auto prefix = key::make_entity_status_prefix();
  for (const auto& [link_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    replica.entity_links.push_back(
        encoder_.decode<entity_link_t>(bytes_view_t{value}));
  }
  replica.status_records = statuses_.export_records();
  replica.administrator_records =
      administrators_.store().export_records();
  spdlog::info("replica: exported {} link(s), {} status and {} administrator "
               "record(s)",
               replica.entity_links.size(), replica.status_records.size(),
               replica.administrator_records.size());
  return make_success(std::move(replica));
}

void engine::merge_link(const entity_link_t& incoming) {
  auto existing = load_link(incoming.entity);
  auto merged = existing.value_or(incoming);
  if (existing.has_value()) {
    if (existing->status_original_hash != incoming.status_original_hash) {
      spdlog::warn("replica: {} has a second status chain {}; keeping {}",
                   to_hex(incoming.entity.hash),
                   to_hex(incoming.status_original_hash),
                   to_hex(existing->status_original_hash));
      return;
    }
    for (const auto& agent : incoming.agent_keys) {
      if (std::find(std::begin(merged.agent_keys), std::end(merged.agent_keys),
                    agent) == std::end(merged.agent_keys)) {
        merged.agent_keys.push_back(agent);
      }
    }
  } else {
    auto root_key =
        key::make_root_key(key::kStatusChain, incoming.status_original_hash);
    if (!storage_.exists(bytes_view_t{root_key})) {
      spdlog::warn("replica: skipping link of {} without its status chain",
                   to_hex(incoming.entity.hash));
      return;
    }
  }

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_entity_status_key(merged.entity),
                          encoder_.encode(merged));
  for (const auto& agent : merged.agent_keys) {
    batch.puts.emplace_back(key::make_entity_agent_key(agent, merged.entity),
                            encoder_.encode(merged.entity));
  }
  storage_.write(batch);
}

operation_result<std::size_t> engine::import_replica(
    const replica_t& replica) {
  auto lock = std::scoped_lock{mutex_};
  auto accepted = std::size_t{};
  auto first_failure = std::optional<operation_result<hash32_t>>{};

  for (const auto& record : parents_first(replica.administrator_records)) {
    auto ingested = administrators_.store().ingest(record);
    if (ingested) {
      ++accepted;
    } else if (!first_failure.has_value()) {
      first_failure = ingested;
    }
  }
  for (const auto& record : parents_first(replica.status_records)) {
    auto ingested = statuses_.ingest(record);
    if (ingested) {
      ++accepted;
    } else if (!first_failure.has_value()) {
      first_failure = ingested;
    }
  }
  for (const auto& link : replica.entity_links) {
    merge_link(link);
  }

  auto indexed = rebuild_index();
  auto administrators = administrators_.rebuild_from_chains();
  spdlog::info("replica: imported {} record(s); {} entities, {} "
               "administrator(s)",
               accepted, indexed, administrators);

  if (first_failure.has_value()) {
    return forward_failure<std::size_t>(*first_failure);
  }
  return make_success(accepted);
}

}  // namespace warden::execution
