#include <warden/index/status_index.hpp>
#include <warden/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

using namespace warden::schema;

namespace warden::index {

namespace {

std::vector<hash32_t> hashes_under(const warden::chain::storage_t& storage,
                                   const bytes_t& prefix) {
  auto hashes = std::vector<hash32_t>{};
  for (const auto& [entry_key, value] :
       storage.list_by_prefix(bytes_view_t{prefix})) {
    hashes.push_back(key::hash_suffix(entry_key));
  }
  return hashes;
}

}  // namespace

status_index::status_index(warden::chain::storage_t& storage)
    : storage_{storage} {}

void status_index::on_transition(
    const entity_ref_t& entity,
    const std::optional<status_category_t>& previous,
    const status_category_t next) {
  auto batch = warden::storage::write_batch_t{};
  for (auto category : kAllStatusCategories) {
    if (category != next) {
      batch.deletes.push_back(key::make_category_key(entity, category));
    }
  }
  batch.puts.emplace_back(key::make_category_key(entity, next), bytes_t{});
  batch.puts.emplace_back(key::make_all_entities_key(entity), bytes_t{});
  storage_.write(batch);

  if (previous.has_value()) {
    spdlog::debug("index: {} {} moved {} -> {}", to_string(entity.kind),
                  to_hex(entity.hash), to_string(*previous), to_string(next));
  } else {
    spdlog::debug("index: {} {} added to {}", to_string(entity.kind),
                  to_hex(entity.hash), to_string(next));
  }
}

std::vector<hash32_t> status_index::list(
    const entity_kind_t kind,
    const status_category_t category) const {
  return hashes_under(storage_, key::make_category_prefix(kind, category));
}

std::vector<hash32_t> status_index::list_all(const entity_kind_t kind) const {
  return hashes_under(storage_, key::make_all_entities_prefix(kind));
}

std::optional<status_category_t> status_index::category_of(
    const entity_ref_t& entity) const {
  for (auto category : kAllStatusCategories) {
    if (contains(entity, category)) {
      return category;
    }
  }
  return std::nullopt;
}

bool status_index::contains(const entity_ref_t& entity,
                            const status_category_t category) const {
  auto category_key = key::make_category_key(entity, category);
  return storage_.exists(bytes_view_t{category_key});
}

void status_index::rebuild(const std::vector<index_entry_t>& entries) {
  for (auto kind : kAllEntityKinds) {
    auto categories = std::vector<warden::storage::key_value_entry_t>{};
    auto all = std::vector<warden::storage::key_value_entry_t>{};
    for (const auto& entry : entries) {
      if (entry.entity.kind != kind) {
        continue;
      }
      categories.emplace_back(key::make_category_key(entry.entity,
                                                     entry.category),
                              bytes_t{});
      all.emplace_back(key::make_all_entities_key(entry.entity), bytes_t{});
    }
    auto category_prefix = key::make_index_prefix(kind);
    auto all_prefix = key::make_all_entities_prefix(kind);
    storage_.replace_by_prefix(bytes_view_t{category_prefix}, categories);
    storage_.replace_by_prefix(bytes_view_t{all_prefix}, all);
    spdlog::info("index: rebuilt {} with {} entities", to_string(kind),
                 all.size());
  }
}

}  // namespace warden::index
