#pragma once

#include <warden/chain/revision_store.hpp>
#include <warden/schema/entity_kind.hpp>
#include <warden/schema/status_category.hpp>

#include <optional>
#include <vector>

namespace warden::index {

/// One entity and the category its latest status places it in.
struct index_entry_t final {
  warden::schema::entity_ref_t entity;
  warden::schema::status_category_t category{
      warden::schema::status_category_t::pending};
};

/// Category sets derived from the status chains. Never authoritative: any
/// entry can be recomputed from the chain tips.
class status_index final {
 public:
  explicit status_index(warden::chain::storage_t& storage);

  /// Move `entity` into `next`, clearing it from every other category.
  /// Applying the same move twice leaves the index unchanged.
  void on_transition(
      const warden::schema::entity_ref_t& entity,
      const std::optional<warden::schema::status_category_t>& previous,
      warden::schema::status_category_t next);

  std::vector<warden::schema::hash32_t> list(
      warden::schema::entity_kind_t kind,
      warden::schema::status_category_t category) const;
  std::vector<warden::schema::hash32_t> list_all(
      warden::schema::entity_kind_t kind) const;
  std::optional<warden::schema::status_category_t> category_of(
      const warden::schema::entity_ref_t& entity) const;
  bool contains(const warden::schema::entity_ref_t& entity,
                warden::schema::status_category_t category) const;

  /// Replace the whole index with `entries`, one kind at a time.
  void rebuild(const std::vector<index_entry_t>& entries);

 private:
  warden::chain::storage_t& storage_;
};

}  // namespace warden::index
