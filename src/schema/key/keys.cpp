#include <warden/common/critical.hpp>
#include <warden/schema/key/builder.hpp>
#include <warden/schema/key/keys.hpp>

#include <algorithm>

using namespace warden::schema;

namespace warden::schema::key {

namespace {

constexpr auto kRoot = std::string_view{"WARDEN|"};

builder chain_family(const std::string_view chain,
                     const std::string_view family) {
  auto b = builder{};
  b.write(kRoot).write(chain).write("|").write(family).write("|");
  return b;
}

builder family(const std::string_view area, const std::string_view name) {
  auto b = builder{};
  b.write(kRoot).write(area).write("|").write(name).write("|");
  return b;
}

std::span<const uint8_t> view(const hash32_t& hash) {
  return std::span(hash.data(), hash.size());
}

}  // namespace

bytes_t make_record_key(const std::string_view chain, const hash32_t& hash) {
  return chain_family(chain, "REC").write(view(hash)).data;
}

bytes_t make_root_key(const std::string_view chain, const hash32_t& hash) {
  return chain_family(chain, "ROOT").write(view(hash)).data;
}

bytes_t make_root_prefix(const std::string_view chain) {
  return chain_family(chain, "ROOT").data;
}

bytes_t make_member_key(const std::string_view chain,
                        const hash32_t& original,
                        const hash32_t& hash) {
  return chain_family(chain, "MEMBER")
      .write(view(original))
      .write(view(hash))
      .data;
}

bytes_t make_member_prefix(const std::string_view chain,
                           const hash32_t& original) {
  return chain_family(chain, "MEMBER").write(view(original)).data;
}

bytes_t make_successor_key(const std::string_view chain,
                           const hash32_t& previous,
                           const hash32_t& hash) {
  return chain_family(chain, "NEXT")
      .write(view(previous))
      .write(view(hash))
      .data;
}

bytes_t make_successor_prefix(const std::string_view chain,
                              const hash32_t& previous) {
  return chain_family(chain, "NEXT").write(view(previous)).data;
}

bytes_t make_tip_key(const std::string_view chain, const hash32_t& original) {
  return chain_family(chain, "TIP").write(view(original)).data;
}

bytes_t make_entity_status_key(const entity_ref_t& entity) {
  return family("ENTITY", "STATUS").write(entity).data;
}

bytes_t make_entity_status_prefix() {
  return family("ENTITY", "STATUS").data;
}

bytes_t make_entity_agent_key(const agent_key_t& agent,
                              const entity_ref_t& entity) {
  return family("ENTITY", "AGENT").write(view(agent)).write(entity).data;
}

bytes_t make_entity_agent_prefix(const agent_key_t& agent) {
  return family("ENTITY", "AGENT").write(view(agent)).data;
}

bytes_t make_category_key(const entity_ref_t& entity,
                          const status_category_t category) {
  return family("INDEX", "CATEGORY")
      .write(entity.kind)
      .write(category)
      .write(view(entity.hash))
      .data;
}

bytes_t make_category_prefix(const entity_kind_t kind,
                             const status_category_t category) {
  return family("INDEX", "CATEGORY").write(kind).write(category).data;
}

bytes_t make_all_entities_key(const entity_ref_t& entity) {
  return family("INDEX", "ALL").write(entity).data;
}

bytes_t make_all_entities_prefix(const entity_kind_t kind) {
  return family("INDEX", "ALL").write(kind).data;
}

bytes_t make_index_prefix(const entity_kind_t kind) {
  return family("INDEX", "CATEGORY").write(kind).data;
}

bytes_t make_administrator_chain_key(const entity_ref_t& entity) {
  return family("ADMIN", "ENTITY").write(entity).data;
}

bytes_t make_agent_administrator_key(const agent_key_t& agent) {
  return family("ADMIN", "AGENT").write(view(agent)).data;
}

bytes_t make_agent_administrator_prefix() {
  return family("ADMIN", "AGENT").data;
}

bytes_t make_administrators_key(const entity_ref_t& entity) {
  return family("ADMIN", "ALL").write(entity).data;
}

bytes_t make_administrators_prefix() {
  return family("ADMIN", "ALL").data;
}

bytes_t make_administrators_prefix(const entity_kind_t kind) {
  return family("ADMIN", "ALL").write(kind).data;
}

hash32_t hash_suffix(const bytes_t& key) {
  auto hash = hash32_t{};
  if (key.size() < hash.size()) {
    warden::common::critical("key too short to carry a hash suffix");
  }
  std::copy(key.end() - static_cast<std::ptrdiff_t>(hash.size()), key.end(),
            hash.begin());
  return hash;
}

}  // namespace warden::schema::key
