#include <algorithm>
#include <warden/schema/key/builder.hpp>
#include <iterator>

using namespace warden::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const warden::schema::entity_kind_t& kind) {
  return write(static_cast<uint8_t>(kind));
}

builder& builder::write(const warden::schema::status_category_t& category) {
  return write(static_cast<uint8_t>(category));
}

builder& builder::write(const warden::schema::entity_ref_t& entity) {
  write(entity.kind);
  return write(std::span(entity.hash.data(), entity.hash.size()));
}
