#pragma once
#include <warden/schema/entity_kind.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/status_category.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace warden::schema::key {

struct builder final {
  warden::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const entity_kind_t& kind);
  builder& write(const status_category_t& category);
  builder& write(const entity_ref_t& entity);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace warden::schema::key
