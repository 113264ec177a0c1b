#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/status_type.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: status category.
// Derived index bucket. Both suspension flavours share one bucket.
namespace warden::schema {

enum class status_category_t : uint8_t {
  pending = 0,
  accepted = 1,
  rejected = 2,
  suspended = 3
};

inline constexpr auto kStatusCategoryMappings = std::array{
    std::pair<std::string_view, status_category_t>{"pending",
                                                   status_category_t::pending},
    std::pair<std::string_view, status_category_t>{
        "accepted", status_category_t::accepted},
    std::pair<std::string_view, status_category_t>{
        "rejected", status_category_t::rejected},
    std::pair<std::string_view, status_category_t>{
        "suspended", status_category_t::suspended},
};

inline constexpr auto kAllStatusCategories =
    std::array{status_category_t::pending, status_category_t::accepted,
               status_category_t::rejected, status_category_t::suspended};

template <>
inline std::optional<status_category_t> try_from_string<status_category_t>(
    const std::string_view value) {
  return from_string(value, kStatusCategoryMappings);
}

inline constexpr std::string_view to_string(const status_category_t value) {
  return to_string(value, kStatusCategoryMappings).value_or("unknown");
}

inline constexpr status_category_t category_for(const status_type_t value) {
  switch (value) {
    case status_type_t::pending:
      return status_category_t::pending;
    case status_type_t::accepted:
      return status_category_t::accepted;
    case status_type_t::rejected:
      return status_category_t::rejected;
    case status_type_t::suspended_temporarily:
    case status_type_t::suspended_indefinitely:
      return status_category_t::suspended;
  }
  return status_category_t::pending;
}

}  // namespace warden::schema
