#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: status type.
// Lifecycle enum attached to users and organizations. Names follow the
// persisted wire strings of the bulletin board.
namespace warden::schema {

enum class status_type_t : uint8_t {
  pending = 0,
  accepted = 1,
  rejected = 2,
  suspended_temporarily = 3,
  suspended_indefinitely = 4
};

inline constexpr auto kStatusTypeMappings = std::array{
    std::pair<std::string_view, status_type_t>{"pending",
                                               status_type_t::pending},
    std::pair<std::string_view, status_type_t>{"accepted",
                                               status_type_t::accepted},
    std::pair<std::string_view, status_type_t>{"rejected",
                                               status_type_t::rejected},
    std::pair<std::string_view, status_type_t>{
        "suspended temporarily", status_type_t::suspended_temporarily},
    std::pair<std::string_view, status_type_t>{
        "suspended indefinitely", status_type_t::suspended_indefinitely},
};

template <>
inline std::optional<status_type_t> try_from_string<status_type_t>(
    const std::string_view value) {
  return from_string(value, kStatusTypeMappings);
}

inline constexpr std::string_view to_string(const status_type_t value) {
  return to_string(value, kStatusTypeMappings).value_or("unknown");
}

inline constexpr bool requires_reason(const status_type_t value) {
  return value == status_type_t::rejected ||
         value == status_type_t::suspended_temporarily ||
         value == status_type_t::suspended_indefinitely;
}

}  // namespace warden::schema
