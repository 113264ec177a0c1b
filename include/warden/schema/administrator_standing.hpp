#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: administrator standing.
// `active` is the accepted-equivalent standing, `removed` the explicit
// revocation marker appended by remove_administrator.
namespace warden::schema {

enum class administrator_standing_t : uint8_t { active = 0, removed = 1 };

inline constexpr auto kAdministratorStandingMappings = std::array{
    std::pair<std::string_view, administrator_standing_t>{
        "active", administrator_standing_t::active},
    std::pair<std::string_view, administrator_standing_t>{
        "removed", administrator_standing_t::removed},
};

inline constexpr std::string_view to_string(
    const administrator_standing_t value) {
  return to_string(value, kAdministratorStandingMappings).value_or("unknown");
}

}  // namespace warden::schema
