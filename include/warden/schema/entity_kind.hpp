#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: entity kind.
// Entities whose status is administered: user profiles and organizations.
namespace warden::schema {

enum class entity_kind_t : uint8_t { users = 0, organizations = 1 };

inline constexpr auto kEntityKindMappings = std::array{
    std::pair<std::string_view, entity_kind_t>{"users", entity_kind_t::users},
    std::pair<std::string_view, entity_kind_t>{"organizations",
                                               entity_kind_t::organizations},
};

inline constexpr auto kAllEntityKinds =
    std::array{entity_kind_t::users, entity_kind_t::organizations};

template <>
inline std::optional<entity_kind_t> try_from_string<entity_kind_t>(
    const std::string_view value) {
  return from_string(value, kEntityKindMappings);
}

inline constexpr std::string_view to_string(const entity_kind_t value) {
  return to_string(value, kEntityKindMappings).value_or("unknown");
}

/// Identity of an administered entity: its kind and the hash of its original
/// record.
struct entity_ref_t final {
  entity_kind_t kind{};
  hash32_t hash{};

  bool operator==(const entity_ref_t&) const = default;
};

}  // namespace warden::schema
