#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/status_type.hpp>

#include <optional>
#include <string>

// Schema type: status.
// Payload of one status revision. `suspended_until` is only meaningful for
// temporary suspensions.
namespace warden::schema {

template <uint16_t Version>
struct status;

template <>
struct status<1> final {
  uint16_t version{1};
  status_type_t status_type{status_type_t::pending};
  std::optional<std::string> reason;
  std::optional<timestamp_milliseconds_t> suspended_until;

  bool operator==(const status&) const = default;
};

using status_t = status<1>;

}  // namespace warden::schema
