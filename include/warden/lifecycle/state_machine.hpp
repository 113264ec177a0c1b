#pragma once

#include <warden/schema/operation_result.hpp>
#include <warden/schema/status.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace warden::lifecycle {

/// A requested status change, as submitted by an administrator.
struct transition_request final {
  warden::schema::status_type_t status_type{
      warden::schema::status_type_t::pending};
  std::optional<std::string> reason;
  std::optional<warden::schema::timestamp_milliseconds_t> suspended_until;
};

/// Validate `request` against the current status type and produce the status
/// to record. Every type may follow every other; only the payload is checked.
warden::schema::operation_result<warden::schema::status_t> transition(
    warden::schema::status_type_t current,
    const transition_request& request,
    warden::schema::timestamp_milliseconds_t now);

/// True for a temporary suspension whose deadline has passed.
bool is_expired(const warden::schema::status_t& status,
                warden::schema::timestamp_milliseconds_t now);

warden::schema::status_t make_pending();
warden::schema::status_t make_accepted();

/// Indefinite when `days` is empty, otherwise until `now + days`.
transition_request make_suspension(std::string reason,
                                   std::optional<uint32_t> days,
                                   warden::schema::timestamp_milliseconds_t now);

}  // namespace warden::lifecycle
