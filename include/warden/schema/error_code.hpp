#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace warden::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  stale_reference = 1,
  unauthorized = 2,
  invalid_transition = 3,
  not_found = 4,
  already_has_status = 5,
  already_administrator = 6,
  last_administrator = 7,
  invalid_signature = 8,
  invalid_record = 9,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"ok", error_code_t::ok},
    std::pair<std::string_view, error_code_t>{"stale_reference",
                                              error_code_t::stale_reference},
    std::pair<std::string_view, error_code_t>{"unauthorized",
                                              error_code_t::unauthorized},
    std::pair<std::string_view, error_code_t>{
        "invalid_transition", error_code_t::invalid_transition},
    std::pair<std::string_view, error_code_t>{"not_found",
                                              error_code_t::not_found},
    std::pair<std::string_view, error_code_t>{
        "already_has_status", error_code_t::already_has_status},
    std::pair<std::string_view, error_code_t>{
        "already_administrator", error_code_t::already_administrator},
    std::pair<std::string_view, error_code_t>{
        "last_administrator", error_code_t::last_administrator},
    std::pair<std::string_view, error_code_t>{
        "invalid_signature", error_code_t::invalid_signature},
    std::pair<std::string_view, error_code_t>{"invalid_record",
                                              error_code_t::invalid_record},
};

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

inline constexpr auto kChainCodespace = std::string_view{"warden.chain"};
inline constexpr auto kStatusCodespace = std::string_view{"warden.status"};
inline constexpr auto kAdminCodespace = std::string_view{"warden.admin"};

}  // namespace warden::schema
