#pragma once

#include <warden/schema/entity_kind.hpp>
#include <warden/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::schema::entity_ref_t make_user(const uint8_t seed) {
  return warden::schema::entity_ref_t{warden::schema::entity_kind_t::users,
                                      make_hash(seed)};
}

inline warden::schema::entity_ref_t make_organization(const uint8_t seed) {
  return warden::schema::entity_ref_t{
      warden::schema::entity_kind_t::organizations, make_hash(seed)};
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Test clock; every engine built from one shares the same time.
class manual_clock final {
 public:
  explicit manual_clock(const warden::schema::timestamp_milliseconds_t start)
      : now_{std::make_shared<warden::schema::timestamp_milliseconds_t>(
            start)} {}

  warden::schema::timestamp_milliseconds_t now() const { return *now_; }
  void advance(const warden::schema::duration_milliseconds_t by) {
    *now_ += by;
  }
  void advance_days(const uint64_t days) {
    advance(days * warden::schema::kMillisecondsPerDay);
  }

  auto function() const {
    return [now = now_] { return *now; };
  }

 private:
  std::shared_ptr<warden::schema::timestamp_milliseconds_t> now_;
};

}  // namespace warden::testing
