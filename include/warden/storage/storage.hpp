#pragma once
#include <warden/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

/// Puts and deletes committed together. A record append and its chain
/// bookkeeping always land in one batch.
struct write_batch_t final {
  std::vector<key_value_entry_t> puts;
  std::vector<warden::schema::bytes_t> deletes;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value) const;

  /// True when key is present.
  bool exists(const warden::schema::bytes_view_t& key) const;

  /// Remove key; missing keys are not an error.
  void erase(const warden::schema::bytes_view_t& key) const;

  /// Apply puts and deletes atomically.
  void write(const write_batch_t& batch) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const warden::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace warden::storage
