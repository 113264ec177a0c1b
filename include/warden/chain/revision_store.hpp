#pragma once

#include <warden/blake3/hash.hpp>
#include <warden/common/critical.hpp>
#include <warden/crypto/keypair.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/schema/chain_record.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/keys.hpp>
#include <warden/schema/operation_result.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Revision chains: append-only, hash-linked, author-signed histories. One
// store instance serves one chain namespace (status or administrator).
namespace warden::chain {

using storage_t =
    warden::storage::storage<warden::storage::rocksdb_storage_tag>;
using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

/// History order: depth, then creation time, then hash.
template <typename Payload>
bool history_before(const warden::schema::chain_entry<Payload>& lhs,
                    const warden::schema::chain_entry<Payload>& rhs) {
  if (lhs.record.depth != rhs.record.depth) {
    return lhs.record.depth < rhs.record.depth;
  }
  if (lhs.record.created_at != rhs.record.created_at) {
    return lhs.record.created_at < rhs.record.created_at;
  }
  return lhs.hash < rhs.hash;
}

/// Tip order among leaves: creation time, then hash.
template <typename Payload>
bool tip_before(const warden::schema::chain_entry<Payload>& lhs,
                const warden::schema::chain_entry<Payload>& rhs) {
  if (lhs.record.created_at != rhs.record.created_at) {
    return lhs.record.created_at < rhs.record.created_at;
  }
  return lhs.hash < rhs.hash;
}

template <typename Payload>
class revision_store final {
 public:
  using record_t = warden::schema::chain_record<Payload>;
  using entry_t = warden::schema::chain_entry<Payload>;

  revision_store(
      storage_t& storage,
      encoder_t& encoder,
      std::string_view chain,
      const warden::crypto::keypair& signer,
      warden::crypto::signature_verifier_t verifier =
          warden::crypto::verify_signature)
      : storage_{storage},
        encoder_{encoder},
        chain_{chain},
        signer_{signer},
        verifier_{std::move(verifier)} {}

  /// Start a new chain about `subject`, signed by the local agent.
  warden::schema::operation_result<warden::schema::hash32_t> create(
      const warden::schema::hash32_t& subject,
      const Payload& payload,
      warden::schema::timestamp_milliseconds_t now);

  /// Extend a chain. `previous` must be the current tip of `original`.
  warden::schema::operation_result<warden::schema::hash32_t> append(
      const warden::schema::hash32_t& original,
      const warden::schema::hash32_t& previous,
      const Payload& payload,
      warden::schema::timestamp_milliseconds_t now);

  /// Accept a record authored elsewhere. No tip check; this is how forks
  /// enter a replica. Known records are accepted without change.
  warden::schema::operation_result<warden::schema::hash32_t> ingest(
      const record_t& record);

  warden::schema::operation_result<entry_t> get(
      const warden::schema::hash32_t& hash) const;
  warden::schema::operation_result<entry_t> resolve_latest(
      const warden::schema::hash32_t& original) const;
  warden::schema::operation_result<std::vector<entry_t>> resolve_history(
      const warden::schema::hash32_t& original) const;
  warden::schema::operation_result<std::vector<warden::schema::fork_t>>
  find_forks(const warden::schema::hash32_t& original) const;
  warden::schema::operation_result<warden::schema::hash32_t> find_original(
      const warden::schema::hash32_t& hash) const;

  std::vector<warden::schema::hash32_t> list_roots() const;

  /// Every record of every chain, parents before children.
  std::vector<record_t> export_records() const;

  warden::schema::hash32_t compute_hash(const record_t& record) const;

 private:
  std::optional<record_t> load(const warden::schema::hash32_t& hash) const;
  std::vector<entry_t> load_members(
      const warden::schema::hash32_t& original) const;
  void persist(const entry_t& entry);

  template <typename T>
  warden::schema::operation_result<T> fail(warden::schema::error_code_t code,
                                           std::string log) const {
    spdlog::warn("[{}] {}: {}", chain_, warden::schema::to_string(code), log);
    return warden::schema::make_failure<T>(code, std::move(log),
                                           warden::schema::kChainCodespace);
  }

  storage_t& storage_;
  encoder_t& encoder_;
  std::string chain_;
  const warden::crypto::keypair& signer_;
  warden::crypto::signature_verifier_t verifier_;
};

template <typename Payload>
warden::schema::hash32_t revision_store<Payload>::compute_hash(
    const record_t& record) const {
  // Signature excluded; a root hashes its own links as zero.
  auto original = record.is_root() ? warden::schema::make_zero_hash()
                                   : record.original_hash;
  auto previous = record.is_root() ? warden::schema::make_zero_hash()
                                   : record.previous_hash;
  auto preimage = warden::schema::bytes_t{};
  encoder_.encode(record.version, preimage);
  encoder_.encode(record.subject, preimage);
  encoder_.encode(original, preimage);
  encoder_.encode(previous, preimage);
  encoder_.encode(record.depth, preimage);
  encoder_.encode(record.author, preimage);
  encoder_.encode(record.created_at, preimage);
  encoder_.encode(record.payload, preimage);
  return warden::blake3::hash(warden::schema::bytes_view_t{preimage});
}

template <typename Payload>
std::optional<typename revision_store<Payload>::record_t>
revision_store<Payload>::load(const warden::schema::hash32_t& hash) const {
  auto key = warden::schema::key::make_record_key(chain_, hash);
  return storage_.template get<record_t>(encoder_,
                                         warden::schema::bytes_view_t{key});
}

template <typename Payload>
std::vector<typename revision_store<Payload>::entry_t>
revision_store<Payload>::load_members(
    const warden::schema::hash32_t& original) const {
  auto prefix = warden::schema::key::make_member_prefix(chain_, original);
  auto members = std::vector<entry_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(warden::schema::bytes_view_t{prefix})) {
    auto hash = warden::schema::key::hash_suffix(key);
    auto record = load(hash);
    if (!record) {
      warden::common::critical("chain member without record");
    }
    members.push_back(entry_t{hash, std::move(*record)});
  }
  return members;
}

template <typename Payload>
void revision_store<Payload>::persist(const entry_t& entry) {
  namespace key = warden::schema::key;
  const auto& record = entry.record;

  auto members = load_members(record.original_hash);
  members.push_back(entry);

  auto parents = std::set<warden::schema::hash32_t>{};
  for (const auto& member : members) {
    if (!member.record.is_root()) {
      parents.insert(member.record.previous_hash);
    }
  }
  auto tip = std::optional<entry_t>{};
  for (const auto& member : members) {
    if (parents.contains(member.hash)) {
      continue;
    }
    if (!tip || tip_before(*tip, member)) {
      tip = member;
    }
  }

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_record_key(chain_, entry.hash),
                          encoder_.encode(record));
  batch.puts.emplace_back(
      key::make_member_key(chain_, record.original_hash, entry.hash),
      warden::schema::bytes_t{});
  if (record.is_root()) {
    batch.puts.emplace_back(key::make_root_key(chain_, entry.hash),
                            warden::schema::bytes_t{});
  } else {
    batch.puts.emplace_back(
        key::make_successor_key(chain_, record.previous_hash, entry.hash),
        warden::schema::bytes_t{});
  }
  batch.puts.emplace_back(key::make_tip_key(chain_, record.original_hash),
                          encoder_.encode(tip->hash));
  storage_.write(batch);

  spdlog::debug("[{}] stored {} at depth {}; tip {}", chain_,
                warden::schema::to_hex(entry.hash), record.depth,
                warden::schema::to_hex(tip->hash));
}

template <typename Payload>
warden::schema::operation_result<warden::schema::hash32_t>
revision_store<Payload>::create(const warden::schema::hash32_t& subject,
                                const Payload& payload,
                                warden::schema::timestamp_milliseconds_t now) {
  auto record = record_t{};
  record.subject = subject;
  record.author = signer_.public_key();
  record.created_at = now;
  record.payload = payload;

  auto hash = compute_hash(record);
  if (load(hash)) {
    return fail<warden::schema::hash32_t>(
        warden::schema::error_code_t::invalid_record,
        "chain root already exists");
  }
  record.original_hash = hash;
  record.previous_hash = hash;
  record.signature = signer_.sign(warden::schema::bytes_view_t{hash});

  persist(entry_t{hash, record});
  return warden::schema::make_success(hash);
}

template <typename Payload>
warden::schema::operation_result<warden::schema::hash32_t>
revision_store<Payload>::append(const warden::schema::hash32_t& original,
                                const warden::schema::hash32_t& previous,
                                const Payload& payload,
                                warden::schema::timestamp_milliseconds_t now) {
  auto root = load(original);
  if (!root || !root->is_root()) {
    return fail<warden::schema::hash32_t>(
        warden::schema::error_code_t::not_found, "unknown chain root");
  }
  auto parent = load(previous);
  if (!parent) {
    return fail<warden::schema::hash32_t>(
        warden::schema::error_code_t::not_found, "unknown previous record");
  }
  if (parent->original_hash != original) {
    return fail<warden::schema::hash32_t>(
        warden::schema::error_code_t::not_found,
        "previous record belongs to a different chain");
  }

  auto tip_key = warden::schema::key::make_tip_key(chain_, original);
  auto tip = storage_.template get<warden::schema::hash32_t>(
      encoder_, warden::schema::bytes_view_t{tip_key});
  if (!tip) {
    warden::common::critical("chain root without tip");
  }
  if (*tip != previous) {
    return fail<warden::schema::hash32_t>(
        warden::schema::error_code_t::stale_reference,
        "previous hash is not the chain tip " + warden::schema::to_hex(*tip));
  }

  auto record = record_t{};
  record.subject = root->subject;
  record.original_hash = original;
  record.previous_hash = previous;
  record.depth = parent->depth + 1;
  record.author = signer_.public_key();
  record.created_at = now;
  record.payload = payload;

  auto hash = compute_hash(record);
  record.signature = signer_.sign(warden::schema::bytes_view_t{hash});

  persist(entry_t{hash, record});
  return warden::schema::make_success(hash);
}

template <typename Payload>
warden::schema::operation_result<warden::schema::hash32_t>
revision_store<Payload>::ingest(const record_t& record) {
  auto hash = compute_hash(record);
  if (load(hash)) {
    return warden::schema::make_success(hash);
  }

  if (!verifier_(warden::schema::bytes_view_t{hash}, record.author,
                 record.signature)) {
    return fail<warden::schema::hash32_t>(
        warden::schema::error_code_t::invalid_signature,
        "signature does not match record " + warden::schema::to_hex(hash));
  }

  if (record.is_root()) {
    if (record.original_hash != hash || record.previous_hash != hash) {
      return fail<warden::schema::hash32_t>(
          warden::schema::error_code_t::invalid_record,
          "root must reference itself");
    }
  } else {
    auto parent = load(record.previous_hash);
    if (!parent) {
      return fail<warden::schema::hash32_t>(
          warden::schema::error_code_t::not_found,
          "unknown predecessor " + warden::schema::to_hex(record.previous_hash));
    }
    if (parent->original_hash != record.original_hash ||
        parent->subject != record.subject) {
      return fail<warden::schema::hash32_t>(
          warden::schema::error_code_t::invalid_record,
          "predecessor belongs to a different chain");
    }
    if (record.depth != parent->depth + 1) {
      return fail<warden::schema::hash32_t>(
          warden::schema::error_code_t::invalid_record,
          "depth does not follow predecessor");
    }
  }

  persist(entry_t{hash, record});
  spdlog::info("[{}] ingested {}", chain_, warden::schema::to_hex(hash));
  return warden::schema::make_success(hash);
}

template <typename Payload>
warden::schema::operation_result<typename revision_store<Payload>::entry_t>
revision_store<Payload>::get(const warden::schema::hash32_t& hash) const {
  auto record = load(hash);
  if (!record) {
    return warden::schema::make_failure<entry_t>(
        warden::schema::error_code_t::not_found, "unknown record",
        warden::schema::kChainCodespace);
  }
  return warden::schema::make_success(entry_t{hash, std::move(*record)});
}

template <typename Payload>
warden::schema::operation_result<typename revision_store<Payload>::entry_t>
revision_store<Payload>::resolve_latest(
    const warden::schema::hash32_t& original) const {
  auto root_key = warden::schema::key::make_root_key(chain_, original);
  if (!storage_.exists(warden::schema::bytes_view_t{root_key})) {
    return warden::schema::make_failure<entry_t>(
        warden::schema::error_code_t::not_found, "unknown chain root",
        warden::schema::kChainCodespace);
  }
  auto tip_key = warden::schema::key::make_tip_key(chain_, original);
  auto tip = storage_.template get<warden::schema::hash32_t>(
      encoder_, warden::schema::bytes_view_t{tip_key});
  if (!tip) {
    warden::common::critical("chain root without tip");
  }
  auto record = load(*tip);
  if (!record) {
    warden::common::critical("chain tip without record");
  }
  return warden::schema::make_success(entry_t{*tip, std::move(*record)});
}

template <typename Payload>
warden::schema::operation_result<
    std::vector<typename revision_store<Payload>::entry_t>>
revision_store<Payload>::resolve_history(
    const warden::schema::hash32_t& original) const {
  auto root_key = warden::schema::key::make_root_key(chain_, original);
  if (!storage_.exists(warden::schema::bytes_view_t{root_key})) {
    return warden::schema::make_failure<std::vector<entry_t>>(
        warden::schema::error_code_t::not_found, "unknown chain root",
        warden::schema::kChainCodespace);
  }
  auto history = load_members(original);
  std::sort(std::begin(history), std::end(history), history_before<Payload>);
  return warden::schema::make_success(std::move(history));
}

template <typename Payload>
warden::schema::operation_result<std::vector<warden::schema::fork_t>>
revision_store<Payload>::find_forks(
    const warden::schema::hash32_t& original) const {
  auto history = resolve_history(original);
  if (!history) {
    return warden::schema::forward_failure<std::vector<warden::schema::fork_t>>(
        history);
  }
  auto forks = std::vector<warden::schema::fork_t>{};
  for (const auto& entry : *history.value) {
    auto prefix =
        warden::schema::key::make_successor_prefix(chain_, entry.hash);
    auto successors =
        storage_.list_by_prefix(warden::schema::bytes_view_t{prefix});
    if (successors.size() < 2) {
      continue;
    }
    auto fork = warden::schema::fork_t{};
    fork.previous_hash = entry.hash;
    for (const auto& [key, value] : successors) {
      fork.branches.push_back(warden::schema::key::hash_suffix(key));
    }
    forks.push_back(std::move(fork));
  }
  return warden::schema::make_success(std::move(forks));
}

template <typename Payload>
warden::schema::operation_result<warden::schema::hash32_t>
revision_store<Payload>::find_original(
    const warden::schema::hash32_t& hash) const {
  auto record = load(hash);
  if (!record) {
    return warden::schema::make_failure<warden::schema::hash32_t>(
        warden::schema::error_code_t::not_found, "unknown record",
        warden::schema::kChainCodespace);
  }
  return warden::schema::make_success(record->original_hash);
}

template <typename Payload>
std::vector<warden::schema::hash32_t> revision_store<Payload>::list_roots()
    const {
  auto prefix = warden::schema::key::make_root_prefix(chain_);
  auto roots = std::vector<warden::schema::hash32_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(warden::schema::bytes_view_t{prefix})) {
    roots.push_back(warden::schema::key::hash_suffix(key));
  }
  return roots;
}

template <typename Payload>
std::vector<typename revision_store<Payload>::record_t>
revision_store<Payload>::export_records() const {
  auto records = std::vector<record_t>{};
  for (const auto& root : list_roots()) {
    auto history = resolve_history(root);
    if (!history) {
      warden::common::critical("listed root has no history");
    }
    for (auto& entry : *history.value) {
      records.push_back(std::move(entry.record));
    }
  }
  return records;
}

}  // namespace warden::chain
