#include <warden/common/critical.hpp>
#include <warden/crypto/keypair.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr auto kSeedSize = std::size_t{32};

}  // namespace

keypair::keypair(evp_pkey_ptr key) : key_{std::move(key)} {
  auto size = public_key_.size();
  if (EVP_PKEY_get_raw_public_key(key_.get(), public_key_.data(), &size) != 1 ||
      size != public_key_.size()) {
    warden::common::critical("failed to extract ed25519 public key");
  }
}

keypair keypair::generate() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    warden::common::critical("ed25519 key generation is unavailable");
  }
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    warden::common::critical("ed25519 key generation failed");
  }
  return keypair{evp_pkey_ptr{raw, EVP_PKEY_free}};
}

std::optional<keypair> keypair::from_private_key(
    const warden::schema::bytes_view_t& seed) {
  if (seed.size() != kSeedSize) {
    spdlog::warn("ed25519 private key must be {} bytes, got {}", kSeedSize,
                 seed.size());
    return std::nullopt;
  }
  auto key = evp_pkey_ptr{EVP_PKEY_new_raw_private_key(
                              EVP_PKEY_ED25519, nullptr, seed.data(),
                              seed.size()),
                          EVP_PKEY_free};
  if (!key) {
    return std::nullopt;
  }
  return keypair{std::move(key)};
}

warden::schema::bytes_t keypair::private_key() const {
  auto seed = warden::schema::bytes_t(kSeedSize);
  auto size = seed.size();
  if (EVP_PKEY_get_raw_private_key(key_.get(), seed.data(), &size) != 1 ||
      size != kSeedSize) {
    warden::common::critical("failed to extract ed25519 private key");
  }
  return seed;
}

warden::schema::signature_t keypair::sign(
    const warden::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
          1) {
    warden::common::critical("failed to initialise ed25519 signer");
  }
  auto signature = warden::schema::signature_t{};
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    warden::common::critical("ed25519 signing failed");
  }
  return signature;
}

}  // namespace warden::crypto
